/**
 * @file random_source.h
 * @brief Injectable randomness for secret generation and vector shuffling
 */

#ifndef RACCOON_PROBE_RANDOM_SOURCE_H
#define RACCOON_PROBE_RANDOM_SOURCE_H

#include <raccoon/config.h>
#include <raccoon/result.h>
#include <raccoon/probe/vector.h>
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace raccoon {
namespace probe {

/**
 * Source of random bytes used by the probe.
 *
 * Implementations must be safe to call from several threads. The derived
 * helpers (uniform index, secret) are built on generate_bytes() so every
 * source shuffles and draws secrets the same way.
 */
class RACCOON_API RandomSource {
public:
    virtual ~RandomSource() = default;

    virtual std::string name() const = 0;

    virtual Result<std::vector<uint8_t>> generate_bytes(size_t length) = 0;

    /**
     * Uniformly distributed value in [0, bound). Uses rejection sampling on
     * 64-bit draws, so there is no modulo bias.
     *
     * @param bound exclusive upper limit, must be non-zero
     */
    Result<uint64_t> uniform(uint64_t bound);

    /**
     * Draws a fresh initial DH secret of @p length bytes. The top bit of the
     * first byte is cleared so the secret is a positive magnitude, and the
     * value is never zero.
     */
    Result<DhSecret> next_secret(size_t length);
};

/**
 * Cryptographically secure randomness from OpenSSL's RAND_bytes.
 */
class RACCOON_API OpenSSLRandomSource : public RandomSource {
public:
    std::string name() const override { return "openssl"; }
    Result<std::vector<uint8_t>> generate_bytes(size_t length) override;
};

#ifdef RACCOON_HAVE_BOTAN
/**
 * Randomness from Botan's AutoSeeded_RNG.
 */
class RACCOON_API BotanRandomSource : public RandomSource {
public:
    BotanRandomSource();
    ~BotanRandomSource() override;

    BotanRandomSource(const BotanRandomSource&) = delete;
    BotanRandomSource& operator=(const BotanRandomSource&) = delete;

    std::string name() const override { return "botan"; }
    Result<std::vector<uint8_t>> generate_bytes(size_t length) override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};
#endif // RACCOON_HAVE_BOTAN

/**
 * Deterministic source for reproducible scans and tests. Not suitable for
 * anything that needs unpredictable secrets.
 */
class RACCOON_API SeededRandomSource : public RandomSource {
public:
    explicit SeededRandomSource(uint64_t seed) : engine_(seed) {}

    std::string name() const override { return "seeded"; }
    Result<std::vector<uint8_t>> generate_bytes(size_t length) override;

private:
    std::mutex mutex_;
    std::mt19937_64 engine_;
};

/**
 * Creates a source by name ("openssl", "botan"). "botan" is only available
 * when the library was built with Botan.
 */
RACCOON_API Result<std::shared_ptr<RandomSource>> create_random_source(const std::string& name);

/// The default source (OpenSSL)
RACCOON_API std::shared_ptr<RandomSource> default_random_source();

} // namespace probe
} // namespace raccoon

#endif // RACCOON_PROBE_RANDOM_SOURCE_H
