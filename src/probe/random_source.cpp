#include <raccoon/probe/random_source.h>
#include <algorithm>
#include <limits>

#include <openssl/rand.h>
#include <openssl/err.h>

namespace raccoon {
namespace probe {

Result<uint64_t> RandomSource::uniform(uint64_t bound) {
    if (bound == 0) {
        return make_error<uint64_t>(RaccoonError::INVALID_PARAMETER);
    }

    // Values below threshold would bias the modulo
    const uint64_t threshold = (0 - bound) % bound;
    while (true) {
        auto bytes = generate_bytes(sizeof(uint64_t));
        if (!bytes) {
            return make_error<uint64_t>(bytes.error());
        }

        uint64_t draw = 0;
        for (uint8_t byte : *bytes) {
            draw = (draw << 8) | byte;
        }
        if (draw >= threshold) {
            return make_result(draw % bound);
        }
    }
}

Result<DhSecret> RandomSource::next_secret(size_t length) {
    if (length == 0) {
        return make_error<DhSecret>(RaccoonError::INVALID_PARAMETER);
    }

    auto bytes = generate_bytes(length);
    if (!bytes) {
        return make_error<DhSecret>(bytes.error());
    }

    std::vector<uint8_t> magnitude = std::move(bytes).value();
    magnitude[0] &= 0x7F;
    if (std::all_of(magnitude.begin(), magnitude.end(), [](uint8_t b) { return b == 0; })) {
        magnitude.back() = 1;
    }
    return make_result(DhSecret(std::move(magnitude)));
}

Result<std::vector<uint8_t>> OpenSSLRandomSource::generate_bytes(size_t length) {
    if (length > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return make_error<std::vector<uint8_t>>(RaccoonError::INVALID_PARAMETER);
    }

    if (RAND_status() != 1 && RAND_poll() != 1) {
        return make_error<std::vector<uint8_t>>(RaccoonError::RANDOM_GENERATION_FAILED);
    }

    std::vector<uint8_t> bytes(length);
    if (length > 0 && RAND_bytes(bytes.data(), static_cast<int>(length)) != 1) {
        ERR_clear_error();
        return make_error<std::vector<uint8_t>>(RaccoonError::RANDOM_GENERATION_FAILED);
    }
    return make_result(std::move(bytes));
}

Result<std::vector<uint8_t>> SeededRandomSource::generate_bytes(size_t length) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<uint8_t> bytes;
    bytes.reserve(length);
    while (bytes.size() < length) {
        uint64_t word = engine_();
        for (size_t i = 0; i < sizeof(word) && bytes.size() < length; ++i) {
            bytes.push_back(static_cast<uint8_t>(word >> (8 * i)));
        }
    }
    return make_result(std::move(bytes));
}

Result<std::shared_ptr<RandomSource>> create_random_source(const std::string& name) {
    if (name == "openssl") {
        return make_result(std::shared_ptr<RandomSource>(std::make_shared<OpenSSLRandomSource>()));
    }
    if (name == "botan") {
#ifdef RACCOON_HAVE_BOTAN
        try {
            return make_result(std::shared_ptr<RandomSource>(std::make_shared<BotanRandomSource>()));
        } catch (const RaccoonException& e) {
            return make_error<std::shared_ptr<RandomSource>>(e.raccoon_error());
        }
#else
        return make_error<std::shared_ptr<RandomSource>>(RaccoonError::FEATURE_NOT_ENABLED);
#endif
    }
    return make_error<std::shared_ptr<RandomSource>>(RaccoonError::INVALID_PARAMETER);
}

std::shared_ptr<RandomSource> default_random_source() {
    return std::make_shared<OpenSSLRandomSource>();
}

} // namespace probe
} // namespace raccoon
