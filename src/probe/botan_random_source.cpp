#include <raccoon/probe/random_source.h>

#ifdef RACCOON_HAVE_BOTAN

#include <botan/auto_rng.h>
#include <botan/system_rng.h>
#include <botan/exceptn.h>

namespace raccoon {
namespace probe {

class BotanRandomSource::Impl {
public:
    std::unique_ptr<Botan::RandomNumberGenerator> rng_;
    std::mutex rng_mutex_;
};

BotanRandomSource::BotanRandomSource()
    : pimpl_(std::make_unique<Impl>()) {
    try {
        pimpl_->rng_ = std::make_unique<Botan::AutoSeeded_RNG>();
    } catch (const Botan::Exception&) {
        try {
            pimpl_->rng_ = std::make_unique<Botan::System_RNG>();
        } catch (const Botan::Exception& e) {
            throw RaccoonException(RaccoonError::CRYPTO_PROVIDER_ERROR, e.what());
        }
    }
}

BotanRandomSource::~BotanRandomSource() = default;

Result<std::vector<uint8_t>> BotanRandomSource::generate_bytes(size_t length) {
    std::vector<uint8_t> bytes(length);
    if (length == 0) {
        return make_result(std::move(bytes));
    }

    std::lock_guard<std::mutex> lock(pimpl_->rng_mutex_);
    try {
        pimpl_->rng_->randomize(bytes.data(), bytes.size());
    } catch (const Botan::Exception&) {
        return make_error<std::vector<uint8_t>>(RaccoonError::RANDOM_GENERATION_FAILED);
    }
    return make_result(std::move(bytes));
}

} // namespace probe
} // namespace raccoon

#endif // RACCOON_HAVE_BOTAN
