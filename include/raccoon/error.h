#ifndef RACCOON_ERROR_H
#define RACCOON_ERROR_H

#include <raccoon/config.h>
#include <system_error>
#include <string>
#include <cstdint>

namespace raccoon {

// Scanner error codes
enum class RaccoonError : int {
    SUCCESS = 0,

    // General errors (1-19)
    INVALID_PARAMETER = 1,
    OUT_OF_MEMORY = 2,
    TIMEOUT = 3,
    OPERATION_ABORTED = 4,
    NOT_INITIALIZED = 5,
    OPERATION_NOT_SUPPORTED = 6,
    INTERNAL_ERROR = 7,

    // Handshake execution errors (20-39)
    HANDSHAKE_FAILURE = 20,
    EXECUTION_FAILED = 21,
    FINGERPRINT_UNAVAILABLE = 22,
    UNEXPECTED_MESSAGE = 23,
    PROTOCOL_VERSION_NOT_SUPPORTED = 24,
    CIPHER_SUITE_NOT_SUPPORTED = 25,

    // Network errors (40-59)
    NETWORK_ERROR = 40,
    CONNECTION_REFUSED = 41,
    CONNECTION_RESET = 42,
    CONNECTION_TIMEOUT = 43,
    HOST_UNREACHABLE = 44,

    // Scheduling errors (60-79)
    SCHEDULER_ERROR = 60,
    BATCH_RESULT_MISMATCH = 61,
    TASK_REJECTED = 62,

    // Probe errors (80-99)
    ALREADY_ESCALATED = 80,
    HANDSHAKE_STATE_ALREADY_SET = 81,
    PRECONDITION_FAILED = 82,
    MISSING_COLLABORATOR = 83,

    // Crypto errors (100-119)
    RANDOM_GENERATION_FAILED = 100,
    CRYPTO_PROVIDER_ERROR = 101,

    // Configuration errors (120-139)
    INVALID_CONFIGURATION = 120,
    FEATURE_NOT_ENABLED = 121,

    // Reporting errors (140-159)
    LOG_FILE_ERROR = 140
};

// Error category for scanner errors
class RaccoonErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "raccoon";
    }

    std::string message(int ev) const override;

    static const RaccoonErrorCategory& instance() {
        static RaccoonErrorCategory instance;
        return instance;
    }
};

// Create error code from scanner error
inline std::error_code make_error_code(RaccoonError e) {
    return std::error_code(static_cast<int>(e), RaccoonErrorCategory::instance());
}

// Exception class for scanner errors
class RACCOON_API RaccoonException : public std::system_error {
public:
    explicit RaccoonException(RaccoonError error)
        : std::system_error(make_error_code(error)) {}

    RaccoonException(RaccoonError error, const std::string& what_arg)
        : std::system_error(make_error_code(error), what_arg) {}

    RaccoonException(RaccoonError error, const char* what_arg)
        : std::system_error(make_error_code(error), what_arg) {}

    RaccoonError raccoon_error() const noexcept {
        return static_cast<RaccoonError>(code().value());
    }
};

// Utility functions
RACCOON_API std::string error_message(RaccoonError error);

} // namespace raccoon

// Make RaccoonError compatible with std::error_code
namespace std {
template<>
struct is_error_code_enum<raccoon::RaccoonError> : true_type {};
}

#endif // RACCOON_ERROR_H
