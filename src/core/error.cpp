#include <raccoon/error.h>
#include <unordered_map>

namespace raccoon {

// Error message mapping
std::string RaccoonErrorCategory::message(int ev) const {
    RaccoonError error = static_cast<RaccoonError>(ev);

    static const std::unordered_map<RaccoonError, std::string> error_messages = {
        // General errors (1-19)
        {RaccoonError::SUCCESS, "Success"},
        {RaccoonError::INVALID_PARAMETER, "Invalid parameter provided"},
        {RaccoonError::OUT_OF_MEMORY, "Memory allocation failed"},
        {RaccoonError::TIMEOUT, "Operation timed out"},
        {RaccoonError::OPERATION_ABORTED, "Operation was aborted"},
        {RaccoonError::NOT_INITIALIZED, "Component not initialized"},
        {RaccoonError::OPERATION_NOT_SUPPORTED, "Operation not supported"},
        {RaccoonError::INTERNAL_ERROR, "Internal implementation error"},

        // Handshake execution errors (20-39)
        {RaccoonError::HANDSHAKE_FAILURE, "Handshake did not complete as planned"},
        {RaccoonError::EXECUTION_FAILED, "Crafted handshake execution failed"},
        {RaccoonError::FINGERPRINT_UNAVAILABLE, "No response fingerprint could be extracted"},
        {RaccoonError::UNEXPECTED_MESSAGE, "Unexpected message received"},
        {RaccoonError::PROTOCOL_VERSION_NOT_SUPPORTED, "Protocol version not supported"},
        {RaccoonError::CIPHER_SUITE_NOT_SUPPORTED, "Cipher suite not supported"},

        // Network errors (40-59)
        {RaccoonError::NETWORK_ERROR, "Network error"},
        {RaccoonError::CONNECTION_REFUSED, "Connection refused"},
        {RaccoonError::CONNECTION_RESET, "Connection reset"},
        {RaccoonError::CONNECTION_TIMEOUT, "Connection timeout"},
        {RaccoonError::HOST_UNREACHABLE, "Host unreachable"},

        // Scheduling errors (60-79)
        {RaccoonError::SCHEDULER_ERROR, "Parallel scheduler error"},
        {RaccoonError::BATCH_RESULT_MISMATCH, "Batch results do not match the submitted requests"},
        {RaccoonError::TASK_REJECTED, "Task rejected by scheduler"},

        // Probe errors (80-99)
        {RaccoonError::ALREADY_ESCALATED, "Cipher suite fingerprint was already escalated"},
        {RaccoonError::HANDSHAKE_STATE_ALREADY_SET, "Baseline handshake state was already recorded"},
        {RaccoonError::PRECONDITION_FAILED, "Probe preconditions not met"},
        {RaccoonError::MISSING_COLLABORATOR, "Required collaborator not configured"},

        // Crypto errors (100-119)
        {RaccoonError::RANDOM_GENERATION_FAILED, "Random number generation failed"},
        {RaccoonError::CRYPTO_PROVIDER_ERROR, "Cryptographic provider error"},

        // Configuration errors (120-139)
        {RaccoonError::INVALID_CONFIGURATION, "Invalid configuration"},
        {RaccoonError::FEATURE_NOT_ENABLED, "Feature not enabled"},

        // Reporting errors (140-159)
        {RaccoonError::LOG_FILE_ERROR, "Log file could not be opened"}
    };

    auto it = error_messages.find(error);
    if (it != error_messages.end()) {
        return it->second;
    }

    return "Unknown raccoon error (" + std::to_string(ev) + ")";
}

// Utility functions
std::string error_message(RaccoonError error) {
    return RaccoonErrorCategory::instance().message(static_cast<int>(error));
}

} // namespace raccoon
