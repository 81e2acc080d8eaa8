/**
 * @file fingerprint.h
 * @brief Behavioral fingerprint of a server response and the equality oracle
 *
 * A Fingerprint summarizes what the server did after one crafted handshake.
 * The probe core treats it as an opaque value and only ever hands pairs of
 * fingerprints to a FingerprintEqualityOracle.
 */

#ifndef RACCOON_PROBE_FINGERPRINT_H
#define RACCOON_PROBE_FINGERPRINT_H

#include <raccoon/config.h>
#include <raccoon/types.h>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace raccoon {
namespace probe {

// State of the transport after the server stopped answering
enum class SocketState : uint8_t {
    UNKNOWN = 0,
    UP = 1,
    DATA_AVAILABLE = 2,
    CLOSED = 3,
    TIMEOUT = 4,
    SOCKET_EXCEPTION = 5
};

// TLS record content types as seen on the wire
enum class RecordContentType : uint8_t {
    CHANGE_CIPHER_SPEC = 20,
    ALERT = 21,
    HANDSHAKE = 22,
    APPLICATION_DATA = 23,
    HEARTBEAT = 24
};

/**
 * One message received from the server. For alerts @c subtype is the alert
 * description, for handshake messages the handshake type.
 */
struct ObservedMessage {
    RecordContentType type{RecordContentType::HANDSHAKE};
    uint8_t subtype{0};
    size_t length{0};

    bool operator==(const ObservedMessage& other) const noexcept;
    bool operator!=(const ObservedMessage& other) const noexcept;
};

class RACCOON_API Fingerprint {
public:
    Fingerprint() = default;
    Fingerprint(std::vector<ObservedMessage> messages,
                size_t record_count,
                SocketState socket_state,
                std::chrono::microseconds response_time = std::chrono::microseconds{0});

    const std::vector<ObservedMessage>& messages() const noexcept { return messages_; }
    size_t record_count() const noexcept { return record_count_; }
    SocketState socket_state() const noexcept { return socket_state_; }
    std::chrono::microseconds response_time() const noexcept { return response_time_; }

    // Exact equality of every observed property, timing included
    bool operator==(const Fingerprint& other) const noexcept;
    bool operator!=(const Fingerprint& other) const noexcept;

    std::string to_string() const;

private:
    std::vector<ObservedMessage> messages_;
    size_t record_count_{0};
    SocketState socket_state_{SocketState::UNKNOWN};
    std::chrono::microseconds response_time_{0};
};

/**
 * Decides whether two fingerprints show the same server behavior.
 * Implementations must be safe to call concurrently.
 */
class RACCOON_API FingerprintEqualityOracle {
public:
    virtual ~FingerprintEqualityOracle() = default;

    virtual EqualityResult compare(const Fingerprint& a, const Fingerprint& b) const = 0;
};

/**
 * Compares the observable structure of two responses: socket state,
 * number and sequence of messages, and record count. Response time is
 * ignored. A fingerprint whose socket state is UNKNOWN cannot be judged and
 * yields INCONCLUSIVE.
 */
class RACCOON_API StructuralEqualityOracle : public FingerprintEqualityOracle {
public:
    // Which property first differed
    enum class Difference : uint8_t {
        NONE = 0,
        SOCKET_STATE = 1,
        MESSAGE_COUNT = 2,
        MESSAGE_CLASS = 3,
        MESSAGE_CONTENT = 4,
        RECORD_COUNT = 5
    };

    struct Config {
        bool compare_record_count = true;
        bool compare_message_length = true;
    };

    StructuralEqualityOracle() = default;
    explicit StructuralEqualityOracle(const Config& config) : config_(config) {}

    EqualityResult compare(const Fingerprint& a, const Fingerprint& b) const override;

    Difference first_difference(const Fingerprint& a, const Fingerprint& b) const;

private:
    Config config_;
};

RACCOON_API std::string to_string(SocketState state);
RACCOON_API std::string to_string(StructuralEqualityOracle::Difference difference);

} // namespace probe
} // namespace raccoon

#endif // RACCOON_PROBE_FINGERPRINT_H
