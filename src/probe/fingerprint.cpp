#include <raccoon/probe/fingerprint.h>
#include <sstream>

namespace raccoon {
namespace probe {

bool ObservedMessage::operator==(const ObservedMessage& other) const noexcept {
    return type == other.type && subtype == other.subtype && length == other.length;
}

bool ObservedMessage::operator!=(const ObservedMessage& other) const noexcept {
    return !(*this == other);
}

Fingerprint::Fingerprint(std::vector<ObservedMessage> messages,
                         size_t record_count,
                         SocketState socket_state,
                         std::chrono::microseconds response_time)
    : messages_(std::move(messages))
    , record_count_(record_count)
    , socket_state_(socket_state)
    , response_time_(response_time) {}

bool Fingerprint::operator==(const Fingerprint& other) const noexcept {
    return messages_ == other.messages_
        && record_count_ == other.record_count_
        && socket_state_ == other.socket_state_
        && response_time_ == other.response_time_;
}

bool Fingerprint::operator!=(const Fingerprint& other) const noexcept {
    return !(*this == other);
}

std::string Fingerprint::to_string() const {
    std::ostringstream oss;
    oss << "Fingerprint{messages=[";
    for (size_t i = 0; i < messages_.size(); ++i) {
        if (i > 0) {
            oss << ",";
        }
        oss << static_cast<int>(messages_[i].type) << ":"
            << static_cast<int>(messages_[i].subtype) << "/" << messages_[i].length;
    }
    oss << "], records=" << record_count_
        << ", socket=" << probe::to_string(socket_state_)
        << ", time=" << response_time_.count() << "us}";
    return oss.str();
}

EqualityResult StructuralEqualityOracle::compare(const Fingerprint& a, const Fingerprint& b) const {
    if (a.socket_state() == SocketState::UNKNOWN || b.socket_state() == SocketState::UNKNOWN) {
        return EqualityResult::INCONCLUSIVE;
    }
    return first_difference(a, b) == Difference::NONE ? EqualityResult::EQUAL
                                                      : EqualityResult::UNEQUAL;
}

StructuralEqualityOracle::Difference StructuralEqualityOracle::first_difference(
    const Fingerprint& a, const Fingerprint& b) const {
    if (a.socket_state() != b.socket_state()) {
        return Difference::SOCKET_STATE;
    }

    const auto& lhs = a.messages();
    const auto& rhs = b.messages();
    if (lhs.size() != rhs.size()) {
        return Difference::MESSAGE_COUNT;
    }

    for (size_t i = 0; i < lhs.size(); ++i) {
        if (lhs[i].type != rhs[i].type) {
            return Difference::MESSAGE_CLASS;
        }
        if (lhs[i].subtype != rhs[i].subtype) {
            return Difference::MESSAGE_CONTENT;
        }
        if (config_.compare_message_length && lhs[i].length != rhs[i].length) {
            return Difference::MESSAGE_CONTENT;
        }
    }

    if (config_.compare_record_count && a.record_count() != b.record_count()) {
        return Difference::RECORD_COUNT;
    }

    return Difference::NONE;
}

std::string to_string(SocketState state) {
    switch (state) {
        case SocketState::UNKNOWN: return "UNKNOWN";
        case SocketState::UP: return "UP";
        case SocketState::DATA_AVAILABLE: return "DATA_AVAILABLE";
        case SocketState::CLOSED: return "CLOSED";
        case SocketState::TIMEOUT: return "TIMEOUT";
        case SocketState::SOCKET_EXCEPTION: return "SOCKET_EXCEPTION";
        default: return "UNKNOWN_SOCKET_STATE(" + std::to_string(static_cast<int>(state)) + ")";
    }
}

std::string to_string(StructuralEqualityOracle::Difference difference) {
    using Difference = StructuralEqualityOracle::Difference;
    switch (difference) {
        case Difference::NONE: return "NONE";
        case Difference::SOCKET_STATE: return "SOCKET_STATE";
        case Difference::MESSAGE_COUNT: return "MESSAGE_COUNT";
        case Difference::MESSAGE_CLASS: return "MESSAGE_CLASS";
        case Difference::MESSAGE_CONTENT: return "MESSAGE_CONTENT";
        case Difference::RECORD_COUNT: return "RECORD_COUNT";
        default: return "UNKNOWN_DIFFERENCE";
    }
}

} // namespace probe
} // namespace raccoon
