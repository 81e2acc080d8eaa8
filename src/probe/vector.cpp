#include <raccoon/probe/vector.h>
#include <iomanip>
#include <sstream>

namespace raccoon {
namespace probe {

DhSecret DhSecret::from_uint64(uint64_t value) {
    std::vector<uint8_t> bytes;
    while (value != 0) {
        bytes.insert(bytes.begin(), static_cast<uint8_t>(value & 0xFF));
        value >>= 8;
    }
    if (bytes.empty()) {
        bytes.push_back(0);
    }
    return DhSecret(std::move(bytes));
}

std::string DhSecret::to_hex() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t byte : bytes_) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

bool DirectRaccoonVector::operator==(const DirectRaccoonVector& other) const noexcept {
    return workflow_variant == other.workflow_variant
        && protocol_version == other.protocol_version
        && cipher_suite == other.cipher_suite
        && pms_with_null_byte == other.pms_with_null_byte;
}

bool DirectRaccoonVector::operator!=(const DirectRaccoonVector& other) const noexcept {
    return !(*this == other);
}

std::string DirectRaccoonVector::to_string() const {
    std::ostringstream oss;
    oss << "WorkflowType=" << raccoon::to_string(workflow_variant)
        << ", version=" << raccoon::to_string(protocol_version)
        << ", suite=" << raccoon::to_string(cipher_suite)
        << ", pmsWithNullByte=" << (pms_with_null_byte ? "true" : "false");
    return oss.str();
}

} // namespace probe
} // namespace raccoon
