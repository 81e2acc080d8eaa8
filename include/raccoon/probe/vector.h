#ifndef RACCOON_PROBE_VECTOR_H
#define RACCOON_PROBE_VECTOR_H

#include <raccoon/config.h>
#include <raccoon/types.h>
#include <raccoon/probe/fingerprint.h>
#include <cstdint>
#include <string>
#include <vector>

namespace raccoon {
namespace probe {

/**
 * Initial client DH secret of one combination, as big-endian magnitude
 * bytes. The workflow generator searches upward from this value for a
 * secret whose premaster secret has (or lacks) a leading zero byte.
 */
class RACCOON_API DhSecret {
public:
    DhSecret() = default;
    explicit DhSecret(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}

    static DhSecret from_uint64(uint64_t value);

    const std::vector<uint8_t>& bytes() const noexcept { return bytes_; }
    bool empty() const noexcept { return bytes_.empty(); }
    size_t size() const noexcept { return bytes_.size(); }

    bool operator==(const DhSecret& other) const noexcept { return bytes_ == other.bytes_; }
    bool operator!=(const DhSecret& other) const noexcept { return bytes_ != other.bytes_; }

    std::string to_hex() const;

private:
    std::vector<uint8_t> bytes_;
};

/**
 * One crafted handshake shape. Vectors with equal fields are
 * interchangeable; each execution of one is independent.
 */
struct RACCOON_API DirectRaccoonVector {
    WorkflowVariant workflow_variant{WorkflowVariant::CKE};
    ProtocolVersion protocol_version{ProtocolVersion::TLS12};
    CipherSuite cipher_suite{CipherSuite::TLS_DHE_RSA_WITH_AES_128_CBC_SHA};
    bool pms_with_null_byte{false};

    DirectRaccoonVector() = default;
    DirectRaccoonVector(WorkflowVariant variant, ProtocolVersion version,
                        CipherSuite suite, bool with_null_byte)
        : workflow_variant(variant)
        , protocol_version(version)
        , cipher_suite(suite)
        , pms_with_null_byte(with_null_byte) {}

    bool operator==(const DirectRaccoonVector& other) const noexcept;
    bool operator!=(const DirectRaccoonVector& other) const noexcept;

    std::string to_string() const;
};

// A successfully executed vector and the server behavior it produced
struct RACCOON_API VectorResponse {
    DirectRaccoonVector vector;
    Fingerprint fingerprint;

    VectorResponse(DirectRaccoonVector v, Fingerprint f)
        : vector(v)
        , fingerprint(std::move(f)) {}
};

} // namespace probe
} // namespace raccoon

#endif // RACCOON_PROBE_VECTOR_H
