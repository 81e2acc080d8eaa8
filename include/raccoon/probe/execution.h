/**
 * @file execution.h
 * @brief Contracts of the handshake engine, the baseline runner and the
 *        parallel scheduler
 *
 * These collaborators perform all network I/O. The probe depends only on
 * the contracts below.
 */

#ifndef RACCOON_PROBE_EXECUTION_H
#define RACCOON_PROBE_EXECUTION_H

#include <raccoon/config.h>
#include <raccoon/types.h>
#include <raccoon/result.h>
#include <raccoon/probe/fingerprint.h>
#include <raccoon/probe/vector.h>
#include <cstddef>
#include <vector>

namespace raccoon {
namespace probe {

/**
 * Everything the engine needs to craft and run one handshake. The crafted
 * ClientKeyExchange is a deterministic function of (secret, with_null_byte).
 */
struct RACCOON_API ExecutionRequest {
    size_t index{0};    ///< position in the submitted batch, echoed in the result
    ProtocolVersion protocol_version{ProtocolVersion::TLS12};
    CipherSuite cipher_suite{CipherSuite::TLS_DHE_RSA_WITH_AES_128_CBC_SHA};
    WorkflowVariant workflow_variant{WorkflowVariant::CKE};
    DhSecret secret;
    bool with_null_byte{false};

    DirectRaccoonVector to_vector() const {
        return DirectRaccoonVector(workflow_variant, protocol_version, cipher_suite, with_null_byte);
    }
};

struct RACCOON_API ExecutionResult {
    size_t index{0};
    Result<Fingerprint> outcome{RaccoonError::NOT_INITIALIZED};
};

/**
 * Runs one crafted handshake against the target.
 *
 * Returns the fingerprint of the server's behavior, or an error when the
 * exchange failed (including timeouts). Must be safe to call from several
 * threads at once.
 */
class RACCOON_API HandshakeExecutionEngine {
public:
    virtual ~HandshakeExecutionEngine() = default;

    virtual Result<Fingerprint> execute(const ExecutionRequest& request) = 0;
};

/**
 * Runs an ordinary, uncrafted handshake.
 */
class RACCOON_API BaselineHandshakeRunner {
public:
    virtual ~BaselineHandshakeRunner() = default;

    /// @return true iff the handshake completed exactly as planned
    virtual bool run_normal_handshake(ProtocolVersion version, CipherSuite suite) = 0;
};

/**
 * Runs a batch of independent requests and blocks until all of them are
 * done. One result per request, matched by index; completion order is
 * unspecified. A failing task must not affect its siblings. A scheduler
 * level failure is reported as an error for the whole batch.
 */
class RACCOON_API ParallelScheduler {
public:
    virtual ~ParallelScheduler() = default;

    virtual Result<std::vector<ExecutionResult>> execute_batch(
        const std::vector<ExecutionRequest>& requests) = 0;
};

} // namespace probe
} // namespace raccoon

#endif // RACCOON_PROBE_EXECUTION_H
