#ifndef RACCOON_PROBE_VECTOR_SET_BUILDER_H
#define RACCOON_PROBE_VECTOR_SET_BUILDER_H

#include <raccoon/config.h>
#include <raccoon/result.h>
#include <raccoon/probe/random_source.h>
#include <raccoon/probe/vector.h>
#include <memory>
#include <vector>

namespace raccoon {
namespace probe {

// Shuffled vectors of one combination together with the secret they share
struct RACCOON_API VectorSet {
    DhSecret secret;
    std::vector<DirectRaccoonVector> vectors;

    size_t null_byte_count() const;
};

/**
 * Produces balanced, randomly ordered vector sets.
 *
 * build() returns exactly @c count vectors with the null-byte flag set and
 * @c count without, permuted with a Fisher-Yates shuffle driven by the
 * injected RandomSource.
 */
class RACCOON_API VectorSetBuilder {
public:
    explicit VectorSetBuilder(std::shared_ptr<RandomSource> random);

    Result<VectorSet> build(ProtocolVersion version,
                            CipherSuite suite,
                            WorkflowVariant variant,
                            const DhSecret& secret,
                            size_t count) const;

private:
    Result<void> shuffle(std::vector<DirectRaccoonVector>& vectors) const;

    std::shared_ptr<RandomSource> random_;
};

} // namespace probe
} // namespace raccoon

#endif // RACCOON_PROBE_VECTOR_SET_BUILDER_H
