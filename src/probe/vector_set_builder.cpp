#include <raccoon/probe/vector_set_builder.h>
#include <algorithm>
#include <utility>

namespace raccoon {
namespace probe {

size_t VectorSet::null_byte_count() const {
    return static_cast<size_t>(std::count_if(vectors.begin(), vectors.end(),
        [](const DirectRaccoonVector& v) { return v.pms_with_null_byte; }));
}

VectorSetBuilder::VectorSetBuilder(std::shared_ptr<RandomSource> random)
    : random_(std::move(random)) {
    if (!random_) {
        random_ = default_random_source();
    }
}

Result<VectorSet> VectorSetBuilder::build(ProtocolVersion version,
                                          CipherSuite suite,
                                          WorkflowVariant variant,
                                          const DhSecret& secret,
                                          size_t count) const {
    VectorSet set;
    set.secret = secret;
    set.vectors.reserve(count * 2);
    for (size_t i = 0; i < count; ++i) {
        set.vectors.emplace_back(variant, version, suite, true);
        set.vectors.emplace_back(variant, version, suite, false);
    }

    auto shuffled = shuffle(set.vectors);
    if (!shuffled) {
        return make_error<VectorSet>(shuffled.error());
    }
    return make_result(std::move(set));
}

Result<void> VectorSetBuilder::shuffle(std::vector<DirectRaccoonVector>& vectors) const {
    for (size_t i = vectors.size(); i > 1; --i) {
        auto j = random_->uniform(i);
        if (!j) {
            return Result<void>(j.error());
        }
        std::swap(vectors[i - 1], vectors[*j]);
    }
    return Result<void>();
}

} // namespace probe
} // namespace raccoon
