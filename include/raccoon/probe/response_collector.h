#ifndef RACCOON_PROBE_RESPONSE_COLLECTOR_H
#define RACCOON_PROBE_RESPONSE_COLLECTOR_H

#include <raccoon/config.h>
#include <raccoon/error_reporter.h>
#include <raccoon/result.h>
#include <raccoon/probe/execution.h>
#include <raccoon/probe/vector.h>
#include <memory>
#include <vector>

namespace raccoon {
namespace probe {

/**
 * Executes a set of vectors as one scheduler batch and pairs each
 * successful execution with its vector.
 *
 * Tasks that failed are logged at WARNING level and dropped, so the result
 * may hold fewer responses than vectors. An error result means the batch as
 * a whole could not be trusted: the scheduler failed, or its results do not
 * match the submitted requests one to one.
 */
class RACCOON_API ResponseCollector {
public:
    ResponseCollector(std::shared_ptr<ParallelScheduler> scheduler,
                      std::shared_ptr<ErrorReporter> reporter = nullptr);

    Result<std::vector<VectorResponse>> collect(const std::vector<DirectRaccoonVector>& vectors,
                                                const DhSecret& secret);

    size_t dropped_count() const noexcept { return dropped_; }

private:
    std::shared_ptr<ParallelScheduler> scheduler_;
    std::shared_ptr<ErrorReporter> reporter_;
    size_t dropped_{0};
};

} // namespace probe
} // namespace raccoon

#endif // RACCOON_PROBE_RESPONSE_COLLECTOR_H
