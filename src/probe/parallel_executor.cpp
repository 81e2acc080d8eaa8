#include <raccoon/probe/parallel_executor.h>
#include <algorithm>
#include <future>
#include <system_error>

namespace raccoon {
namespace probe {

ParallelExecutor::ParallelExecutor(std::shared_ptr<HandshakeExecutionEngine> engine,
                                   const Config& config,
                                   std::shared_ptr<ErrorReporter> reporter)
    : engine_(std::move(engine))
    , config_(config)
    , reporter_(std::move(reporter)) {
    auto valid = config_.validate();
    if (!valid) {
        throw RaccoonException(valid.error(), "ParallelExecutor requires max_parallel_tasks > 0");
    }
}

ParallelExecutor::ParallelExecutor(std::shared_ptr<HandshakeExecutionEngine> engine)
    : ParallelExecutor(std::move(engine), Config{}) {}

Result<std::vector<ExecutionResult>> ParallelExecutor::execute_batch(
    const std::vector<ExecutionRequest>& requests) {

    if (!engine_) {
        return make_error<std::vector<ExecutionResult>>(RaccoonError::MISSING_COLLABORATOR);
    }

    std::vector<ExecutionResult> results;
    results.reserve(requests.size());

    // Process in groups so that at most max_parallel_tasks handshakes are in flight
    const size_t group_size = config_.max_parallel_tasks;
    for (size_t start = 0; start < requests.size(); start += group_size) {
        size_t end = std::min(start + group_size, requests.size());

        std::vector<std::future<ExecutionResult>> futures;
        futures.reserve(end - start);

        try {
            for (size_t i = start; i < end; ++i) {
                futures.push_back(std::async(std::launch::async, [this, &requests, i]() {
                    return run_task(requests[i]);
                }));
            }
        } catch (const std::system_error& e) {
            // Already launched tasks finish when their futures are destroyed
            RACCOON_REPORT_ERROR(reporter_, RaccoonError::SCHEDULER_ERROR,
                                 std::string("Could not start handshake task: ") + e.what());
            return make_error<std::vector<ExecutionResult>>(RaccoonError::SCHEDULER_ERROR);
        }

        // Wait for group completion
        for (auto& future : futures) {
            results.push_back(future.get());
        }
    }

    stats_.batches_executed++;
    return make_result(std::move(results));
}

ExecutionResult ParallelExecutor::run_task(const ExecutionRequest& request) {
    ExecutionResult result;
    result.index = request.index;

    try {
        result.outcome = engine_->execute(request);
    } catch (const RaccoonException& e) {
        stats_.tasks_threw++;
        result.outcome = Result<Fingerprint>(e.raccoon_error());
    } catch (const std::exception& e) {
        stats_.tasks_threw++;
        RACCOON_REPORT_DEBUG(reporter_, std::string("Handshake task threw: ") + e.what());
        result.outcome = Result<Fingerprint>(RaccoonError::EXECUTION_FAILED);
    } catch (...) {
        stats_.tasks_threw++;
        RACCOON_REPORT_DEBUG(reporter_, "Handshake task threw a non-standard exception");
        result.outcome = Result<Fingerprint>(RaccoonError::EXECUTION_FAILED);
    }

    stats_.tasks_executed++;
    if (result.outcome.is_error()) {
        stats_.tasks_failed++;
    }
    return result;
}

} // namespace probe
} // namespace raccoon
