#ifndef RACCOON_PROBE_PARALLEL_EXECUTOR_H
#define RACCOON_PROBE_PARALLEL_EXECUTOR_H

#include <raccoon/config.h>
#include <raccoon/error_reporter.h>
#include <raccoon/probe/execution.h>
#include <atomic>
#include <memory>

namespace raccoon {
namespace probe {

/**
 * ParallelScheduler that runs requests against an engine with std::async,
 * at most max_parallel_tasks at a time. Exceptions thrown by the engine are
 * caught per task and turned into task errors.
 */
class RACCOON_API ParallelExecutor : public ParallelScheduler {
public:
    struct Config {
        size_t max_parallel_tasks = 20;

        Result<void> validate() const {
            if (max_parallel_tasks == 0) {
                return Result<void>(RaccoonError::INVALID_CONFIGURATION);
            }
            return Result<void>();
        }
    };

    struct Statistics {
        std::atomic<uint64_t> batches_executed{0};
        std::atomic<uint64_t> tasks_executed{0};
        std::atomic<uint64_t> tasks_failed{0};
        std::atomic<uint64_t> tasks_threw{0};
    };

    ParallelExecutor(std::shared_ptr<HandshakeExecutionEngine> engine,
                     const Config& config,
                     std::shared_ptr<ErrorReporter> reporter = nullptr);
    explicit ParallelExecutor(std::shared_ptr<HandshakeExecutionEngine> engine);

    ParallelExecutor(const ParallelExecutor&) = delete;
    ParallelExecutor& operator=(const ParallelExecutor&) = delete;

    Result<std::vector<ExecutionResult>> execute_batch(
        const std::vector<ExecutionRequest>& requests) override;

    const Config& get_config() const { return config_; }
    const Statistics& get_statistics() const { return stats_; }

private:
    ExecutionResult run_task(const ExecutionRequest& request);

    std::shared_ptr<HandshakeExecutionEngine> engine_;
    Config config_;
    std::shared_ptr<ErrorReporter> reporter_;
    Statistics stats_;
};

} // namespace probe
} // namespace raccoon

#endif // RACCOON_PROBE_PARALLEL_EXECUTOR_H
