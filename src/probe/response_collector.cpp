#include <raccoon/probe/response_collector.h>

namespace raccoon {
namespace probe {

ResponseCollector::ResponseCollector(std::shared_ptr<ParallelScheduler> scheduler,
                                     std::shared_ptr<ErrorReporter> reporter)
    : scheduler_(std::move(scheduler))
    , reporter_(std::move(reporter)) {}

Result<std::vector<VectorResponse>> ResponseCollector::collect(
    const std::vector<DirectRaccoonVector>& vectors, const DhSecret& secret) {

    if (!scheduler_) {
        return make_error<std::vector<VectorResponse>>(RaccoonError::MISSING_COLLABORATOR);
    }

    std::vector<ExecutionRequest> requests;
    requests.reserve(vectors.size());
    for (size_t i = 0; i < vectors.size(); ++i) {
        ExecutionRequest request;
        request.index = i;
        request.protocol_version = vectors[i].protocol_version;
        request.cipher_suite = vectors[i].cipher_suite;
        request.workflow_variant = vectors[i].workflow_variant;
        request.secret = secret;
        request.with_null_byte = vectors[i].pms_with_null_byte;
        requests.push_back(std::move(request));
    }

    auto batch = scheduler_->execute_batch(requests);
    if (!batch) {
        RACCOON_REPORT_ERROR(reporter_, batch.error(), "Scheduler failed to execute batch");
        return make_error<std::vector<VectorResponse>>(batch.error());
    }

    const auto& results = *batch;
    if (results.size() != requests.size()) {
        RACCOON_REPORT_ERROR(reporter_, RaccoonError::BATCH_RESULT_MISMATCH,
                             "Scheduler returned " + std::to_string(results.size()) +
                             " results for " + std::to_string(requests.size()) + " requests");
        return make_error<std::vector<VectorResponse>>(RaccoonError::BATCH_RESULT_MISMATCH);
    }

    // Place results by index; each request must be answered exactly once
    std::vector<const ExecutionResult*> by_index(requests.size(), nullptr);
    for (const auto& result : results) {
        if (result.index >= by_index.size() || by_index[result.index] != nullptr) {
            RACCOON_REPORT_ERROR(reporter_, RaccoonError::BATCH_RESULT_MISMATCH,
                                 "Scheduler returned unknown or duplicate index " +
                                 std::to_string(result.index));
            return make_error<std::vector<VectorResponse>>(RaccoonError::BATCH_RESULT_MISMATCH);
        }
        by_index[result.index] = &result;
    }

    std::vector<VectorResponse> responses;
    responses.reserve(vectors.size());
    for (size_t i = 0; i < vectors.size(); ++i) {
        const auto& outcome = by_index[i]->outcome;
        if (outcome.is_error()) {
            ++dropped_;
            RACCOON_REPORT_WARNING(reporter_, outcome.error(),
                                   "Could not extract fingerprint for " + vectors[i].to_string() + ";");
            continue;
        }
        responses.emplace_back(vectors[i], *outcome);
    }
    return make_result(std::move(responses));
}

} // namespace probe
} // namespace raccoon
