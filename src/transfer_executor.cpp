#include "lakesync/transfer_executor.hpp"
#include "lakesync/log.hpp"

#include <exception>

namespace lakesync {

TransferExecutor::TransferExecutor(std::shared_ptr<TransferBackend> direct,
                                   std::shared_ptr<TransferBackend> traditional)
    : direct_(std::move(direct))
    , traditional_(std::move(traditional)) {}

TransferBackend* TransferExecutor::backend_for(ExecutionMode mode) const {
    return mode == ExecutionMode::Direct ? direct_.get() : traditional_.get();
}

bool TransferExecutor::probe(ExecutionMode mode, std::chrono::seconds timeout) const {
    auto* backend = backend_for(mode);
    if (!backend) return false;
    try {
        return backend->probe(timeout);
    } catch (const std::exception& e) {
        log_warn("%s backend probe failed: %s", to_string(mode), e.what());
        return false;
    }
}

BatchResult TransferExecutor::execute(const Batch& batch,
                                      ExecutionMode mode,
                                      std::chrono::steady_clock::time_point deadline) const {
    if (batch.empty()) {
        return {};
    }

    auto* backend = backend_for(mode);
    if (!backend) {
        return fail_all(batch, ErrorKind::CapabilityUnavailable,
                        std::string("no ") + to_string(mode) + " backend configured");
    }

    BatchResult result;
    try {
        result = backend->execute(batch, deadline);
    } catch (const std::exception& e) {
        // Whole-batch failure: every task carries the same error
        log_warn("%s batch of %zu failed: %s", backend->type_name().c_str(), batch.size(), e.what());
        return fail_all(batch, ErrorKind::Transient, e.what());
    }

    if (result.outcomes.size() != batch.size()) {
        log_error("%s backend returned %zu outcomes for %zu tasks",
                  backend->type_name().c_str(), result.outcomes.size(), batch.size());
        auto failed = fail_all(batch, ErrorKind::Transient, "backend returned a malformed result");
        failed.operations_issued = result.operations_issued;
        return failed;
    }

    // Outcomes always describe the tasks they were produced for
    for (size_t i = 0; i < batch.size(); ++i) {
        result.outcomes[i].task = batch.tasks[i];
        if (result.outcomes[i].status != TransferStatus::Failed) {
            result.outcomes[i].error.reset();
        } else if (!result.outcomes[i].error) {
            result.outcomes[i].error = ErrorKind::Transient;
        }
    }
    return result;
}

BatchResult TransferExecutor::fail_all(const Batch& batch, ErrorKind kind, const std::string& message) {
    BatchResult result;
    result.outcomes.reserve(batch.size());
    for (const auto& task : batch.tasks) {
        result.outcomes.push_back(TransferOutcome::failed(task, kind, message));
    }
    return result;
}

}  // namespace lakesync
