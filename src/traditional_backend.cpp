#include "lakesync/traditional_backend.hpp"
#include "lakesync/log.hpp"

#include <exception>

namespace lakesync {

TraditionalBackend::TraditionalBackend(std::string destination_container,
                                       std::string destination_prefix,
                                       std::shared_ptr<storage::StorageProvider> provider)
    : destination_container_(std::move(destination_container))
    , destination_prefix_(std::move(destination_prefix))
    , provider_(std::move(provider)) {}

bool TraditionalBackend::probe(std::chrono::seconds /*timeout*/) {
    return true;
}

BatchResult TraditionalBackend::execute(const Batch& batch,
                                        std::chrono::steady_clock::time_point deadline) {
    BatchResult result;
    result.outcomes.reserve(batch.size());

    for (const auto& task : batch.tasks) {
        if (std::chrono::steady_clock::now() >= deadline) {
            result.outcomes.push_back(TransferOutcome::failed(task, ErrorKind::Cancelled,
                                                              "deadline exceeded"));
            continue;
        }

        // One task's failure never stops its siblings
        try {
            result.outcomes.push_back(transfer_one(task, batch.shared_parameters,
                                                   result.operations_issued));
        } catch (const std::exception& e) {
            result.outcomes.push_back(TransferOutcome::failed(task, ErrorKind::Transient, e.what()));
        }
    }
    return result;
}

TransferOutcome TraditionalBackend::transfer_one(const TransferTask& task,
                                                 const BatchParameters& params,
                                                 uint64_t& operations) {
    auto source = ObjectUri::parse(task.source_locator);
    if (!source) {
        return TransferOutcome::failed(task, ErrorKind::ConfigurationError,
                                       "invalid source locator: " + task.source_locator);
    }
    if (!is_safe_relative_path(task.destination_relative_path)) {
        return TransferOutcome::failed(task, ErrorKind::ConfigurationError,
                                       "destination path escapes prefix: " + task.destination_relative_path);
    }
    ObjectUri destination{"s3", destination_container_,
                          join_key(destination_prefix_, task.destination_relative_path)};

    std::shared_ptr<storage::StorageBackend> src_backend;
    std::shared_ptr<storage::StorageBackend> dst_backend;
    try {
        src_backend = provider_->resolve(*source);
        dst_backend = provider_->resolve(destination);
    } catch (const std::exception& e) {
        return TransferOutcome::failed(task, ErrorKind::ConfigurationError, e.what());
    }

    if (params.skip_if_unchanged) {
        auto check = check_unchanged(*provider_, *source, destination, task.expected_size);
        operations += check.requests;
        if (check.error) {
            return TransferOutcome::failed(task, *check.error, check.message);
        }
        if (check.unchanged) {
            log_debug("Traditional: %s unchanged", destination.to_string().c_str());
            return TransferOutcome::skipped(task);
        }
    }

    auto got = src_backend->get(source->key);
    ++operations;
    if (!got.success) {
        return TransferOutcome::failed(task, error_kind_for_status(got.status_code, got.network_error),
                                       "read " + source->to_string() + ": " + got.error_message);
    }

    storage::PutOptions options;
    options.part_size = params.chunk_size_bytes;
    auto put = dst_backend->put(destination.key, got.data, options);
    ++operations;
    if (!put.success) {
        return TransferOutcome::failed(task, error_kind_for_status(put.status_code, put.network_error),
                                       "write " + destination.to_string() + ": " + put.error_message);
    }

    return TransferOutcome::succeeded(task, got.data.size());
}

}  // namespace lakesync
