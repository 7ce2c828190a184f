#include "lakesync/transfer_backend.hpp"

#include <exception>

namespace lakesync {

ErrorKind error_kind_for_status(long status_code, bool network_error) {
    if (network_error || status_code == 0) return ErrorKind::Transient;
    if (status_code == 401 || status_code == 403) return ErrorKind::PermissionDenied;
    if (status_code == 404) return ErrorKind::NotFound;
    if (status_code == 408 || status_code == 429 || status_code >= 500) return ErrorKind::Transient;
    return ErrorKind::ConfigurationError;
}

UnchangedCheck check_unchanged(storage::StorageProvider& provider,
                               const ObjectUri& source,
                               const ObjectUri& destination,
                               std::optional<uint64_t> expected_size) {
    UnchangedCheck check;
    check.source_size = expected_size;

    try {
        auto dst_backend = provider.resolve(destination);
        auto dst = dst_backend->head(destination.key);
        ++check.requests;
        if (dst.not_found()) {
            return check;
        }
        if (!dst.success) {
            check.error = error_kind_for_status(dst.status_code, dst.network_error);
            check.message = "destination stat failed: " + dst.error_message;
            return check;
        }

        if (!check.source_size) {
            auto src_backend = provider.resolve(source);
            auto src = src_backend->head(source.key);
            ++check.requests;
            if (!src.success) {
                check.error = error_kind_for_status(src.status_code, src.network_error);
                check.message = "source stat failed: " + src.error_message;
                return check;
            }
            check.source_size = src.metadata.size;
        }

        check.unchanged = dst.metadata.size == *check.source_size;
    } catch (const std::exception& e) {
        check.error = ErrorKind::ConfigurationError;
        check.message = e.what();
    }
    return check;
}

}  // namespace lakesync
