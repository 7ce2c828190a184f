#include "lakesync/storage/backend.hpp"
#include "lakesync/constants.hpp"
#include "lakesync/log.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

#include <meridian/net/http.hpp>

namespace lakesync::storage {

namespace net = meridian::net;

namespace {

long status_for_errno(int err) {
    switch (err) {
        case ENOENT:
        case ENOTDIR:
            return 404;
        case EACCES:
        case EPERM:
        case EROFS:
            return 403;
        case EISDIR:
        case ENAMETOOLONG:
            return 400;
        default:
            return 500;
    }
}

void fail(StorageStatus& status, long code, std::string message) {
    status.success = false;
    status.status_code = code;
    status.error_message = std::move(message);
}

void fail_errno(StorageStatus& status, int err, const std::string& what) {
    fail(status, status_for_errno(err), what + ": " + std::strerror(err));
}

// Closes the descriptor on scope exit.
class ScopedFd {
public:
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd() { if (fd_ >= 0) ::close(fd_); }
    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    // Closes now so the caller sees close() errors.
    int close() {
        int rc = ::close(fd_);
        fd_ = -1;
        return rc;
    }

private:
    int fd_;
};

}  // namespace

// ============================================================================
// LocalStorageBackend
// ============================================================================

// A directory standing in for a bucket. Keys are relative paths below root;
// writes land in a sibling temp file and are renamed into place.
class LocalStorageBackend : public StorageBackend {
public:
    explicit LocalStorageBackend(std::filesystem::path root)
        : root_(std::filesystem::absolute(std::move(root))) {
        std::error_code ec;
        std::filesystem::create_directories(root_, ec);
        if (ec) {
            log_warn("Local storage: cannot create %s: %s", root_.c_str(), ec.message().c_str());
        }
    }

    std::string type_name() const override { return "local"; }

    HeadResult head(const std::string& key) const override {
        HeadResult result;
        std::filesystem::path path;
        if (!locate(key, path, result)) return result;

        struct stat st {};
        if (::stat(path.c_str(), &st) != 0) {
            fail_errno(result, errno, "stat " + key);
            return result;
        }
        if (!S_ISREG(st.st_mode)) {
            fail(result, 404, "Not a regular file: " + key);
            return result;
        }

        result.success = true;
        result.status_code = 200;
        result.metadata.size = static_cast<uint64_t>(st.st_size);
        return result;
    }

    GetResult get(const std::string& key) const override {
        GetResult result;
        std::filesystem::path path;
        if (!locate(key, path, result)) return result;

        ScopedFd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
        if (!fd.valid()) {
            fail_errno(result, errno, "open " + key);
            return result;
        }

        struct stat st {};
        if (::fstat(fd.get(), &st) != 0) {
            fail_errno(result, errno, "stat " + key);
            return result;
        }
        if (!S_ISREG(st.st_mode)) {
            fail(result, 404, "Not a regular file: " + key);
            return result;
        }

        result.data.resize(static_cast<size_t>(st.st_size));
        size_t done = 0;
        while (done < result.data.size()) {
            ssize_t n = ::read(fd.get(), result.data.data() + done, result.data.size() - done);
            if (n < 0 && errno == EINTR) continue;
            if (n < 0) {
                result.data.clear();
                fail_errno(result, errno, "read " + key);
                return result;
            }
            if (n == 0) break;  // truncated underneath us
            done += static_cast<size_t>(n);
        }
        result.data.resize(done);

        result.success = true;
        result.status_code = 200;
        return result;
    }

    PutResult put(const std::string& key,
                  std::span<const uint8_t> data,
                  const PutOptions& /*options*/) override {
        PutResult result;
        std::filesystem::path path;
        if (!locate(key, path, result)) return result;

        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            fail(result, status_for_errno(ec.value()), "mkdir " + path.parent_path().string() +
                 ": " + ec.message());
            return result;
        }

        std::string temp = path.string() + ".lakesync." + std::to_string(::getpid()) + "." +
                           std::to_string(temp_seq_.fetch_add(1));
        ScopedFd fd(::open(temp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644));
        if (!fd.valid()) {
            fail_errno(result, errno, "create " + key);
            return result;
        }

        size_t done = 0;
        while (done < data.size()) {
            ssize_t n = ::write(fd.get(), data.data() + done, data.size() - done);
            if (n < 0 && errno == EINTR) continue;
            if (n < 0) {
                int err = errno;
                ::unlink(temp.c_str());
                fail_errno(result, err, "write " + key);
                return result;
            }
            done += static_cast<size_t>(n);
        }

        if (fd.close() != 0 || ::rename(temp.c_str(), path.c_str()) != 0) {
            int err = errno;
            ::unlink(temp.c_str());
            fail_errno(result, err, "commit " + key);
            return result;
        }

        result.success = true;
        result.status_code = 200;
        return result;
    }

    bool is_healthy() const override {
        return ::access(root_.c_str(), R_OK | W_OK | X_OK) == 0;
    }

private:
    // Keys are '/'-separated relative paths; empty, "." and ".." segments
    // are rejected with 400.
    bool locate(const std::string& key, std::filesystem::path& out, StorageStatus& status) const {
        if (key.empty() || key.front() == '/') {
            fail(status, 400, "Invalid key: '" + key + "'");
            return false;
        }
        std::istringstream segments(key);
        std::string segment;
        while (std::getline(segments, segment, '/')) {
            if (segment.empty() || segment == "." || segment == "..") {
                fail(status, 400, "Invalid key: '" + key + "'");
                return false;
            }
        }
        out = root_ / key;
        return true;
    }

    std::filesystem::path root_;
    mutable std::atomic<uint64_t> temp_seq_{0};
};

// ============================================================================
// S3StorageBackend
// ============================================================================

namespace {

// Text of the first <tag>...</tag> in an S3 XML body, entities decoded.
std::string xml_text(const std::string& body, const std::string& tag) {
    auto open = body.find("<" + tag + ">");
    if (open == std::string::npos) return "";
    open += tag.size() + 2;
    auto close = body.find("</" + tag + ">", open);
    if (close == std::string::npos) return "";

    static const std::pair<const char*, char> entities[] = {
        {"&quot;", '"'}, {"&apos;", '\''}, {"&lt;", '<'}, {"&gt;", '>'}, {"&amp;", '&'}};
    std::string raw = body.substr(open, close - open);
    std::string out;
    for (size_t i = 0; i < raw.size();) {
        bool matched = false;
        if (raw[i] == '&') {
            for (const auto& [entity, ch] : entities) {
                size_t len = std::strlen(entity);
                if (raw.compare(i, len, entity) == 0) {
                    out += ch;
                    i += len;
                    matched = true;
                    break;
                }
            }
        }
        if (!matched) out += raw[i++];
    }
    return out;
}

std::string quoted(const std::string& etag) {
    if (etag.empty() || (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"')) {
        return etag;
    }
    return "\"" + etag + "\"";
}

}  // namespace

class S3StorageBackend : public StorageBackend {
public:
    struct Settings {
        std::string bucket;
        std::string region = "us-east-1";
        std::string endpoint;  // MinIO, Ceph, LocalStack
        std::string access_key;
        std::string secret_key;
        std::string session_token;
        bool path_style = false;
        bool verify_ssl = true;
        uint64_t part_size = constants::MEDIUM_TIER_CHUNK_SIZE;
        size_t part_concurrency = constants::DEFAULT_MULTIPART_CONCURRENCY;
        uint32_t connect_timeout_secs = constants::DEFAULT_HTTP_CONNECT_TIMEOUT_SECONDS;
        uint32_t request_timeout_secs = constants::DEFAULT_HTTP_REQUEST_TIMEOUT_SECONDS;
    };

    explicit S3StorageBackend(Settings settings)
        : settings_(std::move(settings)),
          signer_(settings_.access_key, settings_.secret_key, settings_.region, "s3") {
        net::HttpClientConfig http_config;
        http_config.user_agent = "lakesync-s3/1.0";
        http_config.verify_ssl_by_default = settings_.verify_ssl;
        http_config.max_connections_per_host = settings_.part_concurrency;
        http_config.max_response_size = 0;
        http_ = std::make_unique<net::HttpClient>(http_config);
    }

    std::string type_name() const override { return "s3"; }

    HeadResult head(const std::string& key) const override {
        HeadResult result;
        net::HttpRequest request;
        request.method = net::HttpMethod::HEAD;
        request.url = object_url(key);
        auto response = send(std::move(request));
        if (record(result, response)) {
            result.metadata.size = response.headers.content_length().value_or(0);
        }
        return result;
    }

    GetResult get(const std::string& key) const override {
        GetResult result;
        auto response = send(net::HttpRequest::get(object_url(key)));
        if (record(result, response)) {
            result.data = std::move(response.body);
        }
        return result;
    }

    PutResult put(const std::string& key,
                  std::span<const uint8_t> data,
                  const PutOptions& options) override {
        uint64_t part_size = options.part_size ? options.part_size : settings_.part_size;
        if (data.size() > part_size) {
            return put_multipart(key, data, static_cast<size_t>(part_size));
        }

        PutResult result;
        auto request = net::HttpRequest::put(object_url(key),
                                             std::vector<uint8_t>(data.begin(), data.end()));
        request.headers.set_content_type("application/octet-stream");
        record(result, send(std::move(request)));
        return result;
    }

    bool is_healthy() const override {
        auto response = send(net::HttpRequest::get(bucket_url() + "?list-type=2&max-keys=1"));
        if (!response.ok()) {
            log_warn("S3: bucket %s unreachable: %s", settings_.bucket.c_str(),
                     describe(response).c_str());
        }
        return response.ok();
    }

private:
    // Copies the HTTP outcome into status; true on 2xx.
    static bool record(StorageStatus& status, const net::HttpResponse& response) {
        status.status_code = response.status_code;
        status.network_error = response.is_network_error;
        status.success = response.ok();
        if (!status.success) status.error_message = describe(response);
        return status.success;
    }

    static std::string describe(const net::HttpResponse& response) {
        if (response.is_network_error) return response.error;
        std::string text = "HTTP " + std::to_string(response.status_code);
        std::string code = xml_text(response.body_string(), "Code");
        if (!code.empty()) text += " " + code;
        return text;
    }

    // Signs (when credentials are configured) and sends once. Retries are the
    // coordinator's RetryPolicy.
    net::HttpResponse send(net::HttpRequest request) const {
        request.connect_timeout = std::chrono::seconds(settings_.connect_timeout_secs);
        request.total_timeout = std::chrono::seconds(settings_.request_timeout_secs);
        request.verify_ssl = settings_.verify_ssl;
        if (!settings_.access_key.empty()) {
            try {
                if (settings_.session_token.empty()) {
                    signer_.sign(request);
                } else {
                    signer_.sign_with_token(request, settings_.session_token);
                }
            } catch (const std::invalid_argument& e) {
                net::HttpResponse failed;
                failed.is_network_error = true;
                failed.error = e.what();
                return failed;
            }
        }

        net::HttpResponse response = http_->execute(request);
        if (!response.ok()) {
            log_debug("S3: %s %s -> %s", net::http_method_to_string(request.method),
                      request.url.c_str(), describe(response).c_str());
        }
        return response;
    }

    std::string bucket_url() const {
        if (!settings_.endpoint.empty()) {
            std::string base = settings_.endpoint;
            while (!base.empty() && base.back() == '/') base.pop_back();
            return base + "/" + settings_.bucket;
        }
        if (settings_.path_style) {
            return "https://s3." + settings_.region + ".amazonaws.com/" + settings_.bucket;
        }
        return "https://" + settings_.bucket + ".s3." + settings_.region + ".amazonaws.com";
    }

    // Each key segment is percent-encoded; '/' separators survive.
    std::string object_url(const std::string& key) const {
        std::string url = bucket_url();
        size_t start = 0;
        while (true) {
            size_t slash = key.find('/', start);
            url += "/" + net::url_encode(key.substr(start, slash - start));
            if (slash == std::string::npos) break;
            start = slash + 1;
        }
        return url;
    }

    // ------------------------------------------------------------------------
    // Multipart upload
    // ------------------------------------------------------------------------

    PutResult put_multipart(const std::string& key,
                            std::span<const uint8_t> data,
                            size_t part_size) {
        PutResult result;

        auto init = net::HttpRequest::post(object_url(key) + "?uploads", "");
        init.headers.set_content_type("application/octet-stream");
        auto init_response = send(std::move(init));
        if (!record(result, init_response)) return result;

        const std::string upload_id = xml_text(init_response.body_string(), "UploadId");
        if (upload_id.empty()) {
            fail(result, 502, "CreateMultipartUpload returned no UploadId");
            return result;
        }
        const std::string upload_query = "uploadId=" + net::url_encode(upload_id);

        size_t part_count = (data.size() + part_size - 1) / part_size;
        log_debug("S3: multipart %s/%s, %zu parts of %zu bytes", settings_.bucket.c_str(),
                  key.c_str(), part_count, part_size);

        // Workers claim part indices until all are sent or one fails.
        std::vector<std::string> etags(part_count);
        std::atomic<size_t> next{0};
        std::atomic<bool> failed{false};
        std::mutex failure_mutex;
        net::HttpResponse failure;

        auto worker = [&]() {
            for (size_t i = next++; i < part_count && !failed; i = next++) {
                auto chunk = data.subspan(i * part_size, std::min(part_size, data.size() - i * part_size));
                auto response = send(net::HttpRequest::put(
                    object_url(key) + "?partNumber=" + std::to_string(i + 1) + "&" + upload_query,
                    std::vector<uint8_t>(chunk.begin(), chunk.end())));
                if (response.ok()) {
                    etags[i] = quoted(response.headers.get("etag").value_or(""));
                } else if (!failed.exchange(true)) {
                    std::lock_guard<std::mutex> lock(failure_mutex);
                    failure = std::move(response);
                }
            }
        };

        size_t worker_count = std::clamp<size_t>(settings_.part_concurrency, 1, part_count);
        std::vector<std::thread> workers;
        workers.reserve(worker_count);
        for (size_t i = 0; i < worker_count; ++i) workers.emplace_back(worker);
        for (auto& t : workers) t.join();

        if (failed) {
            abort_multipart(key, upload_query);
            record(result, failure);
            result.error_message = "UploadPart: " + result.error_message;
            return result;
        }

        std::ostringstream body;
        body << "<CompleteMultipartUpload xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">";
        for (size_t i = 0; i < part_count; ++i) {
            std::string etag = etags[i];
            for (size_t pos = 0; (pos = etag.find('"', pos)) != std::string::npos; pos += 6) {
                etag.replace(pos, 1, "&quot;");
            }
            body << "<Part><PartNumber>" << (i + 1) << "</PartNumber><ETag>" << etag
                 << "</ETag></Part>";
        }
        body << "</CompleteMultipartUpload>";

        auto complete = net::HttpRequest::post(object_url(key) + "?" + upload_query, body.str());
        complete.headers.set_content_type("application/xml");
        auto complete_response = send(std::move(complete));
        if (!record(result, complete_response)) {
            abort_multipart(key, upload_query);
            return result;
        }

        // A 200 can still carry an <Error> document.
        if (xml_text(complete_response.body_string(), "ETag").empty()) {
            abort_multipart(key, upload_query);
            std::string code = xml_text(complete_response.body_string(), "Code");
            fail(result, 500, "CompleteMultipartUpload failed" + (code.empty() ? "" : ": " + code));
        }
        return result;
    }

    void abort_multipart(const std::string& key, const std::string& upload_query) const {
        auto response = send(net::HttpRequest::del(object_url(key) + "?" + upload_query));
        if (!response.ok()) {
            log_warn("S3: abort of multipart upload for %s failed (%s); parts left to lifecycle rules",
                     key.c_str(), describe(response).c_str());
        }
    }

    Settings settings_;
    net::AwsSigV4Signer signer_;
    std::unique_ptr<net::HttpClient> http_;
};

// ============================================================================
// Factory
// ============================================================================

namespace {

using Params = std::map<std::string, std::string>;

const std::string* find_param(const Params& params, const std::string& name) {
    auto it = params.find(name);
    return it == params.end() ? nullptr : &it->second;
}

void read_param(const Params& params, const std::string& name, std::string& out) {
    if (auto* v = find_param(params, name); v && !v->empty()) out = *v;
}

void read_param(const Params& params, const std::string& name, bool& out) {
    if (auto* v = find_param(params, name)) out = (*v == "true" || *v == "1");
}

void read_param(const Params& params, const std::string& name, uint32_t& out) {
    auto* v = find_param(params, name);
    if (!v) return;
    try {
        size_t used = 0;
        unsigned long parsed = std::stoul(*v, &used);
        if (used != v->size()) throw std::invalid_argument(name);
        out = static_cast<uint32_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("S3 backend: '" + name + "' must be a non-negative integer, got '" +
                                 *v + "'");
    }
}

}  // namespace

std::unique_ptr<StorageBackend> StorageBackendFactory::create(const std::string& type,
                                                              const Params& params) {
    if (type == "local") {
        auto* path = find_param(params, "path");
        if (!path || path->empty()) {
            throw std::runtime_error("Local backend requires 'path'");
        }
        return create_local(*path);
    }

    if (type != "s3") {
        throw std::runtime_error("Unknown storage backend type: " + type);
    }

    S3StorageBackend::Settings settings;
    read_param(params, "bucket", settings.bucket);
    if (settings.bucket.empty()) {
        throw std::runtime_error("S3 backend requires 'bucket'");
    }
    read_param(params, "region", settings.region);
    read_param(params, "endpoint", settings.endpoint);
    read_param(params, "access_key", settings.access_key);
    read_param(params, "secret_key", settings.secret_key);
    read_param(params, "session_token", settings.session_token);
    read_param(params, "path_style", settings.path_style);
    read_param(params, "verify_ssl", settings.verify_ssl);
    read_param(params, "connect_timeout", settings.connect_timeout_secs);
    read_param(params, "request_timeout", settings.request_timeout_secs);

    if (settings.access_key.empty() != settings.secret_key.empty()) {
        throw std::runtime_error("S3 backend: 'access_key' and 'secret_key' must be set together");
    }
    return std::make_unique<S3StorageBackend>(std::move(settings));
}

std::unique_ptr<StorageBackend> StorageBackendFactory::create_local(const std::filesystem::path& root) {
    return std::make_unique<LocalStorageBackend>(root);
}

}  // namespace lakesync::storage
