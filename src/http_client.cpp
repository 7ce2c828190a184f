#include <meridian/net/http.hpp>

#include <curl/curl.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <ctime>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace meridian::net {

const char* http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE: return "DELETE";
        case HttpMethod::PATCH: return "PATCH";
        case HttpMethod::HEAD: return "HEAD";
        case HttpMethod::OPTIONS: return "OPTIONS";
    }
    return "GET";
}

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

bool is_retryable_status(int status) {
    return status == 408 || status == 429 || (status >= 500 && status < 600);
}

std::string url_encode(const std::string& str) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(str.size() * 3);
    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

// ============================================================================
// Headers, requests, URLs
// ============================================================================

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

}  // namespace

std::string HttpHeaders::normalize_name(const std::string& name) {
    return lowercase(trim(name));
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)].push_back(value);
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(normalize_name(name));
    if (it == headers_.end() || it->second.empty()) return std::nullopt;
    return it->second.front();
}

bool HttpHeaders::has(const std::string& name) const {
    return headers_.count(normalize_name(name)) > 0;
}

// Repeated headers fold into one comma-separated value.
std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> out;
    out.reserve(headers_.size());
    for (const auto& [name, values] : headers_) {
        std::string joined;
        for (const auto& v : values) {
            if (!joined.empty()) joined += ", ";
            joined += v;
        }
        out.emplace_back(name, std::move(joined));
    }
    return out;
}

void HttpHeaders::set_content_type(const std::string& content_type) {
    set("content-type", content_type);
}

std::optional<size_t> HttpHeaders::content_length() const {
    auto value = get("content-length");
    if (!value || value->empty() || !std::isdigit(static_cast<unsigned char>(value->front()))) {
        return std::nullopt;
    }
    try {
        size_t used = 0;
        unsigned long long parsed = std::stoull(*value, &used);
        if (used != value->size()) return std::nullopt;
        return static_cast<size_t>(parsed);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

HttpRequest HttpRequest::get(const std::string& url) {
    HttpRequest r;
    r.url = url;
    return r;
}

HttpRequest HttpRequest::post(const std::string& url, const std::string& body) {
    HttpRequest r;
    r.method = HttpMethod::POST;
    r.url = url;
    r.body.assign(body.begin(), body.end());
    return r;
}

HttpRequest HttpRequest::put(const std::string& url, const std::vector<uint8_t>& body) {
    HttpRequest r;
    r.method = HttpMethod::PUT;
    r.url = url;
    r.body = body;
    return r;
}

HttpRequest HttpRequest::del(const std::string& url) {
    HttpRequest r;
    r.method = HttpMethod::DELETE;
    r.url = url;
    return r;
}

std::string HttpResponse::body_string() const {
    return std::string(body.begin(), body.end());
}

std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) return std::nullopt;

    ParsedUrl parsed;
    parsed.scheme = lowercase(url.substr(0, scheme_end));

    std::string rest = url.substr(scheme_end + 3);
    auto hash = rest.find('#');
    if (hash != std::string::npos) {
        parsed.fragment = rest.substr(hash + 1);
        rest.resize(hash);
    }

    auto path_start = rest.find_first_of("/?");
    std::string authority = rest.substr(0, path_start);
    std::string tail = path_start == std::string::npos ? "" : rest.substr(path_start);

    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        parsed.userinfo = authority.substr(0, at);
        authority.erase(0, at + 1);
    }
    if (authority.empty()) return std::nullopt;

    auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']', colon) == std::string::npos) {
        std::string port = authority.substr(colon + 1);
        if (port.empty() || port.size() > 5 ||
            !std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return std::nullopt;
        }
        parsed.port = std::stoi(port);
        authority.resize(colon);
    }
    parsed.host = authority;

    auto q = tail.find('?');
    parsed.path = tail.substr(0, q);
    if (q != std::string::npos) parsed.query = tail.substr(q + 1);
    if (parsed.path.empty()) parsed.path = "/";
    return parsed;
}

int ParsedUrl::effective_port() const {
    if (port > 0) return port;
    return scheme == "https" ? 443 : 80;
}

// ============================================================================
// libcurl client
// ============================================================================

namespace {

std::once_flag g_curl_init;

using SlistPtr = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

struct Transfer {
    const HttpRequest* request = nullptr;
    size_t upload_offset = 0;
    size_t max_body = 0;
    HttpResponse response;
};

size_t on_body(char* data, size_t size, size_t nmemb, void* userp) {
    auto* t = static_cast<Transfer*>(userp);
    size_t n = size * nmemb;
    if (t->max_body > 0 && t->response.body.size() + n > t->max_body) {
        t->response.error = "response exceeds " + std::to_string(t->max_body) + " bytes";
        return 0;  // aborts the transfer
    }
    t->response.body.insert(t->response.body.end(), data, data + n);
    return n;
}

size_t on_header(char* data, size_t size, size_t nitems, void* userp) {
    auto* t = static_cast<Transfer*>(userp);
    size_t n = size * nitems;
    std::string line(data, n);
    auto colon = line.find(':');
    if (colon != std::string::npos) {
        t->response.headers.add(line.substr(0, colon), trim(line.substr(colon + 1)));
    } else if (line.rfind("HTTP/", 0) == 0) {
        // A new status line starts a fresh header block (redirects, 100-continue).
        t->response.headers = HttpHeaders{};
        auto sp = line.find(' ', line.find(' ') + 1);
        t->response.status_message = sp == std::string::npos ? "" : trim(line.substr(sp + 1));
    }
    return n;
}

size_t on_upload(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* t = static_cast<Transfer*>(userp);
    const auto& body = t->request->body;
    size_t n = std::min(size * nitems, body.size() - t->upload_offset);
    if (n > 0) {
        std::memcpy(buffer, body.data() + t->upload_offset, n);
        t->upload_offset += n;
    }
    return n;
}

void apply_method(CURL* curl, const HttpRequest& request) {
    switch (request.method) {
        case HttpMethod::GET:
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::HEAD:
            curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
            break;
        case HttpMethod::PUT:
            curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, on_upload);
            curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
            break;
        case HttpMethod::POST:
        case HttpMethod::PATCH:
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
            if (request.method == HttpMethod::PATCH) {
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "PATCH");
            }
            break;
        case HttpMethod::DELETE:
        case HttpMethod::OPTIONS:
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, http_method_to_string(request.method));
            break;
    }
}

SlistPtr build_header_list(const HttpHeaders& headers) {
    curl_slist* list = nullptr;
    for (const auto& [name, value] : headers.all()) {
        list = curl_slist_append(list, (name + ": " + value).c_str());
    }
    // Suppress curl's automatic "Expect: 100-continue" on uploads.
    list = curl_slist_append(list, "Expect:");
    return SlistPtr(list, curl_slist_free_all);
}

}  // namespace

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config) : config_(config) {
        std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_ALL); });
    }

    ~Impl() {
        for (CURL* handle : idle_) curl_easy_cleanup(handle);
    }

    HttpResponse execute(const HttpRequest& request) {
        CURL* curl = acquire();
        if (!curl) {
            HttpResponse failed;
            failed.is_network_error = true;
            failed.error = "curl_easy_init failed";
            return failed;
        }

        Transfer transfer;
        transfer.request = &request;
        transfer.max_body = config_.max_response_size;
        auto header_list = build_header_list(request.headers);

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
        curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, config_.tcp_keepalive ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(request.connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                         static_cast<long>(request.total_timeout.count()));
        if (config_.verbose) curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);

        long verify = (config_.verify_ssl_by_default && request.verify_ssl) ? 1L : 0L;
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verify);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verify ? 2L : 0L);
        const std::string& ca = request.ca_bundle_path.empty() ? config_.default_ca_bundle
                                                               : request.ca_bundle_path;
        if (!ca.empty()) curl_easy_setopt(curl, CURLOPT_CAINFO, ca.c_str());
        if (!config_.proxy_url.empty()) curl_easy_setopt(curl, CURLOPT_PROXY, config_.proxy_url.c_str());

        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, on_body);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &transfer);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, on_header);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &transfer);
        curl_easy_setopt(curl, CURLOPT_READDATA, &transfer);
        apply_method(curl, request);

        CURLcode rc = curl_easy_perform(curl);
        if (rc == CURLE_OK) {
            long status = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
            transfer.response.status_code = static_cast<int>(status);
        } else {
            transfer.response.is_network_error = true;
            if (transfer.response.error.empty()) transfer.response.error = curl_easy_strerror(rc);
        }

        double total = 0;
        double connect = 0;
        curl_easy_getinfo(curl, CURLINFO_TOTAL_TIME, &total);
        curl_easy_getinfo(curl, CURLINFO_CONNECT_TIME, &connect);
        transfer.response.total_time = std::chrono::milliseconds(static_cast<long long>(total * 1000));
        transfer.response.connect_time = std::chrono::milliseconds(static_cast<long long>(connect * 1000));

        release(curl);
        return std::move(transfer.response);
    }

private:
    CURL* acquire() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!idle_.empty()) {
                CURL* handle = idle_.back();
                idle_.pop_back();
                return handle;
            }
        }
        return curl_easy_init();
    }

    // Handles are kept (reset, connection cache intact) up to the per-host cap.
    void release(CURL* handle) {
        curl_easy_reset(handle);
        std::lock_guard<std::mutex> lock(mutex_);
        if (idle_.size() < config_.max_connections_per_host) {
            idle_.push_back(handle);
        } else {
            curl_easy_cleanup(handle);
        }
    }

    HttpClientConfig config_;
    std::mutex mutex_;
    std::vector<CURL*> idle_;
};

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

// ============================================================================
// SigV4
// ============================================================================

namespace {

std::string hex_encode(const unsigned char* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out(len * 2, '0');
    for (size_t i = 0; i < len; ++i) {
        out[2 * i] = digits[data[i] >> 4];
        out[2 * i + 1] = digits[data[i] & 0x0F];
    }
    return out;
}

std::string sha256_hex(const void* data, size_t len) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(static_cast<const unsigned char*>(data), len, digest);
    return hex_encode(digest, sizeof(digest));
}

std::string hmac(const std::string& key, const std::string& msg) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(msg.data()), msg.size(), out, &out_len);
    return std::string(reinterpret_cast<char*>(out), out_len);
}

// Query parameters sorted by encoded name, each side re-encoded.
std::string canonical_query(const std::string& query) {
    std::vector<std::pair<std::string, std::string>> params;
    std::istringstream in(query);
    std::string item;
    while (std::getline(in, item, '&')) {
        if (item.empty()) continue;
        auto eq = item.find('=');
        std::string name = item.substr(0, eq);
        std::string value = eq == std::string::npos ? "" : item.substr(eq + 1);
        params.emplace_back(url_encode(name), url_encode(value));
    }
    std::sort(params.begin(), params.end());

    std::string out;
    for (const auto& [name, value] : params) {
        if (!out.empty()) out += '&';
        out += name + "=" + value;
    }
    return out;
}

std::string host_header(const ParsedUrl& url) {
    return url.port > 0 ? url.host + ":" + std::to_string(url.port) : url.host;
}

}  // namespace

AwsSigV4Signer::AwsSigV4Signer(const std::string& access_key_id,
                               const std::string& secret_access_key,
                               const std::string& region,
                               const std::string& service)
    : access_key_id_(access_key_id),
      secret_access_key_(secret_access_key),
      region_(region),
      service_(service) {}

std::string AwsSigV4Signer::get_canonical_request(const HttpRequest& request,
                                                  const std::string& signed_headers,
                                                  const std::string& payload_hash) const {
    auto url = ParsedUrl::parse(request.url);
    if (!url) throw std::invalid_argument("cannot sign malformed URL: " + request.url);

    std::string canonical_headers;
    for (const auto& [name, value] : request.headers.all()) {
        if (name == "authorization") continue;
        canonical_headers += name + ":" + trim(value) + "\n";
    }

    return std::string(http_method_to_string(request.method)) + "\n" +
           url->path + "\n" +
           canonical_query(url->query) + "\n" +
           canonical_headers + "\n" +
           signed_headers + "\n" +
           payload_hash;
}

std::string AwsSigV4Signer::get_string_to_sign(const std::string& datetime,
                                               const std::string& date,
                                               const std::string& canonical_request) const {
    return "AWS4-HMAC-SHA256\n" + datetime + "\n" +
           date + "/" + region_ + "/" + service_ + "/aws4_request\n" +
           sha256_hex(canonical_request.data(), canonical_request.size());
}

std::string AwsSigV4Signer::calculate_signature(const std::string& date,
                                                const std::string& string_to_sign) const {
    std::string key = hmac("AWS4" + secret_access_key_, date);
    key = hmac(key, region_);
    key = hmac(key, service_);
    key = hmac(key, "aws4_request");
    std::string sig = hmac(key, string_to_sign);
    return hex_encode(reinterpret_cast<const unsigned char*>(sig.data()), sig.size());
}

void AwsSigV4Signer::sign_with_token(HttpRequest& request,
                                     const std::string& session_token) const {
    request.headers.set("x-amz-security-token", session_token);
    sign(request);
}

// Signs every header present on the request except authorization.
void AwsSigV4Signer::sign(HttpRequest& request) const {
    auto url = ParsedUrl::parse(request.url);
    if (!url) throw std::invalid_argument("cannot sign malformed URL: " + request.url);

    char stamp[17];
    std::time_t now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);
    std::strftime(stamp, sizeof(stamp), "%Y%m%dT%H%M%SZ", &utc);
    const std::string amz_date = stamp;
    const std::string date = amz_date.substr(0, 8);

    const std::string payload_hash = sha256_hex(request.body.data(), request.body.size());
    request.headers.set("host", host_header(*url));
    request.headers.set("x-amz-date", amz_date);
    request.headers.set("x-amz-content-sha256", payload_hash);

    std::string signed_headers;
    for (const auto& [name, value] : request.headers.all()) {
        if (name == "authorization") continue;
        if (!signed_headers.empty()) signed_headers += ';';
        signed_headers += name;
    }

    std::string string_to_sign = get_string_to_sign(
        amz_date, date, get_canonical_request(request, signed_headers, payload_hash));

    request.headers.set("authorization",
                        "AWS4-HMAC-SHA256 Credential=" + access_key_id_ + "/" + date + "/" +
                        region_ + "/" + service_ + "/aws4_request" +
                        ", SignedHeaders=" + signed_headers +
                        ", Signature=" + calculate_signature(date, string_to_sign));
}

}  // namespace meridian::net
