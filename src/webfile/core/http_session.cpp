// Copyright (c) 2026 changcheng967. All rights reserved.

#include <webfile/core/http_session.hpp>
#include <webfile/core/file_name.hpp>
#include <webfile/core/log.hpp>
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstring>
#include <vector>

namespace webfile::core {

namespace {

constexpr int POLL_INTERVAL_MS = 100;

std::string lower(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

std::string_view trim(std::string_view value) {
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n'
                              || value.back() == ' ' || value.back() == '\t')) {
        value.remove_suffix(1);
    }
    return value;
}

std::optional<std::uint64_t> parse_number(std::string_view text) {
    text = trim(text);
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::error_code map_curl_error(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OK:                  return {};
        case CURLE_OPERATION_TIMEDOUT:  return make_error_code(StreamErrc::timeout);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL: return make_error_code(StreamErrc::invalid_url);
        case CURLE_TOO_MANY_REDIRECTS:  return make_error_code(StreamErrc::http_error);
        default:                        return make_error_code(StreamErrc::connection_error);
    }
}

// One transfer driven through its own multi handle
class CurlStream final : public HttpStream {
public:
    CurlStream() = default;
    ~CurlStream() override;

    CurlStream(const CurlStream&) = delete;
    CurlStream& operator=(const CurlStream&) = delete;

    // Start the transfer and wait for the response headers
    std::error_code start(const HttpRequest& request, bool head_only) noexcept;

    // Wait for the transfer to complete (HEAD)
    std::error_code finish() noexcept;

    [[nodiscard]] const HttpResponse& response() const noexcept override { return response_; }

    [[nodiscard]] std::expected<std::size_t, std::error_code>
    read(std::byte* buffer, std::size_t size) noexcept override;

private:
    static std::size_t on_header(char* data, std::size_t size, std::size_t nitems, void* userdata);
    static std::size_t on_body(char* data, std::size_t size, std::size_t nitems, void* userdata);

    std::error_code pump() noexcept;

    template<typename Ready>
    std::error_code wait(Ready ready, std::chrono::seconds idle_limit) noexcept;

    void capture_response();

    CURLM* multi_{nullptr};
    CURL* easy_{nullptr};
    curl_slist* header_list_{nullptr};
    bool attached_{false};

    std::map<std::string, std::string> raw_headers_;
    std::vector<std::byte> buffer_;
    std::size_t consumed_{0};
    std::uint64_t received_{0};
    bool body_started_{false};
    bool done_{false};
    CURLcode result_{CURLE_OK};

    HttpResponse response_;
    std::chrono::seconds read_timeout_{READ_TIMEOUT_SEC};
};

CurlStream::~CurlStream() {
    if (attached_) {
        curl_multi_remove_handle(multi_, easy_);
    }
    if (easy_) curl_easy_cleanup(easy_);
    if (multi_) curl_multi_cleanup(multi_);
    if (header_list_) curl_slist_free_all(header_list_);
}

std::size_t CurlStream::on_header(char* data, std::size_t size, std::size_t nitems, void* userdata) {
    const std::size_t total = size * nitems;
    auto* self = static_cast<CurlStream*>(userdata);
    self->received_ += total;

    std::string_view line(data, total);
    if (line.starts_with("HTTP/")) {
        // New response in a redirect chain
        self->raw_headers_.clear();
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos) return total;

    self->raw_headers_[lower(trim(line.substr(0, colon)))] = std::string(trim(line.substr(colon + 1)));
    return total;
}

std::size_t CurlStream::on_body(char* data, std::size_t size, std::size_t nitems, void* userdata) {
    const std::size_t total = size * nitems;
    auto* self = static_cast<CurlStream*>(userdata);

    if (!self->body_started_) {
        self->body_started_ = true;
        self->capture_response();
    }

    const auto* bytes = reinterpret_cast<const std::byte*>(data);
    self->buffer_.insert(self->buffer_.end(), bytes, bytes + total);
    self->received_ += total;
    return total;
}

void CurlStream::capture_response() {
    long status = 0;
    curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &status);

    char* effective = nullptr;
    std::string effective_url;
    if (curl_easy_getinfo(easy_, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective) {
        effective_url = effective;
    }

    response_ = HttpResponse::from_headers(status, std::move(effective_url), raw_headers_);
}

std::error_code CurlStream::start(const HttpRequest& request, bool head_only) noexcept {
    multi_ = curl_multi_init();
    easy_ = curl_easy_init();
    if (!multi_ || !easy_) {
        return make_error_code(StreamErrc::connection_error);
    }
    read_timeout_ = request.read_timeout;

    for (const auto& [name, value] : request.headers) {
        std::string line = name + ": " + value;
        curl_slist* appended = curl_slist_append(header_list_, line.c_str());
        if (!appended) {
            return make_error_code(StreamErrc::connection_error);
        }
        header_list_ = appended;
    }

    curl_easy_setopt(easy_, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(easy_, CURLOPT_HTTPHEADER, header_list_);
    curl_easy_setopt(easy_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(easy_, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    curl_easy_setopt(easy_, CURLOPT_CONNECTTIMEOUT, static_cast<long>(request.connect_timeout.count()));
    curl_easy_setopt(easy_, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(easy_, CURLOPT_LOW_SPEED_TIME, static_cast<long>(request.read_timeout.count()));
    curl_easy_setopt(easy_, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(easy_, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(easy_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(easy_, CURLOPT_BUFFERSIZE, static_cast<long>(READ_BUFFER_SIZE));
    curl_easy_setopt(easy_, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);

    curl_easy_setopt(easy_, CURLOPT_HEADERFUNCTION, &CurlStream::on_header);
    curl_easy_setopt(easy_, CURLOPT_HEADERDATA, this);
    curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, &CurlStream::on_body);
    curl_easy_setopt(easy_, CURLOPT_WRITEDATA, this);
    if (head_only) {
        curl_easy_setopt(easy_, CURLOPT_NOBODY, 1L);
    }

    if (curl_multi_add_handle(multi_, easy_) != CURLM_OK) {
        return make_error_code(StreamErrc::connection_error);
    }
    attached_ = true;

    const auto header_limit = std::max(request.connect_timeout, request.read_timeout);
    if (auto ec = wait([this] { return body_started_; }, header_limit)) {
        return ec;
    }
    if (done_ && result_ != CURLE_OK) {
        return map_curl_error(result_);
    }
    if (!body_started_) {
        capture_response();
    }
    return {};
}

std::error_code CurlStream::finish() noexcept {
    if (auto ec = wait([] { return false; }, read_timeout_)) {
        return ec;
    }
    if (result_ != CURLE_OK) {
        return map_curl_error(result_);
    }
    capture_response();
    return {};
}

std::error_code CurlStream::pump() noexcept {
    int running = 0;
    if (curl_multi_perform(multi_, &running) != CURLM_OK) {
        return make_error_code(StreamErrc::connection_error);
    }

    int queued = 0;
    while (CURLMsg* msg = curl_multi_info_read(multi_, &queued)) {
        if (msg->msg == CURLMSG_DONE) {
            done_ = true;
            result_ = msg->data.result;
        }
    }
    if (running == 0) {
        done_ = true;
        return {};
    }

    if (curl_multi_poll(multi_, nullptr, 0, POLL_INTERVAL_MS, nullptr) != CURLM_OK) {
        return make_error_code(StreamErrc::connection_error);
    }
    return {};
}

template<typename Ready>
std::error_code CurlStream::wait(Ready ready, std::chrono::seconds idle_limit) noexcept {
    auto last_activity = std::chrono::steady_clock::now();
    while (!done_ && !ready()) {
        const auto before = received_;
        if (auto ec = pump()) {
            return ec;
        }

        const auto now = std::chrono::steady_clock::now();
        if (received_ != before) {
            last_activity = now;
        } else if (now - last_activity > idle_limit) {
            return make_error_code(StreamErrc::timeout);
        }
    }
    return {};
}

std::expected<std::size_t, std::error_code>
CurlStream::read(std::byte* buffer, std::size_t size) noexcept {
    if (size == 0) {
        return 0;
    }

    if (consumed_ == buffer_.size()) {
        buffer_.clear();
        consumed_ = 0;
        if (!done_) {
            if (auto ec = wait([this] { return !buffer_.empty(); }, read_timeout_)) {
                return std::unexpected(ec);
            }
        }
    }

    if (consumed_ < buffer_.size()) {
        const std::size_t n = std::min(size, buffer_.size() - consumed_);
        std::memcpy(buffer, buffer_.data() + consumed_, n);
        consumed_ += n;
        return n;
    }

    if (result_ != CURLE_OK) {
        return std::unexpected(map_curl_error(result_));
    }
    return 0;
}

} // namespace

//=============================================================================
// HttpResponse
//=============================================================================

std::string HttpResponse::header(std::string_view name) const {
    auto it = headers.find(lower(name));
    return it == headers.end() ? std::string{} : it->second;
}

HttpResponse HttpResponse::from_headers(long status,
                                        std::string effective_url,
                                        std::map<std::string, std::string> headers) {
    HttpResponse response;
    response.status_code = status;
    response.effective_url = std::move(effective_url);
    response.headers = std::move(headers);

    if (auto length = response.headers.find("content-length"); length != response.headers.end()) {
        response.content_length = parse_number(length->second);
    }

    // "bytes 512-1023/1024", "bytes */1024"
    if (auto range = response.headers.find("content-range"); range != response.headers.end()) {
        std::string_view value = trim(range->second);
        if (value.starts_with("bytes")) {
            value = trim(value.substr(5));
            auto slash = value.find('/');
            if (slash != std::string_view::npos) {
                auto span = value.substr(0, slash);
                auto dash = span.find('-');
                if (dash != std::string_view::npos) {
                    response.range_start = parse_number(span.substr(0, dash));
                }
                response.range_total = parse_number(value.substr(slash + 1));
            }
        }
    }

    response.accepts_ranges = status == 206
        || lower(response.header("accept-ranges")).find("bytes") != std::string::npos;
    response.content_type = response.header("content-type");
    response.content_encoding = lower(response.header("content-encoding"));
    response.filename = content_disposition_filename(response.header("content-disposition"));
    return response;
}

//=============================================================================
// HttpSession
//=============================================================================

std::expected<std::unique_ptr<HttpStream>, std::error_code>
HttpSession::open(const HttpRequest& request) noexcept {
    auto log = logger("webfile.http");
    log->debug("GET {}", request.url);
    for (const auto& [name, value] : request.headers) {
        log->debug("  {}: {}", name, value);
    }

    auto stream = std::make_unique<CurlStream>();
    if (auto ec = stream->start(request, false)) {
        log->debug("GET {} failed: {}", request.url, ec.message());
        return std::unexpected(ec);
    }

    log->debug("GET {} -> {}", request.url, stream->response().status_code);
    return std::unique_ptr<HttpStream>(std::move(stream));
}

std::expected<HttpResponse, std::error_code>
HttpSession::head(const HttpRequest& request) noexcept {
    auto log = logger("webfile.http");
    log->debug("HEAD {}", request.url);

    CurlStream stream;
    std::error_code ec = stream.start(request, true);
    if (!ec) {
        ec = stream.finish();
    }
    if (ec) {
        log->debug("HEAD {} failed: {}", request.url, ec.message());
        return std::unexpected(ec);
    }

    log->debug("HEAD {} -> {}", request.url, stream.response().status_code);
    return stream.response();
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace webfile::core
