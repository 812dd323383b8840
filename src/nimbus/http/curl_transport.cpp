// Copyright (c) 2026 changcheng967. All rights reserved.

#include <nimbus/http/curl_transport.hpp>
#include <nimbus/core/log.hpp>
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstring>
#include <string>
#include <exception>
#include <utility>
#include <vector>

namespace nimbus::http {

namespace {

constexpr int POLL_INTERVAL_MS = 100;

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
    CurlHandle(CurlHandle&& other) noexcept : ptr(std::exchange(other.ptr, nullptr)) {}
    CurlHandle& operator=(CurlHandle&&) = delete;
};

struct MultiHandle {
    CURLM* ptr = nullptr;

    MultiHandle() = default;
    explicit MultiHandle(CURLM* m) : ptr(m) {}
    ~MultiHandle() { if (ptr) curl_multi_cleanup(ptr); }

    MultiHandle(const MultiHandle&) = delete;
    MultiHandle& operator=(const MultiHandle&) = delete;
    MultiHandle(MultiHandle&& other) noexcept : ptr(std::exchange(other.ptr, nullptr)) {}
    MultiHandle& operator=(MultiHandle&&) = delete;
};

struct HeaderList {
    curl_slist* ptr = nullptr;

    HeaderList() = default;
    ~HeaderList() { if (ptr) curl_slist_free_all(ptr); }

    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;

    [[nodiscard]] bool append(const std::string& line) noexcept {
        auto* next = curl_slist_append(ptr, line.c_str());
        if (!next) {
            return false;
        }
        ptr = next;
        return true;
    }
};

std::string to_lower(std::string_view text) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lower;
}

core::Error curl_error(CURLcode code) {
    if (code == CURLE_ABORTED_BY_CALLBACK) {
        return core::Error(core::Errc::cancelled);
    }
    return core::Error(core::Errc::network_error, curl_easy_strerror(code));
}

class CurlRequest;

class RequestBody final : public io::OutputStream {
public:
    explicit RequestBody(CurlRequest& owner) noexcept : owner_(owner) {}

    [[nodiscard]] Result<void> write(std::span<const std::byte> data) noexcept override;

private:
    CurlRequest& owner_;
};

class ResponseBody final : public io::InputStream {
public:
    explicit ResponseBody(CurlRequest& owner) noexcept : owner_(owner) {}

    [[nodiscard]] Result<std::size_t> read(std::span<std::byte> buffer) noexcept override;
    [[nodiscard]] std::optional<std::uint64_t> length() const noexcept override;

private:
    CurlRequest& owner_;
};

class CurlRequest final : public HttpRequest {
public:
    CurlRequest(std::string url, std::stop_token stop, const core::ClientConfig& config,
                CurlHandle easy, MultiHandle multi)
        : url_(std::move(url))
        , stop_(std::move(stop))
        , config_(config)
        , easy_(std::move(easy))
        , multi_(std::move(multi))
        , request_body_(*this)
        , response_body_(*this) {}

    ~CurlRequest() override { detach(); }

    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    void method(HttpMethod method) override { method_ = method; }
    void protocol(HttpVersion version) override { version_ = version; }

    void header(std::string_view name, std::string_view value) override {
        auto key = to_lower(name);
        auto it = std::find_if(headers_.begin(), headers_.end(),
                               [&key](const auto& h) { return to_lower(h.first) == key; });
        if (it != headers_.end()) {
            it->second = std::string(value);
        } else {
            headers_.emplace_back(std::string(name), std::string(value));
        }
    }

    Result<io::OutputStream*> request_stream(std::optional<std::uint64_t> content_length) override {
        if (started_) {
            return std::unexpected(core::Error(core::Errc::invalid_argument, "request already sent"));
        }
        has_body_ = true;
        content_length_ = content_length;
        if (auto started = start(); !started) {
            return std::unexpected(std::move(started).error());
        }
        return &request_body_;
    }

    Result<HttpResponse*> response() override {
        if (!started_) {
            if (auto started = start(); !started) {
                return std::unexpected(std::move(started).error());
            }
        }
        if (has_body_ && !send_eof_) {
            send_eof_ = true;
            resume_send();
        }

        while (!headers_done_ && !finished_) {
            if (auto stepped = step(); !stepped) {
                return std::unexpected(std::move(stepped).error());
            }
        }
        if (!headers_done_) {
            if (result_ != CURLE_OK) {
                // A proxy refusing the CONNECT tunnel answered with a status
                long connect_code = 0;
                curl_easy_getinfo(easy_.ptr, CURLINFO_HTTP_CONNECTCODE, &connect_code);
                if (connect_code != 0 && (connect_code < 200 || connect_code >= 300)) {
                    return std::unexpected(core::Error::http_status(
                        static_cast<std::int32_t>(connect_code), nullptr,
                        "proxy answered CONNECT with " + std::to_string(connect_code)));
                }
                return std::unexpected(curl_error(result_));
            }
            long code = 0;
            curl_easy_getinfo(easy_.ptr, CURLINFO_RESPONSE_CODE, &code);
            response_.status_code = static_cast<std::int32_t>(code);
        }

        // Decoded bodies no longer match the announced length
        const auto* length = response_.header("content-length");
        if (length && !response_.header("content-encoding")) {
            std::uint64_t value = 0;
            auto [ptr, ec] = std::from_chars(length->data(), length->data() + length->size(), value);
            if (ec == std::errc{} && ptr == length->data() + length->size()) {
                response_.content_length = value;
            }
        }

        response_.body = &response_body_;
        return &response_;
    }

    void abort() noexcept override {
        detach();
        aborted_ = true;
        if (!finished_) {
            finished_ = true;
            result_ = CURLE_ABORTED_BY_CALLBACK;
        }
    }

    Result<void> push(std::span<const std::byte> data) {
        if (send_eof_) {
            return std::unexpected(core::Error(io::IoErrc::stream_closed, "request body already finished"));
        }
        send_buffer_.append(reinterpret_cast<const char*>(data.data()), data.size());

        while (send_buffer_.size() - send_offset_ >= core::UPLOAD_BUFFER_SIZE) {
            if (finished_ && headers_done_) {
                send_buffer_.clear();
                send_offset_ = 0;
                return std::unexpected(core::Error(core::Errc::answered_early,
                    "HTTP " + std::to_string(response_.status_code) + " before the request body was sent"));
            }
            if (finished_) {
                if (result_ != CURLE_OK) {
                    return std::unexpected(curl_error(result_));
                }
                return std::unexpected(core::Error(core::Errc::network_error,
                                                   "connection closed while sending the request body"));
            }
            resume_send();
            if (auto stepped = step(); !stepped) {
                return stepped;
            }
        }
        return {};
    }

    Result<std::size_t> pull(std::span<std::byte> buffer) {
        while (recv_buffer_.size() == recv_offset_ && !finished_) {
            resume_receive();
            if (auto stepped = step(); !stepped) {
                return std::unexpected(std::move(stepped).error());
            }
        }

        const auto available = recv_buffer_.size() - recv_offset_;
        if (available == 0) {
            // A send failure after the whole announced body arrived still
            // leaves a readable response
            const bool complete = response_.content_length && received_ == *response_.content_length;
            if (result_ != CURLE_OK && !complete) {
                return std::unexpected(curl_error(result_));
            }
            return 0;
        }

        const auto n = std::min(available, buffer.size());
        std::memcpy(buffer.data(), recv_buffer_.data() + recv_offset_, n);
        recv_offset_ += n;
        if (recv_offset_ == recv_buffer_.size()) {
            recv_buffer_.clear();
            recv_offset_ = 0;
        }
        return n;
    }

    [[nodiscard]] std::optional<std::uint64_t> content_length() const noexcept {
        return response_.content_length;
    }

private:
    Result<void> start() {
        if (aborted_) {
            return std::unexpected(core::Error(core::Errc::cancelled, "request aborted"));
        }
        CURL* curl = easy_.ptr;
        started_ = true;

        curl_easy_setopt(curl, CURLOPT_URL, url_.c_str());
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, core::FOLLOW_REDIRECTS ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(core::MAX_REDIRECTS));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(config_.connect_timeout_sec));
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(config_.stall_timeout_sec));
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
        curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "gzip");
        curl_easy_setopt(curl, CURLOPT_VERBOSE, config_.verbose ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_HTTP_VERSION,
                         static_cast<long>(version_ == HttpVersion::http2 ? CURL_HTTP_VERSION_2TLS
                                                                          : CURL_HTTP_VERSION_1_1));

        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &CurlRequest::header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, this);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &CurlRequest::write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, this);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, &CurlRequest::xferinfo_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, this);

        const auto verb = std::string(to_string(method_));
        if (has_body_) {
            curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, &CurlRequest::read_callback);
            curl_easy_setopt(curl, CURLOPT_READDATA, this);
            if (content_length_) {
                curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(*content_length_));
            }
            if (method_ != HttpMethod::put) {
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, verb.c_str());
            }
        } else if (method_ == HttpMethod::get) {
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        } else if (method_ == HttpMethod::del) {
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, verb.c_str());
        } else {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, "");
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(0));
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, verb.c_str());
        }

        for (const auto& [name, value] : headers_) {
            // "Name;" is how curl sends a header with an empty value
            if (!header_list_.append(value.empty() ? name + ";" : name + ": " + value)) {
                return std::unexpected(core::Error(core::Errc::network_error, "out of memory"));
            }
        }
        if (has_body_ && !content_length_ && !header_list_.append("Transfer-Encoding: chunked")) {
            return std::unexpected(core::Error(core::Errc::network_error, "out of memory"));
        }
        if (!header_list_.append("Expect:")) {
            return std::unexpected(core::Error(core::Errc::network_error, "out of memory"));
        }
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list_.ptr);

        if (auto mc = curl_multi_add_handle(multi_.ptr, curl); mc != CURLM_OK) {
            return std::unexpected(core::Error(core::Errc::network_error, curl_multi_strerror(mc)));
        }
        attached_ = true;

        core::logger()->debug("{} {}", verb, url_);
        return {};
    }

    // One round of transfer work. Waits for socket activity unless the
    // transfer finished.
    Result<void> step() {
        if (stop_.stop_requested()) {
            abort();
            return std::unexpected(core::Error(core::Errc::cancelled));
        }
        if (finished_) {
            return {};
        }

        int running = 0;
        if (auto mc = curl_multi_perform(multi_.ptr, &running); mc != CURLM_OK) {
            return std::unexpected(core::Error(core::Errc::network_error, curl_multi_strerror(mc)));
        }

        int pending = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi_.ptr, &pending)) {
            if (msg->msg == CURLMSG_DONE && msg->easy_handle == easy_.ptr) {
                finished_ = true;
                result_ = msg->data.result;
                if (result_ != CURLE_OK && result_ != CURLE_ABORTED_BY_CALLBACK) {
                    core::logger()->warn("{} failed: {}", url_, curl_easy_strerror(result_));
                }
            }
        }
        if (finished_) {
            detach();
            return {};
        }

        if (auto mc = curl_multi_poll(multi_.ptr, nullptr, 0, POLL_INTERVAL_MS, nullptr); mc != CURLM_OK) {
            return std::unexpected(core::Error(core::Errc::network_error, curl_multi_strerror(mc)));
        }
        return {};
    }

    void apply_pause() noexcept {
        int mask = CURLPAUSE_CONT;
        if (send_paused_) mask |= CURLPAUSE_SEND;
        if (recv_paused_) mask |= CURLPAUSE_RECV;
        curl_easy_pause(easy_.ptr, mask);
    }

    void resume_send() noexcept {
        if (send_paused_ && attached_) {
            send_paused_ = false;
            apply_pause();
        }
    }

    void resume_receive() noexcept {
        if (recv_paused_ && attached_) {
            recv_paused_ = false;
            apply_pause();
        }
    }

    void detach() noexcept {
        if (attached_) {
            curl_multi_remove_handle(multi_.ptr, easy_.ptr);
            attached_ = false;
        }
    }

    static std::size_t read_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
        auto* self = static_cast<CurlRequest*>(userdata);
        const auto available = self->send_buffer_.size() - self->send_offset_;
        if (available == 0) {
            if (self->send_eof_) {
                return 0;
            }
            self->send_paused_ = true;
            return CURL_READFUNC_PAUSE;
        }

        const auto n = std::min(available, size * nitems);
        std::memcpy(buffer, self->send_buffer_.data() + self->send_offset_, n);
        self->send_offset_ += n;
        if (self->send_offset_ == self->send_buffer_.size()) {
            self->send_buffer_.clear();
            self->send_offset_ = 0;
        }
        return n;
    }

    static std::size_t write_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) {
        auto* self = static_cast<CurlRequest*>(userdata);
        if (self->recv_buffer_.size() - self->recv_offset_ >= core::RECEIVE_BUFFER_LIMIT) {
            self->recv_paused_ = true;
            return CURL_WRITEFUNC_PAUSE;
        }
        const std::size_t total = size * nitems;
        self->recv_buffer_.append(ptr, total);
        self->received_ += total;
        return total;
    }

    static std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
        auto* self = static_cast<CurlRequest*>(userdata);
        const std::size_t total = size * nitems;
        std::string_view line(buffer, total);

        // A new status line starts a new header block (interim or redirect)
        if (line.starts_with("HTTP/")) {
            self->response_.headers.clear();
            self->headers_done_ = false;
            return total;
        }

        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
            line.remove_suffix(1);
        }

        if (line.empty()) {
            long code = 0;
            curl_easy_getinfo(self->easy_.ptr, CURLINFO_RESPONSE_CODE, &code);
            const bool redirect = core::FOLLOW_REDIRECTS && code >= 300 && code < 400
                && self->response_.headers.contains("location");
            if (code >= 200 && !redirect) {
                self->response_.status_code = static_cast<std::int32_t>(code);
                self->headers_done_ = true;
            }
            return total;
        }

        auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            return total;
        }
        auto value = line.substr(colon + 1);
        while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
            value.remove_prefix(1);
        }
        self->response_.headers[to_lower(line.substr(0, colon))] = std::string(value);
        return total;
    }

    static int xferinfo_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        auto* self = static_cast<CurlRequest*>(userdata);
        return self->stop_.stop_requested() ? 1 : 0;
    }

    std::string url_;
    std::stop_token stop_;
    core::ClientConfig config_;
    CurlHandle easy_;
    MultiHandle multi_;
    HeaderList header_list_;

    HttpMethod method_{HttpMethod::get};
    HttpVersion version_{HttpVersion::http1_1};
    std::vector<std::pair<std::string, std::string>> headers_;

    bool started_{false};
    bool attached_{false};
    bool aborted_{false};
    bool finished_{false};
    CURLcode result_{CURLE_OK};

    bool has_body_{false};
    std::optional<std::uint64_t> content_length_;
    std::string send_buffer_;
    std::size_t send_offset_{0};
    bool send_eof_{false};
    bool send_paused_{false};

    std::string recv_buffer_;
    std::size_t recv_offset_{0};
    std::uint64_t received_{0};
    bool recv_paused_{false};
    bool headers_done_{false};

    HttpResponse response_;
    RequestBody request_body_;
    ResponseBody response_body_;
};

Result<void> RequestBody::write(std::span<const std::byte> data) noexcept {
    try {
        return owner_.push(data);
    } catch (const std::exception& e) {
        return std::unexpected(core::Error(io::IoErrc::write_error, e.what()));
    }
}

Result<std::size_t> ResponseBody::read(std::span<std::byte> buffer) noexcept {
    try {
        return owner_.pull(buffer);
    } catch (const std::exception& e) {
        return std::unexpected(core::Error(io::IoErrc::read_error, e.what()));
    }
}

std::optional<std::uint64_t> ResponseBody::length() const noexcept {
    return owner_.content_length();
}

} // namespace

//=============================================================================
// CurlTransport
//=============================================================================

CurlTransport::CurlTransport(core::ClientConfig config)
    : config_(std::move(config)) {}

Result<std::unique_ptr<HttpRequest>> CurlTransport::create_request(const std::string& url, std::stop_token stop) {
    if (url.empty()) {
        return std::unexpected(core::Error(core::Errc::invalid_url, "empty URL"));
    }

    CurlHandle easy(curl_easy_init());
    MultiHandle multi(curl_multi_init());
    if (!easy.ptr || !multi.ptr) {
        return std::unexpected(core::Error(core::Errc::network_error, "curl initialization failed"));
    }

    return std::make_unique<CurlRequest>(url, std::move(stop), config_, std::move(easy), std::move(multi));
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void CurlTransport::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void CurlTransport::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace nimbus::http
