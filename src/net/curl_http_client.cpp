#include "net/curl_http_client.hpp"

#include "fetch/fetch_error.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cstring>
#include <mutex>
#include <vector>

namespace espkit {

namespace {

void GlobalInitOnce() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

class CurlResponseReader final : public IReader {
  public:
    CurlResponseReader() = default;
    CurlResponseReader(const CurlResponseReader&) = delete;
    CurlResponseReader& operator=(const CurlResponseReader&) = delete;

    ~CurlResponseReader() override {
        if (multi_ && easy_) curl_multi_remove_handle(multi_, easy_);
        if (easy_) curl_easy_cleanup(easy_);
        if (multi_) curl_multi_cleanup(multi_);
    }

    Result Start(const std::string& url, const CurlHttpClient::Options& opt) {
        url_ = url;
        easy_ = curl_easy_init();
        multi_ = curl_multi_init();
        if (!easy_ || !multi_) {
            return Result::Fail(ToErr(FetchError::Network), "Cannot initialize curl");
        }

        curl_easy_setopt(easy_, CURLOPT_URL, url_.c_str());
        curl_easy_setopt(easy_, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(easy_, CURLOPT_MAXREDIRS, opt.max_redirects);
        curl_easy_setopt(easy_, CURLOPT_CONNECTTIMEOUT, opt.connect_timeout_sec);
        curl_easy_setopt(easy_, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(easy_, CURLOPT_LOW_SPEED_TIME, opt.stall_timeout_sec);
        curl_easy_setopt(easy_, CURLOPT_USERAGENT, opt.user_agent.c_str());
        // Turn HTTP >= 400 into a transfer error instead of saving an error page.
        curl_easy_setopt(easy_, CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(easy_, CURLOPT_ERRORBUFFER, errbuf_);
        curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, &CurlResponseReader::WriteCb);
        curl_easy_setopt(easy_, CURLOPT_WRITEDATA, this);

        if (curl_multi_add_handle(multi_, easy_) != CURLM_OK) {
            return Result::Fail(ToErr(FetchError::Network), "curl_multi_add_handle failed");
        }

        // Run until the first body bytes arrive so that DNS, TLS and HTTP
        // status errors surface here rather than on the first Read().
        Pump();
        if (!status_.is_ok()) return status_;
        return Result::Ok();
    }

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (read_pos_ == buffer_.size()) {
            buffer_.clear();
            read_pos_ = 0;
            Pump();
        }
        if (read_pos_ == buffer_.size()) {
            return status_.is_ok() ? 0 : -1;
        }

        const size_t n = std::min(out.size(), buffer_.size() - read_pos_);
        std::memcpy(out.data(), buffer_.data() + read_pos_, n);
        read_pos_ += n;
        return static_cast<ssize_t>(n);
    }

    std::optional<std::uint64_t> TotalSize() const override {
        curl_off_t len = -1;
        if (curl_easy_getinfo(easy_, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &len) != CURLE_OK || len < 0) {
            return std::nullopt;
        }
        return static_cast<std::uint64_t>(len);
    }

  private:
    static size_t WriteCb(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* self = static_cast<CurlResponseReader*>(userdata);
        const size_t n = size * nmemb;
        self->buffer_.insert(self->buffer_.end(), ptr, ptr + n);
        return n;
    }

    void Fail(std::string msg) {
        LogError("%s", msg.c_str());
        status_ = Result::Fail(ToErr(FetchError::Network), std::move(msg));
        done_ = true;
    }

    // Drives the transfer until there is unread data or it has finished.
    void Pump() {
        while (read_pos_ == buffer_.size() && !done_) {
            if (g_cancel.load(std::memory_order_relaxed)) {
                Fail("Download cancelled: " + url_);
                return;
            }

            int running = 0;
            const CURLMcode mc = curl_multi_perform(multi_, &running);
            if (mc != CURLM_OK) {
                Fail("curl_multi_perform: " + std::string(curl_multi_strerror(mc)));
                return;
            }

            if (running == 0) {
                int queued = 0;
                while (CURLMsg* m = curl_multi_info_read(multi_, &queued)) {
                    if (m->msg == CURLMSG_DONE && m->data.result != CURLE_OK) {
                        const std::string detail =
                            errbuf_[0] ? std::string(errbuf_) : curl_easy_strerror(m->data.result);
                        Fail("Download failed: " + url_ + " (" + detail + ")");
                        return;
                    }
                }
                done_ = true;
                return;
            }

            if (read_pos_ < buffer_.size()) return;

            const CURLMcode pc = curl_multi_poll(multi_, nullptr, 0, 1000, nullptr);
            if (pc != CURLM_OK) {
                Fail("curl_multi_poll: " + std::string(curl_multi_strerror(pc)));
                return;
            }
        }
    }

    std::string url_;
    CURL* easy_ = nullptr;
    CURLM* multi_ = nullptr;
    char errbuf_[CURL_ERROR_SIZE]{};
    std::vector<std::uint8_t> buffer_;
    size_t read_pos_ = 0;
    bool done_ = false;
    Result status_;
};

} // namespace

CurlHttpClient::CurlHttpClient() : CurlHttpClient(Options{}) {}

CurlHttpClient::CurlHttpClient(Options opt) : opt_(std::move(opt)) { GlobalInitOnce(); }

Result CurlHttpClient::Get(const std::string& url, std::unique_ptr<IReader>& out_body) {
    LogDebug("GET %s", url.c_str());
    auto reader = std::make_unique<CurlResponseReader>();
    auto res = reader->Start(url, opt_);
    if (!res.is_ok()) return res;
    out_body = std::move(reader);
    return Result::Ok();
}

} // namespace espkit
