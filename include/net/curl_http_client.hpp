#pragma once

#include "net/http_client.hpp"

#include <string>

namespace espkit {

// libcurl-backed client. Responses are pulled through the multi interface,
// so the body is never buffered whole in memory.
class CurlHttpClient final : public IHttpClient {
  public:
    struct Options {
        long max_redirects = 5;
        long connect_timeout_sec = 30;
        // Abort when the transfer stays below 1 byte/s for this long.
        long stall_timeout_sec = 60;
        std::string user_agent = "espkit/1.0";
    };

    CurlHttpClient();
    explicit CurlHttpClient(Options opt);

    Result Get(const std::string& url, std::unique_ptr<IReader>& out_body) override;

  private:
    Options opt_;
};

} // namespace espkit
