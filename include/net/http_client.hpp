#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <memory>
#include <string>

namespace espkit {

class IHttpClient {
  public:
    virtual ~IHttpClient() = default;

    // Starts a blocking GET. On success out_body streams the response body;
    // Read() returning -1 later means the transfer broke off.
    virtual Result Get(const std::string& url, std::unique_ptr<IReader>& out_body) = 0;
};

} // namespace espkit
