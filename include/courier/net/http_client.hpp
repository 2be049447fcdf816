#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace courier::net {

using http_headers_t = std::map<std::string, std::string>;

struct http_response final {
  long status{};
  std::string body;

  bool ok() const { return status >= 200 && status < 300; }
};

/// Blocking HTTP transport. Transport failures (DNS, TLS, timeout) throw
/// `courier::common::http_error`; any HTTP status is returned to the caller.
class http_client {
 public:
  virtual ~http_client() = default;

  virtual http_response get(const std::string& url,
                            const http_headers_t& headers) = 0;

  virtual http_response post(const std::string& url,
                             const std::string& body,
                             const http_headers_t& headers) = 0;
};

}  // namespace courier::net
