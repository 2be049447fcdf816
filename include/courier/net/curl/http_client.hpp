#pragma once

#include <courier/net/http_client.hpp>
#include <cstdint>
#include <string>

namespace courier::net {

struct curl_options final {
  uint64_t timeout_ms{30000};
  uint64_t connect_timeout_ms{10000};
  std::string user_agent{"courier/0.1"};
};

/// libcurl easy-handle transport. One handle per request; the global curl
/// state lives as long as the client.
class curl_http_client final : public http_client {
 public:
  explicit curl_http_client(curl_options options = {});
  ~curl_http_client() override;

  curl_http_client(const curl_http_client&) = delete;
  curl_http_client& operator=(const curl_http_client&) = delete;

  http_response get(const std::string& url,
                    const http_headers_t& headers) override;

  http_response post(const std::string& url,
                     const std::string& body,
                     const http_headers_t& headers) override;

 private:
  http_response perform(const std::string& url,
                        const std::string* body,
                        const http_headers_t& headers);

  curl_options options_;
};

}  // namespace courier::net
