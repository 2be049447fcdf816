#pragma once

#include <courier/net/http_client.hpp>
#include <courier/quote/quote_source.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace courier::quote {

/// Parse a `{"quotes":[...]}` body. Throws `quote_fetch_error` on malformed
/// JSON or on fields that cannot be interpreted.
std::vector<courier::schema::route_t> parse_quote_response(
    std::string_view body);

/// Full request URL: `base_url` followed by the percent-encoded query.
std::string make_quote_url(const std::string& base_url,
                           const quote_request& request);

class stargate_quote_source final : public quote_source {
 public:
  stargate_quote_source(courier::net::http_client& http, std::string base_url);

  std::vector<courier::schema::route_t> fetch(
      const quote_request& request) override;

 private:
  courier::net::http_client& http_;
  std::string base_url_;
};

}  // namespace courier::quote
