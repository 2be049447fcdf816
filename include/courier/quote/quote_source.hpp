#pragma once

#include <courier/schema/primitives.hpp>
#include <courier/schema/route.hpp>
#include <string>
#include <vector>

namespace courier::quote {

/// Query parameters of one quote request. Values travel as the text the
/// quote service expects; amounts are base-unit decimal strings.
struct quote_request final {
  std::string src_token;
  std::string src_chain_key;
  std::string dst_token;
  std::string dst_chain_key;
  std::string src_address;
  std::string dst_address;
  courier::schema::amount_t src_amount{};
  courier::schema::amount_t dst_amount_min{};
};

/// Source of candidate routes. Throws `courier::common::quote_fetch_error`
/// when no usable response is obtained.
class quote_source {
 public:
  virtual ~quote_source() = default;

  virtual std::vector<courier::schema::route_t> fetch(
      const quote_request& request) = 0;
};

/// Keep routes whose identifier starts with `prefix`, in their original
/// order. Throws `courier::common::no_matching_route_error` when none remain.
std::vector<courier::schema::route_t> select_routes(
    std::vector<courier::schema::route_t> routes,
    const std::string& prefix);

}  // namespace courier::quote
