#pragma once

#include <courier/execution/json_rpc_ledger_client.hpp>
#include <courier/quote/quote_source.hpp>
#include <courier/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace courier::config {

inline constexpr auto kDefaultRefundAddress =
    std::string_view{"0xdeadbeefdeadbeefdeadbeefdeadbeefdeadbeef"};
inline constexpr auto kDefaultSourceToken =
    std::string_view{"0x833589fCD6eDb6E08f4c7C32D4f71b54bdA02913"};
inline constexpr auto kDefaultDestinationToken =
    std::string_view{"0xaf88d065e77c8cC2239327C5EDb3A432268e5831"};
inline constexpr auto kDefaultQuoteUrl =
    std::string_view{"https://stargate.finance/api/v1/quotes"};
inline constexpr auto kDefaultRoutePrefix = std::string_view{"stargate/"};

struct run_config final {
  std::string rpc_url;
  courier::schema::address_t from{};
  courier::schema::address_t refund_override{};
  courier::quote::quote_request quote;
  std::string quote_url;
  std::string route_prefix;
  courier::execution::confirmation_options confirmation;
  uint64_t http_timeout_ms{30000};
  std::string log_file;
  bool verbose{false};
};

/// Parse the command line. Returns std::nullopt after printing usage to
/// `help` when `--help` is given. Throws `courier::common::error` with
/// `invalid_configuration` for missing or unparsable values.
std::optional<run_config> parse_run_config(int argc,
                                           const char* const argv[],
                                           std::ostream& help);

}  // namespace courier::config
