#pragma once

#include <courier/execution/ledger_client.hpp>
#include <courier/net/http_client.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace courier::execution {

struct confirmation_options final {
  /// Give up waiting for a receipt after this long; 0 waits forever.
  uint64_t timeout_ms{120000};
  uint64_t poll_interval_ms{2000};
};

/// Ledger client speaking Ethereum JSON-RPC to a node that holds the sender
/// key (`eth_sendTransaction`), polling `eth_getTransactionReceipt`.
class json_rpc_ledger_client final : public ledger_client {
 public:
  json_rpc_ledger_client(courier::net::http_client& http,
                         std::string endpoint,
                         const courier::schema::address_t& from,
                         confirmation_options options = {});

  submission_handle_t submit(
      const courier::schema::address_t& to,
      const courier::schema::bytes_t& data,
      const std::optional<courier::schema::amount_t>& value) override;

  courier::schema::confirmation_t await_confirmation(
      const submission_handle_t& handle) override;

 private:
  nlohmann::json call(const std::string& method, nlohmann::json params);

  courier::net::http_client& http_;
  std::string endpoint_;
  courier::schema::address_t from_;
  confirmation_options options_;
  uint64_t next_id_{1};
};

}  // namespace courier::execution
