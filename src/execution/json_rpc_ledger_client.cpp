#include <courier/common/error.hpp>
#include <courier/execution/json_rpc_ledger_client.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <limits>
#include <thread>

using namespace courier::schema;
using json = nlohmann::json;

namespace {

using courier::common::error_code;
using courier::common::ledger_error;

uint64_t quantity_to_u64(const json& receipt, const char* name) {
  auto it = receipt.find(name);
  if (it == receipt.end() || !it->is_string()) {
    throw ledger_error{error_code::ledger_rejected,
                       fmt::format("receipt field '{}' is missing", name)};
  }
  auto value = try_make_amount(it->get<std::string>());
  if (!value || *value > std::numeric_limits<uint64_t>::max()) {
    throw ledger_error{error_code::ledger_rejected,
                       fmt::format("receipt field '{}' is not a quantity: {}",
                                   name, it->get<std::string>())};
  }
  return value->convert_to<uint64_t>();
}

}  // namespace

namespace courier::execution {

json_rpc_ledger_client::json_rpc_ledger_client(
    courier::net::http_client& http,
    std::string endpoint,
    const address_t& from,
    const confirmation_options options)
    : http_{http},
      endpoint_{std::move(endpoint)},
      from_{from},
      options_{options} {}

json json_rpc_ledger_client::call(const std::string& method, json params) {
  auto request = json{{"jsonrpc", "2.0"},
                      {"id", next_id_++},
                      {"method", method},
                      {"params", std::move(params)}};

  auto response = courier::net::http_response{};
  try {
    response = http_.post(endpoint_, request.dump(),
                          {{"Content-Type", "application/json"}});
  } catch (const courier::common::http_error& ex) {
    throw ledger_error{error_code::ledger_transport,
                       fmt::format("{} failed: {}", method, ex.what())};
  }
  if (!response.ok()) {
    throw ledger_error{error_code::ledger_transport,
                       fmt::format("{} failed with HTTP {}", method,
                                   response.status)};
  }

  auto document = json::parse(response.body, nullptr, false);
  if (document.is_discarded() || !document.is_object()) {
    throw ledger_error{error_code::ledger_transport,
                       fmt::format("{} returned a non JSON-RPC body", method)};
  }
  auto error = document.find("error");
  if (error != document.end() && !error->is_null()) {
    auto message = error->is_object() && error->contains("message") &&
                           (*error)["message"].is_string()
                       ? (*error)["message"].get<std::string>()
                       : error->dump();
    throw ledger_error{error_code::ledger_rejected,
                       fmt::format("{} rejected: {}", method, message)};
  }
  auto result = document.find("result");
  if (result == document.end()) {
    throw ledger_error{error_code::ledger_transport,
                       fmt::format("{} response has no result", method)};
  }
  return *result;
}

submission_handle_t json_rpc_ledger_client::submit(
    const address_t& to,
    const bytes_t& data,
    const std::optional<amount_t>& value) {
  auto transaction = json{{"from", courier::schema::to_string(from_)},
                          {"to", courier::schema::to_string(to)},
                          {"data", to_0x_hex(data)}};
  if (value) {
    transaction["value"] = to_hex_quantity(*value);
  }
  spdlog::debug("eth_sendTransaction to {} ({} bytes of data)",
                courier::schema::to_string(to), data.size());

  auto result = call("eth_sendTransaction", json::array({transaction}));
  auto handle = result.is_string() ? try_make_hash32(result.get<std::string>())
                                   : std::nullopt;
  if (!handle) {
    throw ledger_error{
        error_code::ledger_rejected,
        fmt::format("eth_sendTransaction returned no transaction hash: {}",
                    result.dump())};
  }
  return *handle;
}

confirmation_t json_rpc_ledger_client::await_confirmation(
    const submission_handle_t& handle) {
  const auto hash = courier::schema::to_string(handle);
  const auto started = std::chrono::steady_clock::now();
  const auto timeout = std::chrono::milliseconds{options_.timeout_ms};
  spdlog::info("Waiting for receipt of {}", hash);

  while (true) {
    auto receipt = json{};
    try {
      receipt = call("eth_getTransactionReceipt", json::array({hash}));
    } catch (const ledger_error& ex) {
      if (ex.code() != error_code::ledger_transport) {
        throw;
      }
      // The transaction may already be mined; keep polling until timeout.
      spdlog::warn("Receipt poll for {} failed, retrying: {}", hash,
                   ex.what());
    }
    if (receipt.is_object()) {
      auto confirmation = confirmation_t{};
      confirmation.transaction_hash = handle;
      confirmation.block_number = quantity_to_u64(receipt, "blockNumber");
      confirmation.status = quantity_to_u64(receipt, "status") == 1
                                ? confirmation_status::success
                                : confirmation_status::failure;
      auto gas_used = receipt.find("gasUsed");
      if (gas_used != receipt.end() && gas_used->is_string()) {
        confirmation.gas_used =
            try_make_amount(gas_used->get<std::string>()).value_or(0);
      }
      spdlog::debug("Receipt for {}: status={} block={}", hash,
                    courier::schema::to_string(confirmation.status),
                    confirmation.block_number);
      return confirmation;
    }
    if (!receipt.is_null()) {
      throw ledger_error{error_code::ledger_rejected,
                         fmt::format("unexpected receipt for {}: {}", hash,
                                     receipt.dump())};
    }

    if (options_.timeout_ms != 0 &&
        std::chrono::steady_clock::now() - started >= timeout) {
      throw ledger_error{
          error_code::confirmation_timeout,
          fmt::format("no receipt for {} after {} ms", hash,
                      options_.timeout_ms)};
    }
    std::this_thread::sleep_for(
        std::chrono::milliseconds{options_.poll_interval_ms});
  }
}

}  // namespace courier::execution
