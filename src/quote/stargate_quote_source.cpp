#include <courier/common/error.hpp>
#include <courier/quote/stargate_quote_source.hpp>
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <array>
#include <memory>
#include <utility>

using namespace courier::schema;
using json = nlohmann::json;

namespace {

[[noreturn]] void malformed(const std::string& message) {
  throw courier::common::quote_fetch_error{"malformed quote response: " +
                                           message};
}

using curl_ptr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using curl_string_ptr = std::unique_ptr<char, decltype(&curl_free)>;

std::string percent_encode(CURL* curl, const std::string& value) {
  auto escaped = curl_string_ptr{
      curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size())),
      curl_free};
  if (!escaped) {
    throw courier::common::quote_fetch_error{
        fmt::format("cannot percent-encode '{}'", value)};
  }
  return std::string{escaped.get()};
}

std::string string_field(const json& object,
                         const char* name,
                         const std::string& fallback = {}) {
  auto it = object.find(name);
  if (it == object.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_string()) {
    malformed(fmt::format("field '{}' is not a string", name));
  }
  return it->get<std::string>();
}

amount_t amount_field(const json& object, const char* name) {
  auto it = object.find(name);
  if (it == object.end() || it->is_null()) {
    return amount_t{0};
  }
  auto amount = std::optional<amount_t>{};
  if (it->is_string()) {
    amount = try_make_amount(it->get<std::string>());
  } else if (it->is_number_unsigned()) {
    amount = amount_t{it->get<uint64_t>()};
  }
  if (!amount) {
    malformed(fmt::format("field '{}' is not an unsigned amount", name));
  }
  return *amount;
}

std::optional<address_t> address_field(const json& object, const char* name) {
  auto text = string_field(object, name);
  if (text.empty()) {
    return std::nullopt;
  }
  auto address = try_make_address(text);
  if (!address) {
    malformed(fmt::format("field '{}' is not an address: {}", name, text));
  }
  return address;
}

transaction_skeleton_t parse_transaction(const json& object) {
  auto skeleton = transaction_skeleton_t{};
  auto data = string_field(object, "data");
  auto bytes = try_from_hex(data);
  if (!bytes) {
    malformed(fmt::format("transaction data is not hex: {}", data));
  }
  skeleton.data = std::move(*bytes);
  skeleton.to = address_field(object, "to");
  skeleton.value = amount_field(object, "value");
  skeleton.from = address_field(object, "from");
  return skeleton;
}

step_t parse_step(const json& object) {
  if (!object.is_object()) {
    malformed("step is not an object");
  }
  auto step = step_t{};
  step.kind = string_field(object, "type");
  step.sender = string_field(object, "sender");
  step.chain_key = string_field(object, "chainKey");
  auto it = object.find("transaction");
  if (it != object.end() && it->is_object()) {
    step.transaction = parse_transaction(*it);
  }
  return step;
}

route_t parse_route(const json& object) {
  if (!object.is_object()) {
    malformed("quote is not an object");
  }
  auto route = route_t{};
  route.id = string_field(object, "route");
  auto error = object.find("error");
  if (error != object.end() && !error->is_null()) {
    route.error = error->is_string() ? error->get<std::string>() : error->dump();
  }
  route.source = route_endpoint{.token = string_field(object, "srcToken"),
                                .chain_key = string_field(object, "srcChainKey"),
                                .address = string_field(object, "srcAddress")};
  route.destination =
      route_endpoint{.token = string_field(object, "dstToken"),
                     .chain_key = string_field(object, "dstChainKey"),
                     .address = string_field(object, "dstAddress")};
  route.source_amount = amount_field(object, "srcAmount");
  route.destination_amount = amount_field(object, "dstAmount");

  auto fees = object.find("fees");
  if (fees != object.end() && fees->is_array()) {
    for (const auto& fee : *fees) {
      route.fees.push_back(
          fee_line_item{.token = string_field(fee, "token"),
                        .chain_key = string_field(fee, "chainKey"),
                        .amount = amount_field(fee, "amount"),
                        .type = string_field(fee, "type")});
    }
  }

  auto steps = object.find("steps");
  if (steps != object.end() && steps->is_array()) {
    for (const auto& step : *steps) {
      route.steps.push_back(parse_step(step));
    }
  }
  return route;
}

}  // namespace

namespace courier::quote {

std::vector<route_t> parse_quote_response(std::string_view body) {
  auto document = json::parse(body, nullptr, false);
  if (document.is_discarded()) {
    malformed("body is not valid JSON");
  }
  if (!document.is_object()) {
    malformed("body is not a JSON object");
  }
  auto quotes = document.find("quotes");
  if (quotes == document.end() || !quotes->is_array()) {
    malformed("missing 'quotes' array");
  }

  auto routes = std::vector<route_t>{};
  routes.reserve(quotes->size());
  for (const auto& quote : *quotes) {
    try {
      routes.push_back(parse_route(quote));
    } catch (const courier::common::quote_fetch_error& ex) {
      auto id = std::string{"<unnamed>"};
      if (quote.is_object() && quote.contains("route") &&
          quote["route"].is_string()) {
        id = quote["route"].get<std::string>();
      }
      spdlog::warn("Dropping route '{}': {}", id, ex.what());
    }
  }
  return routes;
}

std::string make_quote_url(const std::string& base_url,
                           const quote_request& request) {
  const auto params = std::array{
      std::pair<std::string_view, std::string>{"srcToken", request.src_token},
      std::pair<std::string_view, std::string>{"srcChainKey",
                                               request.src_chain_key},
      std::pair<std::string_view, std::string>{"dstToken", request.dst_token},
      std::pair<std::string_view, std::string>{"dstChainKey",
                                               request.dst_chain_key},
      std::pair<std::string_view, std::string>{"srcAddress",
                                               request.src_address},
      std::pair<std::string_view, std::string>{"dstAddress",
                                               request.dst_address},
      std::pair<std::string_view, std::string>{"srcAmount",
                                               courier::schema::to_string(request.src_amount)},
      std::pair<std::string_view, std::string>{
          "dstAmountMin", courier::schema::to_string(request.dst_amount_min)},
  };

  auto curl = curl_ptr{curl_easy_init(), curl_easy_cleanup};
  if (!curl) {
    throw courier::common::quote_fetch_error{"curl_easy_init failed"};
  }

  auto url = base_url;
  auto separator = base_url.find('?') == std::string::npos ? '?' : '&';
  for (const auto& [name, value] : params) {
    url.push_back(separator);
    url.append(name);
    url.push_back('=');
    url.append(percent_encode(curl.get(), value));
    separator = '&';
  }
  return url;
}

stargate_quote_source::stargate_quote_source(courier::net::http_client& http,
                                             std::string base_url)
    : http_{http}, base_url_{std::move(base_url)} {}

std::vector<route_t> stargate_quote_source::fetch(
    const quote_request& request) {
  auto url = make_quote_url(base_url_, request);
  spdlog::info("Fetching quote: {}", url);

  auto response = courier::net::http_response{};
  try {
    response = http_.get(url, {{"Accept", "application/json"}});
  } catch (const courier::common::http_error& ex) {
    throw courier::common::quote_fetch_error{
        fmt::format("quote request failed: {}", ex.what())};
  }
  if (!response.ok()) {
    throw courier::common::quote_fetch_error{
        fmt::format("quote request failed with HTTP {}: {}", response.status,
                    response.body)};
  }

  auto routes = parse_quote_response(response.body);
  spdlog::info("Quote returned {} route(s)", routes.size());
  for (const auto& route : routes) {
    if (route.error) {
      spdlog::warn("Route '{}' reports error: {}", route.id, *route.error);
    }
  }
  return routes;
}

}  // namespace courier::quote
