#pragma once
#include <courier/schema/primitives.hpp>
#include <courier/schema/step.hpp>
#include <optional>
#include <string>
#include <vector>

// Schema type: route.
// Quote response: one candidate path for the cross-chain transfer. Immutable
// once produced by the quote source.
namespace courier::schema {

struct fee_line_item final {
  std::string token;
  std::string chain_key;
  amount_t amount{};
  std::string type;

  bool operator==(const fee_line_item&) const = default;
};

struct route_endpoint final {
  std::string token;
  std::string chain_key;
  std::string address;

  bool operator==(const route_endpoint&) const = default;
};

template <uint16_t Version>
struct route;

template <>
struct route<1> final {
  uint16_t version{1};
  std::string id;
  std::optional<std::string> error;
  route_endpoint source;
  route_endpoint destination;
  amount_t source_amount{};
  amount_t destination_amount{};
  std::vector<fee_line_item> fees;
  std::vector<step_t> steps;

  bool operator==(const route&) const = default;
};

using route_t = route<1>;
}  // namespace courier::schema
