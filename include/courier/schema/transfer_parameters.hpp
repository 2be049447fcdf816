#pragma once
#include <courier/schema/primitives.hpp>

// Schema type: transfer parameters.
// Bridge call: first argument of the transfer call; destination endpoint,
// recipient, amounts and the three opaque option payloads.
namespace courier::schema {

template <uint16_t Version>
struct transfer_parameters;

template <>
struct transfer_parameters<1> final {
  uint16_t version{1};
  uint32_t destination_endpoint_id{};
  hash32_t recipient{};
  amount_t amount{};
  amount_t minimum_amount{};
  bytes_t extra_options;
  bytes_t compose_message;
  bytes_t operation_command;

  bool operator==(const transfer_parameters&) const = default;
};

using transfer_parameters_t = transfer_parameters<1>;
}  // namespace courier::schema
