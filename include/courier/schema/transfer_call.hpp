#pragma once
#include <courier/schema/fee_quote.hpp>
#include <courier/schema/primitives.hpp>
#include <courier/schema/transfer_parameters.hpp>

// Schema type: transfer call.
// Bridge call: decoded arguments of the transfer call. Only `refund_address`
// is rewritten before submission.
namespace courier::schema {

template <uint16_t Version>
struct transfer_call;

template <>
struct transfer_call<1> final {
  uint16_t version{1};
  transfer_parameters_t parameters;
  fee_quote_t fee;
  address_t refund_address{};

  bool operator==(const transfer_call&) const = default;
};

using transfer_call_t = transfer_call<1>;
}  // namespace courier::schema
