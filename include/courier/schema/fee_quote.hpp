#pragma once
#include <courier/schema/primitives.hpp>

// Schema type: fee quote.
// Bridge call: messaging fee paid in native currency and in the alternate
// fee token. Carried through unchanged.
namespace courier::schema {

template <uint16_t Version>
struct fee_quote;

template <>
struct fee_quote<1> final {
  uint16_t version{1};
  amount_t native_fee{};
  amount_t token_fee{};

  bool operator==(const fee_quote&) const = default;
};

using fee_quote_t = fee_quote<1>;
}  // namespace courier::schema
