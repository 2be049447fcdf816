#pragma once
#include <courier/schema/primitives.hpp>
#include <optional>

// Schema type: transaction skeleton.
// Quote step: unsigned call proposed by the quote source.
namespace courier::schema {

template <uint16_t Version>
struct transaction_skeleton;

template <>
struct transaction_skeleton<1> final {
  uint16_t version{1};
  bytes_t data;
  std::optional<address_t> to;
  amount_t value{};
  std::optional<address_t> from;

  bool operator==(const transaction_skeleton&) const = default;
};

using transaction_skeleton_t = transaction_skeleton<1>;
}  // namespace courier::schema
