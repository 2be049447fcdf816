#pragma once
#include <courier/schema/transaction_skeleton.hpp>
#include <string>

// Schema type: step.
// Quote route: one proposed on-chain call (token approval, bridge transfer).
namespace courier::schema {

template <uint16_t Version>
struct step;

template <>
struct step<1> final {
  uint16_t version{1};
  std::string kind;
  std::string sender;
  std::string chain_key;
  transaction_skeleton_t transaction;

  bool operator==(const step&) const = default;
};

using step_t = step<1>;
}  // namespace courier::schema
