#pragma once
#include <courier/schema/enum_string.hpp>
#include <courier/schema/primitives.hpp>
#include <cstdint>

// Schema type: confirmation.
// Ledger receipt: execution status of a submitted call once it is included.
namespace courier::schema {

enum class confirmation_status : uint8_t {
  success = 0,
  failure = 1,
};

inline constexpr auto kConfirmationStatusMappings = std::array{
    std::pair<std::string_view, confirmation_status>{
        "success", confirmation_status::success},
    std::pair<std::string_view, confirmation_status>{
        "failure", confirmation_status::failure},
};

inline constexpr std::string_view to_string(const confirmation_status value) {
  return enum_name(value, kConfirmationStatusMappings);
}

template <uint16_t Version>
struct confirmation;

template <>
struct confirmation<1> final {
  uint16_t version{1};
  hash32_t transaction_hash{};
  confirmation_status status{confirmation_status::success};
  uint64_t block_number{};
  amount_t gas_used{};

  bool operator==(const confirmation&) const = default;
};

using confirmation_t = confirmation<1>;
}  // namespace courier::schema
