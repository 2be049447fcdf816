#pragma once
#include <courier/schema/confirmation.hpp>
#include <courier/schema/enum_string.hpp>
#include <string>
#include <variant>

// Schema type: route outcome.
// Orchestrator result for one attempted route.
namespace courier::schema {

enum class failure_stage : uint8_t {
  approval_submission = 0,
  approval_confirmation = 1,
  transfer_submission = 2,
  transfer_confirmation = 3,
};

inline constexpr auto kFailureStageMappings = std::array{
    std::pair<std::string_view, failure_stage>{
        "approval_submission", failure_stage::approval_submission},
    std::pair<std::string_view, failure_stage>{
        "approval_confirmation", failure_stage::approval_confirmation},
    std::pair<std::string_view, failure_stage>{
        "transfer_submission", failure_stage::transfer_submission},
    std::pair<std::string_view, failure_stage>{
        "transfer_confirmation", failure_stage::transfer_confirmation},
};

inline constexpr std::string_view to_string(const failure_stage value) {
  return enum_name(value, kFailureStageMappings);
}

struct route_sent final {
  confirmation_t confirmation;

  bool operator==(const route_sent&) const = default;
};

struct route_skipped_no_transfer_step final {
  bool operator==(const route_skipped_no_transfer_step&) const = default;
};

struct route_failed final {
  failure_stage stage{};
  std::string message;

  bool operator==(const route_failed&) const = default;
};

using route_outcome_t =
    std::variant<route_sent, route_skipped_no_transfer_step, route_failed>;

inline bool is_sent(const route_outcome_t& outcome) {
  return std::holds_alternative<route_sent>(outcome);
}

}  // namespace courier::schema
