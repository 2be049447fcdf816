#pragma once

#include <courier/schema/enum_string.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Schema type: run event.
// Orchestrator event stream item consumed by the presentation layer.
namespace courier::schema {

enum class run_event_type : uint16_t {
  route_started = 0,
  step_classified = 1,
  no_transfer_step = 2,
  approval_submitted = 3,
  approval_confirmed = 4,
  transfer_decoded = 5,
  override_applied = 6,
  verification_passed = 7,
  transfer_submitted = 8,
  transfer_confirmed = 9,
  route_failed = 10,
  route_aborted = 11,
  run_finished = 12,
};

inline constexpr auto kRunEventTypeMappings = std::array{
    std::pair<std::string_view, run_event_type>{"route_started",
                                                run_event_type::route_started},
    std::pair<std::string_view, run_event_type>{
        "step_classified", run_event_type::step_classified},
    std::pair<std::string_view, run_event_type>{
        "no_transfer_step", run_event_type::no_transfer_step},
    std::pair<std::string_view, run_event_type>{
        "approval_submitted", run_event_type::approval_submitted},
    std::pair<std::string_view, run_event_type>{
        "approval_confirmed", run_event_type::approval_confirmed},
    std::pair<std::string_view, run_event_type>{
        "transfer_decoded", run_event_type::transfer_decoded},
    std::pair<std::string_view, run_event_type>{
        "override_applied", run_event_type::override_applied},
    std::pair<std::string_view, run_event_type>{
        "verification_passed", run_event_type::verification_passed},
    std::pair<std::string_view, run_event_type>{
        "transfer_submitted", run_event_type::transfer_submitted},
    std::pair<std::string_view, run_event_type>{
        "transfer_confirmed", run_event_type::transfer_confirmed},
    std::pair<std::string_view, run_event_type>{"route_failed",
                                                run_event_type::route_failed},
    std::pair<std::string_view, run_event_type>{"route_aborted",
                                                run_event_type::route_aborted},
    std::pair<std::string_view, run_event_type>{"run_finished",
                                                run_event_type::run_finished},
};

inline constexpr std::string_view to_string(const run_event_type value) {
  return enum_name(value, kRunEventTypeMappings);
}

struct run_event_attribute final {
  std::string key;
  std::string value;
};

template <uint16_t Version>
struct run_event;

template <>
struct run_event<1> final {
  uint16_t version{1};
  run_event_type type{};
  std::string route;
  std::vector<run_event_attribute> attributes;

  /// Value of the first attribute named `key`, or empty.
  std::string attribute(std::string_view key) const {
    for (const auto& item : attributes) {
      if (item.key == key) {
        return item.value;
      }
    }
    return {};
  }
};

using run_event_t = run_event<1>;

}  // namespace courier::schema
