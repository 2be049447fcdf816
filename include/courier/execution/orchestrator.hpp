#pragma once

#include <courier/execution/event_sink.hpp>
#include <courier/execution/ledger_client.hpp>
#include <courier/execution/step_classifier.hpp>
#include <courier/schema/encoding/abi/encoder.hpp>
#include <courier/schema/primitives.hpp>
#include <courier/schema/route.hpp>
#include <courier/schema/route_outcome.hpp>
#include <courier/schema/run_event.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace courier::execution {

/// Per-route state. `confirmed`, `skipped_no_transfer` and `route_failed` are
/// terminal; run-fatal codec failures leave the machine by exception.
enum class route_state : uint8_t {
  start = 0,
  approval_pending = 1,
  approval_confirmed = 2,
  decoding = 3,
  overriding = 4,
  verifying = 5,
  submitting = 6,
  confirmed = 7,
  skipped_no_transfer = 8,
  route_failed = 9,
};

std::string_view to_string(route_state state);
bool is_terminal(route_state state);

struct route_result final {
  std::string route_id;
  courier::schema::route_outcome_t outcome;
};

struct run_result final {
  /// Attempted routes in order; routes after a confirmed one are absent.
  std::vector<route_result> routes;

  /// True when some route reached a confirmed transfer.
  bool confirmed() const;
};

/// Drives quoted routes through approval, refund override and submission.
///
/// Routes run strictly in sequence and the run stops at the first confirmed
/// transfer. Ledger failures are scoped to their route (`route_failed`);
/// decode failures (`courier::common::decode_error`) and re-encode mismatches
/// (`courier::common::encode_verification_error`) propagate and end the run.
class orchestrator final {
 public:
  /// `refund_override` replaces the refund account of every transfer call.
  orchestrator(ledger_client& ledger,
               const courier::schema::address_t& refund_override);

  /// Install the consumer of the structured event stream.
  void set_event_sink(event_sink_t sink);

  /// Attempt one route to a terminal state.
  courier::schema::route_outcome_t process_route(
      const courier::schema::route_t& route);

  /// Attempt routes in order until one is confirmed or all are exhausted.
  ///
  /// Exhausting every route is not an error here; callers inspect
  /// `run_result::confirmed()`.
  run_result run(const std::vector<courier::schema::route_t>& routes);

 private:
  struct route_attempt;

  route_state advance(route_attempt& attempt, route_state state);
  route_state classify_steps(route_attempt& attempt);
  route_state submit_approval(route_attempt& attempt);
  route_state decode_transfer(route_attempt& attempt);
  route_state override_refund(route_attempt& attempt);
  route_state verify_round_trip(route_attempt& attempt);
  route_state submit_transfer(route_attempt& attempt);

  /// Submit a step's call and wait for a successful receipt. Records a
  /// `route_failed` outcome and returns std::nullopt on any ledger failure.
  std::optional<courier::schema::confirmation_t> submit_and_confirm(
      route_attempt& attempt,
      const indexed_step& target,
      const courier::schema::bytes_t& data,
      const std::optional<courier::schema::amount_t>& value,
      courier::schema::failure_stage submission_stage,
      courier::schema::failure_stage confirmation_stage,
      courier::schema::run_event_type submitted_event);

  std::nullopt_t fail(route_attempt& attempt,
                      courier::schema::failure_stage stage,
                      const std::string& message);

  [[noreturn]] void abort_verification(route_attempt& attempt,
                                       const std::string& message);

  void emit(courier::schema::run_event_type type,
            const courier::schema::route_t& route,
            std::vector<courier::schema::run_event_attribute> attributes =
                {}) const;

  ledger_client& ledger_;
  courier::schema::address_t refund_override_;
  event_sink_t event_sink_;
  courier::schema::encoding::encoder<
      courier::schema::encoding::abi_encoder_tag>
      encoder_;
};

}  // namespace courier::execution
