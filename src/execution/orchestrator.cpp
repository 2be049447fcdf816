#include <spdlog/spdlog.h>
#include <courier/common/error.hpp>
#include <courier/execution/orchestrator.hpp>
#include <courier/schema/enum_string.hpp>
#include <courier/schema/selector.hpp>
#include <algorithm>
#include <exception>
#include <utility>

using namespace courier::schema;

namespace {

inline constexpr auto kRouteStateMappings = std::array{
    std::pair<std::string_view, courier::execution::route_state>{
        "start", courier::execution::route_state::start},
    std::pair<std::string_view, courier::execution::route_state>{
        "approval_pending", courier::execution::route_state::approval_pending},
    std::pair<std::string_view, courier::execution::route_state>{
        "approval_confirmed",
        courier::execution::route_state::approval_confirmed},
    std::pair<std::string_view, courier::execution::route_state>{
        "decoding", courier::execution::route_state::decoding},
    std::pair<std::string_view, courier::execution::route_state>{
        "overriding", courier::execution::route_state::overriding},
    std::pair<std::string_view, courier::execution::route_state>{
        "verifying", courier::execution::route_state::verifying},
    std::pair<std::string_view, courier::execution::route_state>{
        "submitting", courier::execution::route_state::submitting},
    std::pair<std::string_view, courier::execution::route_state>{
        "confirmed", courier::execution::route_state::confirmed},
    std::pair<std::string_view, courier::execution::route_state>{
        "skipped_no_transfer",
        courier::execution::route_state::skipped_no_transfer},
    std::pair<std::string_view, courier::execution::route_state>{
        "route_failed", courier::execution::route_state::route_failed},
};

std::string describe_selector(const std::optional<selector_t>& selector) {
  return selector ? to_string(*selector) : std::string{"none"};
}

std::string abbreviate(const bytes_t& data) {
  auto hex = to_0x_hex(data);
  if (hex.size() <= 66) {
    return hex;
  }
  return hex.substr(0, 66) + "...";
}

}  // namespace

namespace courier::execution {

using courier::schema::to_string;

std::string_view to_string(const route_state state) {
  return enum_name(state, kRouteStateMappings);
}

bool is_terminal(const route_state state) {
  return state == route_state::confirmed ||
         state == route_state::skipped_no_transfer ||
         state == route_state::route_failed;
}

bool run_result::confirmed() const {
  return std::ranges::any_of(routes, [](const route_result& result) {
    return is_sent(result.outcome);
  });
}

struct orchestrator::route_attempt final {
  const route_t& route;
  classified_steps classification;
  transfer_call_t original;
  transfer_call_t overridden;
  bytes_t call_data;
  route_outcome_t outcome;
};

orchestrator::orchestrator(ledger_client& ledger,
                           const address_t& refund_override)
    : ledger_{ledger}, refund_override_{refund_override} {}

void orchestrator::set_event_sink(event_sink_t sink) {
  event_sink_ = std::move(sink);
}

run_result orchestrator::run(const std::vector<route_t>& routes) {
  auto result = run_result{};
  spdlog::info("Processing {} route(s)", routes.size());
  for (std::size_t i = 0; i < routes.size(); ++i) {
    auto outcome = process_route(routes[i]);
    result.routes.push_back(
        route_result{.route_id = routes[i].id, .outcome = std::move(outcome)});
    if (is_sent(result.routes.back().outcome)) {
      auto remaining = routes.size() - i - 1;
      if (remaining > 0) {
        spdlog::info(
            "Skipping {} remaining route(s); transfer already confirmed",
            remaining);
      }
      break;
    }
  }

  if (event_sink_) {
    event_sink_(run_event_t{
        .type = run_event_type::run_finished,
        .attributes = {{"attempted", std::to_string(result.routes.size())},
                       {"confirmed", result.confirmed() ? "true" : "false"}}});
  }
  return result;
}

route_outcome_t orchestrator::process_route(const route_t& route) {
  spdlog::info("Processing route '{}' with {} step(s)", route.id,
               route.steps.size());
  emit(run_event_type::route_started, route,
       {{"steps", std::to_string(route.steps.size())}});

  auto attempt = route_attempt{.route = route};
  auto state = route_state::start;
  while (!is_terminal(state)) {
    auto next = advance(attempt, state);
    spdlog::debug("Route '{}': {} -> {}", route.id, to_string(state),
                  to_string(next));
    state = next;
  }
  return attempt.outcome;
}

route_state orchestrator::advance(route_attempt& attempt,
                                  const route_state state) {
  switch (state) {
    case route_state::start:
      return classify_steps(attempt);
    case route_state::approval_pending:
      return submit_approval(attempt);
    case route_state::approval_confirmed:
      return route_state::decoding;
    case route_state::decoding:
      return decode_transfer(attempt);
    case route_state::overriding:
      return override_refund(attempt);
    case route_state::verifying:
      return verify_round_trip(attempt);
    case route_state::submitting:
      return submit_transfer(attempt);
    case route_state::confirmed:
    case route_state::skipped_no_transfer:
    case route_state::route_failed:
      break;
  }
  return state;
}

route_state orchestrator::classify_steps(route_attempt& attempt) {
  const auto& route = attempt.route;
  attempt.classification = classify(route.steps);
  for (const auto& summary : attempt.classification.summaries) {
    spdlog::info("  - Step {}: type={}, selector={}", summary.index,
                 summary.kind, describe_selector(summary.selector));
    emit(run_event_type::step_classified, route,
         {{"index", std::to_string(summary.index)},
          {"kind", summary.kind},
          {"selector", describe_selector(summary.selector)}});
  }

  if (!attempt.classification.transfer) {
    auto listing = std::string{};
    for (const auto& summary : attempt.classification.summaries) {
      if (!listing.empty()) {
        listing += ", ";
      }
      listing += fmt::format("#{} {} {}", summary.index, summary.kind,
                             describe_selector(summary.selector));
    }
    spdlog::warn("Route '{}' has no transfer step, skipping. Steps: [{}]",
                 route.id, listing);
    emit(run_event_type::no_transfer_step, route, {{"steps", listing}});
    attempt.outcome = route_skipped_no_transfer_step{};
    return route_state::skipped_no_transfer;
  }

  spdlog::info("Route '{}': using step {} for the transfer call", route.id,
               attempt.classification.transfer->index);
  if (attempt.classification.approval) {
    return route_state::approval_pending;
  }
  return route_state::decoding;
}

route_state orchestrator::submit_approval(route_attempt& attempt) {
  const auto& approval = *attempt.classification.approval;
  spdlog::info("Route '{}': submitting approval from step {} ({})",
               attempt.route.id, approval.index,
               abbreviate(approval.step.transaction.data));
  auto confirmation = submit_and_confirm(
      attempt, approval, approval.step.transaction.data, std::nullopt,
      failure_stage::approval_submission, failure_stage::approval_confirmation,
      run_event_type::approval_submitted);
  if (!confirmation) {
    return route_state::route_failed;
  }
  spdlog::info("Route '{}': approval {} confirmed in block {}",
               attempt.route.id, to_string(confirmation->transaction_hash),
               confirmation->block_number);
  emit(run_event_type::approval_confirmed, attempt.route,
       {{"transaction_hash", to_string(confirmation->transaction_hash)},
        {"block_number", std::to_string(confirmation->block_number)}});
  return route_state::approval_confirmed;
}

route_state orchestrator::decode_transfer(route_attempt& attempt) {
  const auto& transfer = *attempt.classification.transfer;
  try {
    attempt.original =
        encoder_.decode<transfer_call_t>(transfer.step.transaction.data);
  } catch (const courier::common::decode_error& ex) {
    spdlog::error("Route '{}': failed to decode transfer call in step {}: {}",
                  attempt.route.id, transfer.index, ex.what());
    emit(run_event_type::route_aborted, attempt.route,
         {{"state", std::string{to_string(route_state::decoding)}},
          {"error", ex.what()}});
    throw;
  }

  const auto& decoded = attempt.original;
  spdlog::info(
      "Route '{}': decoded transfer call dst_eid={} to={} amount={} "
      "min_amount={} native_fee={} token_fee={} refund={}",
      attempt.route.id, decoded.parameters.destination_endpoint_id,
      to_string(decoded.parameters.recipient),
      to_string(decoded.parameters.amount),
      to_string(decoded.parameters.minimum_amount),
      to_string(decoded.fee.native_fee), to_string(decoded.fee.token_fee),
      to_string(decoded.refund_address));
  emit(run_event_type::transfer_decoded, attempt.route,
       {{"step", std::to_string(transfer.index)},
        {"destination_endpoint_id",
         std::to_string(decoded.parameters.destination_endpoint_id)},
        {"amount", to_string(decoded.parameters.amount)},
        {"minimum_amount", to_string(decoded.parameters.minimum_amount)},
        {"native_fee", to_string(decoded.fee.native_fee)},
        {"refund_address", to_string(decoded.refund_address)}});
  return route_state::overriding;
}

route_state orchestrator::override_refund(route_attempt& attempt) {
  const auto unchanged = attempt.original.refund_address == refund_override_;
  if (unchanged) {
    spdlog::warn("Route '{}': refund address {} already equals the override",
                 attempt.route.id, to_string(refund_override_));
  }
  attempt.overridden = attempt.original;
  attempt.overridden.refund_address = refund_override_;
  spdlog::info("Route '{}': refund address {} -> {}", attempt.route.id,
               to_string(attempt.original.refund_address),
               to_string(refund_override_));
  emit(run_event_type::override_applied, attempt.route,
       {{"original", to_string(attempt.original.refund_address)},
        {"override", to_string(refund_override_)},
        {"unchanged", unchanged ? "true" : "false"}});
  return route_state::verifying;
}

route_state orchestrator::verify_round_trip(route_attempt& attempt) {
  attempt.call_data = encoder_.encode(attempt.overridden);
  auto verified = encoder_.try_decode<transfer_call_t>(attempt.call_data);
  if (!verified) {
    abort_verification(attempt, "re-encoded call data does not decode");
  }
  if (verified->refund_address != refund_override_) {
    abort_verification(
        attempt, fmt::format("re-encoded refund address is {}, expected {}",
                             to_string(verified->refund_address),
                             to_string(refund_override_)));
  }
  if (verified->parameters != attempt.original.parameters) {
    abort_verification(attempt,
                       "re-encoded transfer parameters differ from the quote");
  }
  if (verified->fee != attempt.original.fee) {
    abort_verification(attempt,
                       "re-encoded fee quote differs from the quote");
  }

  spdlog::info("Route '{}': verified re-encoded call data ({} bytes) {}",
               attempt.route.id, attempt.call_data.size(),
               abbreviate(attempt.call_data));
  emit(run_event_type::verification_passed, attempt.route,
       {{"refund_address", to_string(verified->refund_address)},
        {"call_data_size", std::to_string(attempt.call_data.size())}});
  return route_state::submitting;
}

route_state orchestrator::submit_transfer(route_attempt& attempt) {
  const auto& transfer = *attempt.classification.transfer;
  spdlog::info("Route '{}': submitting transfer with value {} wei",
               attempt.route.id, to_string(transfer.step.transaction.value));
  auto confirmation = submit_and_confirm(
      attempt, transfer, attempt.call_data, transfer.step.transaction.value,
      failure_stage::transfer_submission, failure_stage::transfer_confirmation,
      run_event_type::transfer_submitted);
  if (!confirmation) {
    return route_state::route_failed;
  }
  spdlog::info("Route '{}': transfer {} confirmed in block {}",
               attempt.route.id, to_string(confirmation->transaction_hash),
               confirmation->block_number);
  emit(run_event_type::transfer_confirmed, attempt.route,
       {{"transaction_hash", to_string(confirmation->transaction_hash)},
        {"block_number", std::to_string(confirmation->block_number)}});
  attempt.outcome = route_sent{.confirmation = *confirmation};
  return route_state::confirmed;
}

std::optional<confirmation_t> orchestrator::submit_and_confirm(
    route_attempt& attempt,
    const indexed_step& target,
    const bytes_t& data,
    const std::optional<amount_t>& value,
    const failure_stage submission_stage,
    const failure_stage confirmation_stage,
    const run_event_type submitted_event) {
  const auto& skeleton = target.step.transaction;
  if (!skeleton.to) {
    return fail(attempt, submission_stage,
                fmt::format("step {} has no target address", target.index));
  }

  auto handle = submission_handle_t{};
  try {
    handle = ledger_.submit(*skeleton.to, data, value);
  } catch (const std::exception& ex) {
    return fail(attempt, submission_stage, ex.what());
  }
  spdlog::info("Route '{}': step {} submitted as {}", attempt.route.id,
               target.index, to_string(handle));
  emit(submitted_event, attempt.route,
       {{"step", std::to_string(target.index)},
        {"to", to_string(*skeleton.to)},
        {"transaction_hash", to_string(handle)}});

  auto confirmation = confirmation_t{};
  try {
    confirmation = ledger_.await_confirmation(handle);
  } catch (const std::exception& ex) {
    return fail(attempt, confirmation_stage, ex.what());
  }
  if (confirmation.status != confirmation_status::success) {
    return fail(attempt, confirmation_stage,
                fmt::format("transaction {} failed in block {}",
                            to_string(handle), confirmation.block_number));
  }
  return confirmation;
}

std::nullopt_t orchestrator::fail(route_attempt& attempt,
                                  const failure_stage stage,
                                  const std::string& message) {
  spdlog::error("Route '{}' failed during {}: {}", attempt.route.id,
                to_string(stage), message);
  emit(run_event_type::route_failed, attempt.route,
       {{"stage", std::string{to_string(stage)}}, {"error", message}});
  attempt.outcome = route_failed{.stage = stage, .message = message};
  return std::nullopt;
}

void orchestrator::abort_verification(route_attempt& attempt,
                                      const std::string& message) {
  spdlog::error("Route '{}': re-encode verification failed: {}",
                attempt.route.id, message);
  emit(run_event_type::route_aborted, attempt.route,
       {{"state", std::string{to_string(route_state::verifying)}},
        {"error", message}});
  throw courier::common::encode_verification_error{message};
}

void orchestrator::emit(
    const run_event_type type,
    const route_t& route,
    std::vector<courier::schema::run_event_attribute> attributes) const {
  if (!event_sink_) {
    return;
  }
  event_sink_(run_event_t{
      .type = type, .route = route.id, .attributes = std::move(attributes)});
}

}  // namespace courier::execution
