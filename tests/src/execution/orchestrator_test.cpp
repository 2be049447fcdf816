#include <gtest/gtest.h>
#include <courier/common/error.hpp>
#include <courier/execution/orchestrator.hpp>
#include <courier/schema/selector.hpp>
#include <courier/testing/common.hpp>
#include <courier/testing/fakes.hpp>

#include <algorithm>
#include <variant>

namespace {

using courier::common::error_code;
using courier::schema::confirmation_status;
using courier::schema::failure_stage;
using courier::schema::run_event_t;
using courier::schema::run_event_type;
using courier::testing::encoder_t;
using courier::testing::fake_ledger_client;
using courier::testing::make_account;
using courier::testing::make_approve_step;
using courier::testing::make_route;
using courier::testing::make_step;
using courier::testing::make_transfer_step;

const auto kOverride = make_account(0xde);
const auto kQuotedRefund = make_account(0x11);

class orchestrator_test : public ::testing::Test {
 protected:
  orchestrator_test() : orchestrator_{ledger_, kOverride} {
    orchestrator_.set_event_sink(
        [this](const run_event_t& event) { events_.push_back(event); });
  }

  std::vector<run_event_type> event_types() const {
    auto types = std::vector<run_event_type>{};
    for (const auto& event : events_) {
      types.push_back(event.type);
    }
    return types;
  }

  std::size_t count_events(const run_event_type type) const {
    return static_cast<std::size_t>(
        std::ranges::count_if(events_, [type](const run_event_t& event) {
          return event.type == type;
        }));
  }

  fake_ledger_client ledger_;
  courier::execution::orchestrator orchestrator_;
  std::vector<run_event_t> events_;
};

}  // namespace

TEST_F(orchestrator_test, failed_route_falls_through_to_the_next_and_stops) {
  ledger_.push({});  // route 1 approval
  ledger_.push({.submit_error = error_code::ledger_transport});  // transfer
  ledger_.push({});  // route 2 transfer

  auto routes = std::vector<courier::schema::route_t>{
      make_route("stargate/taxi",
                 {make_approve_step(), make_transfer_step(kQuotedRefund)}),
      make_route("stargate/bus", {make_transfer_step(kQuotedRefund, 555)}),
      make_route("stargate/v2", {make_transfer_step(kQuotedRefund)})};

  auto result = orchestrator_.run(routes);

  ASSERT_EQ(result.routes.size(), 2u);
  EXPECT_TRUE(result.confirmed());
  EXPECT_EQ(result.routes[0].route_id, "stargate/taxi");
  auto* failed =
      std::get_if<courier::schema::route_failed>(&result.routes[0].outcome);
  ASSERT_NE(failed, nullptr);
  EXPECT_EQ(failed->stage, failure_stage::transfer_submission);
  EXPECT_EQ(result.routes[1].route_id, "stargate/bus");
  EXPECT_TRUE(courier::schema::is_sent(result.routes[1].outcome));

  // approval, route 1 transfer, route 2 transfer; route 3 never attempted.
  ASSERT_EQ(ledger_.submissions.size(), 3u);
  EXPECT_EQ(ledger_.submissions[0].to, make_account(0x11));
  EXPECT_EQ(ledger_.submissions[0].data, courier::testing::make_approve_data());
  EXPECT_FALSE(ledger_.submissions[0].value.has_value());
  EXPECT_EQ(ledger_.submissions[2].to, make_account(0x22));
  EXPECT_EQ(ledger_.submissions[2].value, courier::schema::amount_t{555});

  for (std::size_t i = 1; i < ledger_.submissions.size(); ++i) {
    auto submitted = encoder_t{}.decode<courier::schema::transfer_call_t>(
        ledger_.submissions[i].data);
    EXPECT_EQ(submitted.refund_address, kOverride);
    auto expected = courier::testing::make_transfer_call(kOverride);
    EXPECT_EQ(submitted, expected);
  }
  EXPECT_EQ(count_events(run_event_type::route_started), 2u);
  EXPECT_EQ(events_.back().type, run_event_type::run_finished);
  EXPECT_EQ(events_.back().attribute("confirmed"), "true");
}

TEST_F(orchestrator_test, route_without_transfer_is_skipped_without_submitting) {
  auto routes = std::vector<courier::schema::route_t>{make_route(
      "stargate/taxi",
      {make_approve_step(),
       make_step("other", courier::schema::bytes_t{1, 2, 3, 4}, 0x33)})};

  auto result = orchestrator_.run(routes);

  ASSERT_EQ(result.routes.size(), 1u);
  EXPECT_TRUE(std::holds_alternative<
              courier::schema::route_skipped_no_transfer_step>(
      result.routes[0].outcome));
  EXPECT_FALSE(result.confirmed());
  EXPECT_TRUE(ledger_.submissions.empty());
  EXPECT_EQ(count_events(run_event_type::no_transfer_step), 1u);
  EXPECT_EQ(count_events(run_event_type::step_classified), 2u);
}

TEST_F(orchestrator_test, approval_failure_fails_the_route_only) {
  ledger_.push({.confirm_error = error_code::confirmation_timeout});
  ledger_.push({});

  auto routes = std::vector<courier::schema::route_t>{
      make_route("stargate/taxi",
                 {make_approve_step(), make_transfer_step(kQuotedRefund)}),
      make_route("stargate/bus", {make_transfer_step(kQuotedRefund)})};

  auto result = orchestrator_.run(routes);

  ASSERT_EQ(result.routes.size(), 2u);
  auto* failed =
      std::get_if<courier::schema::route_failed>(&result.routes[0].outcome);
  ASSERT_NE(failed, nullptr);
  EXPECT_EQ(failed->stage, failure_stage::approval_confirmation);
  EXPECT_TRUE(courier::schema::is_sent(result.routes[1].outcome));
  // The failed route's transfer was never broadcast.
  ASSERT_EQ(ledger_.submissions.size(), 2u);
  EXPECT_EQ(ledger_.submissions[1].to, make_account(0x22));
}

TEST_F(orchestrator_test, reverted_transfer_is_a_confirmation_failure) {
  ledger_.push({.status = confirmation_status::failure});

  auto outcome = orchestrator_.process_route(
      make_route("stargate/bus", {make_transfer_step(kQuotedRefund)}));

  auto* failed = std::get_if<courier::schema::route_failed>(&outcome);
  ASSERT_NE(failed, nullptr);
  EXPECT_EQ(failed->stage, failure_stage::transfer_confirmation);
  EXPECT_EQ(count_events(run_event_type::route_failed), 1u);
}

TEST_F(orchestrator_test, missing_target_fails_at_submission) {
  auto step = make_transfer_step(kQuotedRefund);
  step.transaction.to.reset();

  auto outcome = orchestrator_.process_route(make_route("stargate/bus", {step}));

  auto* failed = std::get_if<courier::schema::route_failed>(&outcome);
  ASSERT_NE(failed, nullptr);
  EXPECT_EQ(failed->stage, failure_stage::transfer_submission);
  EXPECT_TRUE(ledger_.submissions.empty());
}

TEST_F(orchestrator_test, override_is_idempotent) {
  auto outcome = orchestrator_.process_route(
      make_route("stargate/bus", {make_transfer_step(kOverride)}));

  EXPECT_TRUE(courier::schema::is_sent(outcome));
  ASSERT_EQ(ledger_.submissions.size(), 1u);
  EXPECT_EQ(ledger_.submissions[0].data,
            encoder_t{}.encode(courier::testing::make_transfer_call(kOverride)));
  auto override_event = std::ranges::find_if(events_, [](const auto& event) {
    return event.type == run_event_type::override_applied;
  });
  ASSERT_NE(override_event, events_.end());
  EXPECT_EQ(override_event->attribute("unchanged"), "true");
}

TEST_F(orchestrator_test, undecodable_transfer_aborts_the_run) {
  auto data = encoder_t{}.encode(courier::testing::make_transfer_call(kQuotedRefund));
  data.resize(data.size() - 10);
  auto routes = std::vector<courier::schema::route_t>{
      make_route("stargate/taxi",
                 {make_approve_step(), make_step("bridge", data, 0x22)}),
      make_route("stargate/bus", {make_transfer_step(kQuotedRefund)})};

  try {
    orchestrator_.run(routes);
    FAIL() << "expected decode_error";
  } catch (const courier::common::decode_error& ex) {
    EXPECT_EQ(ex.code(), error_code::decode_malformed);
  }
  // Only the approval went out; the second route was never attempted.
  EXPECT_EQ(ledger_.submissions.size(), 1u);
  EXPECT_EQ(count_events(run_event_type::route_started), 1u);
  EXPECT_EQ(count_events(run_event_type::route_aborted), 1u);
}

TEST_F(orchestrator_test, successful_route_emits_ordered_events) {
  orchestrator_.process_route(make_route(
      "stargate/taxi", {make_approve_step(), make_transfer_step(kQuotedRefund)}));

  auto expected = std::vector<run_event_type>{
      run_event_type::route_started,      run_event_type::step_classified,
      run_event_type::step_classified,    run_event_type::approval_submitted,
      run_event_type::approval_confirmed, run_event_type::transfer_decoded,
      run_event_type::override_applied,   run_event_type::verification_passed,
      run_event_type::transfer_submitted, run_event_type::transfer_confirmed};
  EXPECT_EQ(event_types(), expected);
  EXPECT_EQ(events_[5].attribute("refund_address"),
            courier::schema::to_string(kQuotedRefund));
  EXPECT_EQ(events_[6].attribute("override"),
            courier::schema::to_string(kOverride));
  EXPECT_EQ(events_[6].attribute("unchanged"), "false");
}

TEST_F(orchestrator_test, exhausted_routes_report_no_confirmation) {
  ledger_.push({.submit_error = error_code::ledger_rejected});
  ledger_.push({.submit_error = error_code::ledger_rejected});

  auto result = orchestrator_.run(
      {make_route("stargate/taxi", {make_transfer_step(kQuotedRefund)}),
       make_route("stargate/bus", {make_transfer_step(kQuotedRefund)})});

  EXPECT_EQ(result.routes.size(), 2u);
  EXPECT_FALSE(result.confirmed());
  EXPECT_EQ(events_.back().attribute("confirmed"), "false");
  EXPECT_EQ(events_.back().attribute("attempted"), "2");
}

TEST(route_state, terminal_states) {
  using courier::execution::route_state;
  EXPECT_TRUE(courier::execution::is_terminal(route_state::confirmed));
  EXPECT_TRUE(courier::execution::is_terminal(route_state::route_failed));
  EXPECT_TRUE(
      courier::execution::is_terminal(route_state::skipped_no_transfer));
  EXPECT_FALSE(courier::execution::is_terminal(route_state::verifying));
  EXPECT_EQ(courier::execution::to_string(route_state::approval_pending),
            "approval_pending");
}
