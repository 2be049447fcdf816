#include <gtest/gtest.h>
#include <courier/common/error.hpp>
#include <courier/config/run_config.hpp>

#include <sstream>
#include <vector>

namespace {

std::optional<courier::config::run_config> parse(
    std::vector<const char*> args,
    std::ostream& help) {
  args.insert(args.begin(), "courier");
  return courier::config::parse_run_config(static_cast<int>(args.size()),
                                           args.data(), help);
}

courier::common::error_code config_failure(std::vector<const char*> args) {
  auto help = std::ostringstream{};
  try {
    parse(std::move(args), help);
  } catch (const courier::common::error& ex) {
    return ex.code();
  }
  ADD_FAILURE() << "expected invalid configuration";
  return courier::common::error_code::quote_fetch_failed;
}

constexpr auto kFrom = "0x1111111111111111111111111111111111111111";

}  // namespace

TEST(run_config, defaults_follow_the_documented_values) {
  auto help = std::ostringstream{};
  auto config = parse({"--rpc-url", "http://node:8545", "--from", kFrom}, help);

  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->rpc_url, "http://node:8545");
  EXPECT_EQ(config->from, courier::schema::make_address(kFrom));
  EXPECT_EQ(config->refund_override,
            courier::schema::make_address(
                "0xdeadbeefdeadbeefdeadbeefdeadbeefdeadbeef"));
  EXPECT_EQ(config->quote.src_chain_key, "base");
  EXPECT_EQ(config->quote.dst_chain_key, "arbitrum");
  EXPECT_EQ(config->quote.src_token,
            "0x833589fCD6eDb6E08f4c7C32D4f71b54bdA02913");
  EXPECT_EQ(config->quote.dst_token,
            "0xaf88d065e77c8cC2239327C5EDb3A432268e5831");
  EXPECT_EQ(config->quote.src_address, kFrom);
  EXPECT_EQ(config->quote.dst_address, kFrom);
  EXPECT_EQ(config->quote.src_amount, courier::schema::amount_t{1000000});
  EXPECT_EQ(config->quote.dst_amount_min, courier::schema::amount_t{950000});
  EXPECT_EQ(config->quote_url, "https://stargate.finance/api/v1/quotes");
  EXPECT_EQ(config->route_prefix, "stargate/");
  EXPECT_EQ(config->confirmation.timeout_ms, 120000u);
  EXPECT_FALSE(config->verbose);
}

TEST(run_config, explicit_values_override_defaults) {
  auto help = std::ostringstream{};
  auto config = parse({"--rpc-url", "http://node:8545", "--from", kFrom,
                       "--refund-address",
                       "0x2222222222222222222222222222222222222222",
                       "--dst-address",
                       "0x3333333333333333333333333333333333333333",
                       "--src-amount", "0x10", "--confirmation-timeout-ms",
                       "0", "--route-prefix", "stargate/v2/", "-v"},
                      help);

  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->refund_override,
            courier::schema::make_address(
                "0x2222222222222222222222222222222222222222"));
  EXPECT_EQ(config->quote.src_address, kFrom);
  EXPECT_EQ(config->quote.dst_address,
            "0x3333333333333333333333333333333333333333");
  EXPECT_EQ(config->quote.src_amount, courier::schema::amount_t{16});
  EXPECT_EQ(config->confirmation.timeout_ms, 0u);
  EXPECT_EQ(config->route_prefix, "stargate/v2/");
  EXPECT_TRUE(config->verbose);
}

TEST(run_config, help_prints_usage_and_returns_nothing) {
  auto help = std::ostringstream{};
  auto config = parse({"--help"}, help);
  EXPECT_FALSE(config.has_value());
  EXPECT_NE(help.str().find("--refund-address"), std::string::npos);
}

TEST(run_config, invalid_values_are_configuration_errors) {
  using courier::common::error_code;
  EXPECT_EQ(config_failure({"--from", kFrom}),
            error_code::invalid_configuration);
  EXPECT_EQ(config_failure({"--rpc-url", "http://node"}),
            error_code::invalid_configuration);
  EXPECT_EQ(config_failure({"--rpc-url", "http://node", "--from", "0x1234"}),
            error_code::invalid_configuration);
  EXPECT_EQ(config_failure({"--rpc-url", "http://node", "--from", kFrom,
                            "--refund-address", "nope"}),
            error_code::invalid_configuration);
  EXPECT_EQ(config_failure({"--rpc-url", "http://node", "--from", kFrom,
                            "--src-amount", "-5"}),
            error_code::invalid_configuration);
  EXPECT_EQ(config_failure({"--rpc-url", "http://node", "--from", kFrom,
                            "--no-such-option"}),
            error_code::invalid_configuration);
  EXPECT_EQ(config_failure({"--rpc-url", "http://node", "--from", kFrom,
                            "--poll-interval-ms", "0"}),
            error_code::invalid_configuration);
}
