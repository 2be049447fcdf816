#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <courier/common/error.hpp>
#include <courier/config/run_config.hpp>
#include <courier/execution/json_rpc_ledger_client.hpp>
#include <courier/execution/orchestrator.hpp>
#include <courier/net/curl/http_client.hpp>
#include <courier/quote/stargate_quote_source.hpp>
#include <iostream>
#include <string>

namespace {

constexpr auto kExitSuccess = 0;
constexpr auto kExitFatal = 1;
constexpr auto kExitNoRouteConfirmed = 2;

void log_event(const courier::schema::run_event_t& event) {
  auto attributes = std::string{};
  for (const auto& attribute : event.attributes) {
    attributes += fmt::format(" {}={}", attribute.key, attribute.value);
  }
  spdlog::debug("event {} route='{}'{}", courier::schema::to_string(event.type),
                event.route, attributes);
}

void print_summary(const courier::execution::run_result& result) {
  for (const auto& route : result.routes) {
    std::visit(
        overloaded{
            [&](const courier::schema::route_sent& sent) {
              spdlog::info("Route '{}': sent, transaction {} in block {}",
                           route.route_id,
                           courier::schema::to_string(
                               sent.confirmation.transaction_hash),
                           sent.confirmation.block_number);
            },
            [&](const courier::schema::route_skipped_no_transfer_step&) {
              spdlog::info("Route '{}': skipped, no transfer step",
                           route.route_id);
            },
            [&](const courier::schema::route_failed& failed) {
              spdlog::info("Route '{}': failed during {}: {}", route.route_id,
                           courier::schema::to_string(failed.stage),
                           failed.message);
            }},
        route.outcome);
  }
}

int run(const courier::config::run_config& config) {
  auto http = courier::net::curl_http_client{
      courier::net::curl_options{.timeout_ms = config.http_timeout_ms}};

  auto quotes = courier::quote::stargate_quote_source{http, config.quote_url};
  auto routes = courier::quote::select_routes(quotes.fetch(config.quote),
                                              config.route_prefix);

  auto ledger = courier::execution::json_rpc_ledger_client{
      http, config.rpc_url, config.from, config.confirmation};
  auto orchestrator =
      courier::execution::orchestrator{ledger, config.refund_override};
  orchestrator.set_event_sink(log_event);

  auto result = orchestrator.run(routes);
  print_summary(result);
  if (!result.confirmed()) {
    spdlog::error("No route was confirmed ({} attempted)",
                  result.routes.size());
    return kExitNoRouteConfirmed;
  }
  spdlog::info("Transfer confirmed");
  return kExitSuccess;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto config = std::optional<courier::config::run_config>{};
  try {
    config = courier::config::parse_run_config(argc, argv, std::cout);
  } catch (const courier::common::error& ex) {
    std::cerr << ex.what() << std::endl;
    return kExitFatal;
  }
  if (!config) {
    return kExitSuccess;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      config->log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "courier", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(config->verbose ? spdlog::level::debug
                                    : spdlog::level::info);

  spdlog::info("Sender {} refund override {}",
               courier::schema::to_string(config->from),
               courier::schema::to_string(config->refund_override));
  spdlog::info("Quote {} {} -> {} {}, amount {} (min {})",
               config->quote.src_chain_key, config->quote.src_token,
               config->quote.dst_chain_key, config->quote.dst_token,
               courier::schema::to_string(config->quote.src_amount),
               courier::schema::to_string(config->quote.dst_amount_min));

  auto status = kExitFatal;
  try {
    status = run(*config);
  } catch (const courier::common::error& ex) {
    spdlog::error("Run aborted ({}): {}",
                  courier::common::to_string(ex.code()), ex.what());
  } catch (const std::exception& ex) {
    spdlog::error("Run aborted: {}", ex.what());
  }

  spdlog::shutdown();
  return status;
}
