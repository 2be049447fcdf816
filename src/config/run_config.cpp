#include <courier/common/error.hpp>
#include <courier/config/run_config.hpp>
#include <boost/program_options.hpp>
#include <spdlog/fmt/fmt.h>

using namespace courier::schema;
namespace po = boost::program_options;

namespace {

[[noreturn]] void invalid(const std::string& message) {
  throw courier::common::error{courier::common::error_code::invalid_configuration,
                               message};
}

address_t parse_address(const std::string& option, const std::string& text) {
  auto address = try_make_address(text);
  if (!address) {
    invalid(fmt::format("--{} is not a 20-byte hex address: '{}'", option,
                        text));
  }
  return *address;
}

amount_t parse_amount(const std::string& option, const std::string& text) {
  auto amount = try_make_amount(text);
  if (!amount) {
    invalid(fmt::format("--{} is not an unsigned 256-bit amount: '{}'", option,
                        text));
  }
  return *amount;
}

}  // namespace

namespace courier::config {

std::optional<run_config> parse_run_config(const int argc,
                                           const char* const argv[],
                                           std::ostream& help) {
  auto config = run_config{};
  auto from = std::string{};
  auto refund = std::string{};
  auto src_amount = std::string{};
  auto dst_amount_min = std::string{};

  auto description = po::options_description{"courier"};
  description.add_options()("help,h", "Show the help message")(
      "rpc-url", po::value<std::string>(&config.rpc_url),
      "JSON-RPC endpoint of the source-chain node")(
      "from", po::value<std::string>(&from),
      "Sender account; the node must hold its key")(
      "refund-address",
      po::value<std::string>(&refund)->default_value(
          std::string{kDefaultRefundAddress}),
      "Refund account written into every transfer call")(
      "src-token",
      po::value<std::string>(&config.quote.src_token)
          ->default_value(std::string{kDefaultSourceToken}),
      "Source token address")(
      "src-chain",
      po::value<std::string>(&config.quote.src_chain_key)
          ->default_value("base"),
      "Source chain key")(
      "dst-token",
      po::value<std::string>(&config.quote.dst_token)
          ->default_value(std::string{kDefaultDestinationToken}),
      "Destination token address")(
      "dst-chain",
      po::value<std::string>(&config.quote.dst_chain_key)
          ->default_value("arbitrum"),
      "Destination chain key")(
      "src-address", po::value<std::string>(&config.quote.src_address),
      "Quoted source account (defaults to --from)")(
      "dst-address", po::value<std::string>(&config.quote.dst_address),
      "Quoted destination account (defaults to --from)")(
      "src-amount",
      po::value<std::string>(&src_amount)->default_value("1000000"),
      "Amount to send in source token base units")(
      "dst-amount-min",
      po::value<std::string>(&dst_amount_min)->default_value("950000"),
      "Minimum amount received in destination token base units")(
      "quote-url",
      po::value<std::string>(&config.quote_url)
          ->default_value(std::string{kDefaultQuoteUrl}),
      "Quote service endpoint")(
      "route-prefix",
      po::value<std::string>(&config.route_prefix)
          ->default_value(std::string{kDefaultRoutePrefix}),
      "Only routes whose identifier starts with this prefix are attempted")(
      "confirmation-timeout-ms",
      po::value<uint64_t>(&config.confirmation.timeout_ms)
          ->default_value(120000),
      "Receipt wait limit per transaction, 0 waits forever")(
      "poll-interval-ms",
      po::value<uint64_t>(&config.confirmation.poll_interval_ms)
          ->default_value(2000),
      "Delay between receipt polls")(
      "http-timeout-ms",
      po::value<uint64_t>(&config.http_timeout_ms)->default_value(30000),
      "Timeout of a single HTTP request")(
      "log-file",
      po::value<std::string>(&config.log_file)->default_value("courier.log"),
      "Log file path")("verbose,v", "Enable verbose output");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    invalid(ex.what());
  }

  if (vm.contains("help")) {
    help << description << std::endl;
    return std::nullopt;
  }
  config.verbose = vm.contains("verbose");

  if (config.rpc_url.empty()) {
    invalid("--rpc-url is required");
  }
  if (from.empty()) {
    invalid("--from is required");
  }
  config.from = parse_address("from", from);
  config.refund_override = parse_address("refund-address", refund);
  config.quote.src_amount = parse_amount("src-amount", src_amount);
  config.quote.dst_amount_min = parse_amount("dst-amount-min", dst_amount_min);
  if (config.quote.src_address.empty()) {
    config.quote.src_address = from;
  }
  if (config.quote.dst_address.empty()) {
    config.quote.dst_address = from;
  }
  if (config.confirmation.poll_interval_ms == 0) {
    invalid("--poll-interval-ms must be positive");
  }
  return config;
}

}  // namespace courier::config
