#include <boost/program_options.hpp>
#include <courier/common/critical.hpp>
#include <courier/common/error.hpp>
#include <courier/execution/step_classifier.hpp>
#include <courier/schema/encoding/abi/encoder.hpp>
#include <courier/schema/selector.hpp>
#include <courier/schema/transfer_call.hpp>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

using encoder_t = courier::schema::encoding::encoder<
    courier::schema::encoding::abi_encoder_tag>;
namespace po = boost::program_options;

std::string require(const po::variables_map& vm, const char* name) {
  if (!vm.contains(name)) {
    courier::common::critical("missing --{}", name);
  }
  return vm[name].as<std::string>();
}

courier::schema::bytes_t get_bytes(const po::variables_map& vm,
                                   const char* name) {
  auto bytes = courier::schema::try_from_hex(vm[name].as<std::string>());
  if (!bytes) {
    courier::common::critical("--{} must be hex", name);
  }
  return *bytes;
}

courier::schema::amount_t get_amount(const po::variables_map& vm,
                                     const char* name) {
  auto amount = courier::schema::try_make_amount(vm[name].as<std::string>());
  if (!amount) {
    courier::common::critical("--{} must be an unsigned 256-bit amount",
                              name);
  }
  return *amount;
}

courier::schema::address_t get_address(const po::variables_map& vm,
                                       const char* name) {
  auto address = courier::schema::try_make_address(require(vm, name));
  if (!address) {
    courier::common::critical("--{} must be a 20-byte hex address", name);
  }
  return *address;
}

void print_call(const courier::schema::transfer_call_t& call) {
  using courier::schema::to_0x_hex;
  using courier::schema::to_string;
  const auto& parameters = call.parameters;
  std::cout << "selector=" << to_string(courier::schema::kTransferSelector)
            << '\n'
            << "destination_endpoint_id=" << parameters.destination_endpoint_id
            << '\n'
            << "recipient=" << to_string(parameters.recipient) << '\n'
            << "amount=" << to_string(parameters.amount) << '\n'
            << "minimum_amount=" << to_string(parameters.minimum_amount)
            << '\n'
            << "extra_options=" << to_0x_hex(parameters.extra_options) << '\n'
            << "compose_message=" << to_0x_hex(parameters.compose_message)
            << '\n'
            << "operation_command=" << to_0x_hex(parameters.operation_command)
            << '\n'
            << "native_fee=" << to_string(call.fee.native_fee) << '\n'
            << "token_fee=" << to_string(call.fee.token_fee) << '\n'
            << "refund_address=" << to_string(call.refund_address) << '\n';
}

courier::schema::transfer_call_t build_call(const po::variables_map& vm) {
  auto call = courier::schema::transfer_call_t{};
  call.parameters.destination_endpoint_id =
      vm["destination-eid"].as<uint32_t>();
  auto recipient = courier::schema::try_make_hash32(require(vm, "recipient"));
  if (!recipient) {
    courier::common::critical("--recipient must be 32 bytes of hex");
  }
  call.parameters.recipient = *recipient;
  call.parameters.amount = get_amount(vm, "amount");
  call.parameters.minimum_amount = get_amount(vm, "min-amount");
  call.parameters.extra_options = get_bytes(vm, "extra-options");
  call.parameters.compose_message = get_bytes(vm, "compose-message");
  call.parameters.operation_command = get_bytes(vm, "operation-command");
  call.fee.native_fee = get_amount(vm, "native-fee");
  call.fee.token_fee = get_amount(vm, "token-fee");
  call.refund_address = get_address(vm, "refund-address");
  return call;
}

int classify_calls(const std::vector<std::string>& inputs) {
  auto steps = std::vector<courier::schema::step_t>{};
  for (const auto& input : inputs) {
    auto bytes = courier::schema::try_from_hex(input);
    if (!bytes) {
      courier::common::critical("--data must be hex");
    }
    auto step = courier::schema::step_t{};
    step.kind = "step";
    step.transaction.data = std::move(*bytes);
    steps.push_back(std::move(step));
  }

  auto classification = courier::execution::classify(steps);
  for (const auto& summary : classification.summaries) {
    std::cout << "step " << summary.index << " selector="
              << (summary.selector
                      ? courier::schema::to_string(*summary.selector)
                      : std::string{"none"})
              << '\n';
  }
  std::cout << "approval="
            << (classification.approval
                    ? std::to_string(classification.approval->index)
                    : std::string{"none"})
            << '\n'
            << "transfer="
            << (classification.transfer
                    ? std::to_string(classification.transfer->index)
                    : std::string{"none"})
            << '\n';
  return classification.transfer ? 0 : 2;
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  calldata_builder decode --data <hex>\n"
            << "  calldata_builder encode [call fields]\n"
            << "  calldata_builder override-refund --data <hex> "
               "--refund-address <address>\n"
            << "  calldata_builder classify --data <hex> [--data <hex> ...]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"calldata_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "decode|encode|override-refund|classify")(
      "data", po::value<std::vector<std::string>>()->multitoken(),
      "call data hex; repeat for classify")(
      "refund-address", po::value<std::string>(), "20-byte refund address")(
      "destination-eid", po::value<uint32_t>()->default_value(0),
      "destination endpoint id")("recipient", po::value<std::string>(),
                                 "32-byte recipient hex")(
      "amount", po::value<std::string>()->default_value("0"),
      "amount in base units")("min-amount",
                              po::value<std::string>()->default_value("0"),
                              "minimum received amount")(
      "extra-options", po::value<std::string>()->default_value(""),
      "extra options hex")("compose-message",
                           po::value<std::string>()->default_value(""),
                           "compose message hex")(
      "operation-command", po::value<std::string>()->default_value(""),
      "operation command hex")("native-fee",
                               po::value<std::string>()->default_value("0"),
                               "native fee")(
      "token-fee", po::value<std::string>()->default_value("0"),
      "token fee");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    courier::common::critical("invalid arguments: {}", ex.what());
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  auto encoder = encoder_t{};
  auto data = std::vector<std::string>{};
  if (vm.contains("data")) {
    data = vm["data"].as<std::vector<std::string>>();
  }
  auto single_call = [&]() {
    if (data.size() != 1) {
      courier::common::critical("{} requires exactly one --data", command);
    }
    auto bytes = courier::schema::try_from_hex(data.front());
    if (!bytes) {
      courier::common::critical("--data must be hex");
    }
    return *bytes;
  };

  try {
    if (command == "decode") {
      print_call(encoder.decode<courier::schema::transfer_call_t>(
          single_call()));
      return 0;
    }

    if (command == "encode") {
      std::cout << courier::schema::to_0x_hex(encoder.encode(build_call(vm)))
                << '\n';
      return 0;
    }

    if (command == "override-refund") {
      auto call =
          encoder.decode<courier::schema::transfer_call_t>(single_call());
      call.refund_address = get_address(vm, "refund-address");
      std::cout << courier::schema::to_0x_hex(encoder.encode(call)) << '\n';
      return 0;
    }
  } catch (const courier::common::decode_error& ex) {
    std::cerr << courier::common::to_string(ex.code()) << ": " << ex.what()
              << '\n';
    return 1;
  }

  if (command == "classify") {
    if (data.empty()) {
      courier::common::critical("classify requires at least one --data");
    }
    return classify_calls(data);
  }

  courier::common::critical(
      "command must be decode|encode|override-refund|classify");
}
