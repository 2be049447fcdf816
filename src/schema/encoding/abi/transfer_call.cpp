#include <courier/common/error.hpp>
#include <courier/schema/encoding/abi/fee_quote.hpp>
#include <courier/schema/encoding/abi/transfer_call.hpp>
#include <courier/schema/encoding/abi/transfer_parameters.hpp>
#include <courier/schema/selector.hpp>

#include <spdlog/fmt/fmt.h>

#include <iterator>

using namespace courier::schema;

namespace courier::schema::encoding::abi {

namespace {

// parameters offset, native fee, token fee, refund address
constexpr auto kHeadWords = std::size_t{4};

}  // namespace

void encode(const transfer_call<1>& o, bytes_t& out) {
  out.insert(std::end(out), std::begin(kTransferSelector),
             std::end(kTransferSelector));
  append_offset(out, kHeadWords * kWordSize);
  encode(o.fee, out);
  append_address(out, o.refund_address);
  encode(o.parameters, out);
}

void decode(transfer_call<1>& o, const bytes_view_t& call_data) {
  auto selector = selector_of(call_data);
  if (!selector || *selector != kTransferSelector) {
    throw courier::common::decode_error{
        courier::common::error_code::decode_selector_mismatch,
        fmt::format("expected selector {}, found {}",
                    to_string(kTransferSelector),
                    selector ? to_string(*selector)
                             : to_0x_hex(call_data))};
  }

  auto in = reader{call_data.subspan(kTransferSelector.size())};
  auto parameters_position = in.read_offset(0, 0);
  decode(o.fee, in, kWordSize);
  o.refund_address = in.read_address(3 * kWordSize);
  decode(o.parameters, in, parameters_position);
}

}  // namespace courier::schema::encoding::abi
