#include <courier/schema/encoding/abi/transfer_parameters.hpp>

#include <array>
#include <iterator>

using namespace courier::schema;

namespace courier::schema::encoding::abi {

namespace {

constexpr auto kHeadWords = std::size_t{7};

}  // namespace

void encode(const transfer_parameters<1>& o, bytes_t& out) {
  auto tail = bytes_t{};
  auto offsets = std::array<std::size_t, 3>{};
  const auto dynamic = std::array<bytes_view_t, 3>{
      o.extra_options, o.compose_message, o.operation_command};
  for (std::size_t i = 0; i < dynamic.size(); ++i) {
    offsets[i] = (kHeadWords * kWordSize) + tail.size();
    append_bytes(tail, dynamic[i]);
  }

  append_uint32(out, o.destination_endpoint_id);
  append_bytes32(out, o.recipient);
  append_uint256(out, o.amount);
  append_uint256(out, o.minimum_amount);
  for (const auto offset : offsets) {
    append_offset(out, offset);
  }
  out.insert(std::end(out), std::begin(tail), std::end(tail));
}

void decode(transfer_parameters<1>& o,
            const reader& in,
            const std::size_t position) {
  o.destination_endpoint_id = in.read_uint32(position);
  o.recipient = in.read_bytes32(position + kWordSize);
  o.amount = in.read_uint256(position + (2 * kWordSize));
  o.minimum_amount = in.read_uint256(position + (3 * kWordSize));
  o.extra_options =
      in.read_bytes(in.read_offset(position + (4 * kWordSize), position));
  o.compose_message =
      in.read_bytes(in.read_offset(position + (5 * kWordSize), position));
  o.operation_command =
      in.read_bytes(in.read_offset(position + (6 * kWordSize), position));
}

}  // namespace courier::schema::encoding::abi
