#include <courier/schema/encoding/abi/fee_quote.hpp>

using namespace courier::schema;

namespace courier::schema::encoding::abi {

void encode(const fee_quote<1>& o, bytes_t& out) {
  append_uint256(out, o.native_fee);
  append_uint256(out, o.token_fee);
}

void decode(fee_quote<1>& o, const reader& in, const std::size_t position) {
  o.native_fee = in.read_uint256(position);
  o.token_fee = in.read_uint256(position + kWordSize);
}

}  // namespace courier::schema::encoding::abi
