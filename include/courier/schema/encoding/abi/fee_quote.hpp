#pragma once
#include <courier/schema/encoding/abi/primitives.hpp>
#include <courier/schema/fee_quote.hpp>

namespace courier::schema::encoding::abi {

/// Static tuple `(uint256,uint256)`, encoded in place.
void encode(const fee_quote<1>& o, bytes_t& out);
void decode(fee_quote<1>& o, const reader& in, std::size_t position);

}  // namespace courier::schema::encoding::abi
