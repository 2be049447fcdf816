#pragma once
#include <courier/schema/encoding/abi/primitives.hpp>
#include <courier/schema/transfer_parameters.hpp>

namespace courier::schema::encoding::abi {

/// Tuple `(uint32,bytes32,uint256,uint256,bytes,bytes,bytes)`; offsets are
/// relative to the start of the tuple.
void encode(const transfer_parameters<1>& o, bytes_t& out);
void decode(transfer_parameters<1>& o, const reader& in, std::size_t position);

}  // namespace courier::schema::encoding::abi
