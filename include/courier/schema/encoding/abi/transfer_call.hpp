#pragma once
#include <courier/schema/encoding/abi/primitives.hpp>
#include <courier/schema/transfer_call.hpp>

namespace courier::schema::encoding::abi {

/// Full call data: transfer selector followed by the argument block.
void encode(const transfer_call<1>& o, bytes_t& out);

/// Throws `courier::common::decode_error`: selector mismatch when the first
/// four bytes are not the transfer selector, malformed otherwise.
void decode(transfer_call<1>& o, const bytes_view_t& call_data);

}  // namespace courier::schema::encoding::abi
