#pragma once
#include <courier/schema/primitives.hpp>
#include <algorithm>
#include <optional>

namespace courier::schema {

// keccak256("send((uint32,bytes32,uint256,uint256,bytes,bytes,bytes),(uint256,uint256),address)")
inline constexpr auto kTransferSelector = selector_t{0xc7, 0xc7, 0xf5, 0xb3};
// keccak256("approve(address,uint256)")
inline constexpr auto kApproveSelector = selector_t{0x09, 0x5e, 0xa7, 0xb3};

/// Leading 4 bytes of call data, or std::nullopt when shorter than that.
inline std::optional<selector_t> selector_of(const bytes_view_t& call_data) {
  if (call_data.size() < 4) {
    return std::nullopt;
  }
  auto selector = selector_t{};
  std::copy_n(call_data.begin(), selector.size(), selector.begin());
  return selector;
}

}  // namespace courier::schema
