#pragma once
#include <courier/schema/primitives.hpp>
#include <cstddef>
#include <cstdint>

// Word level helpers for the structured-call (contract ABI) encoding. Every
// value occupies one or more 32-byte words; integers are big-endian and left
// padded, byte strings are length prefixed and right padded.
namespace courier::schema::encoding::abi {

inline constexpr auto kWordSize = std::size_t{32};

/// Size of `length` bytes once right padded to a word boundary.
constexpr std::size_t padded_size(const std::size_t length) {
  return ((length + kWordSize - 1) / kWordSize) * kWordSize;
}

void append_uint256(bytes_t& out, const amount_t& value);
void append_uint32(bytes_t& out, uint32_t value);
void append_offset(bytes_t& out, std::size_t offset);
void append_bytes32(bytes_t& out, const hash32_t& value);
void append_address(bytes_t& out, const address_t& value);
/// Length word followed by `value` right padded with zeros.
void append_bytes(bytes_t& out, const bytes_view_t& value);

/// Bounds-checked view over an encoded argument block.
///
/// Positions are absolute byte offsets into the block. Every accessor throws
/// `courier::common::decode_error` (malformed) when the requested word lies
/// outside the block or its padding is not zero.
class reader final {
 public:
  explicit reader(bytes_view_t data);

  std::size_t size() const { return data_.size(); }

  amount_t read_uint256(std::size_t position) const;
  uint32_t read_uint32(std::size_t position) const;
  hash32_t read_bytes32(std::size_t position) const;
  address_t read_address(std::size_t position) const;

  /// Dynamic offset stored at `position`, rebased onto `base` and checked to
  /// land inside the block.
  std::size_t read_offset(std::size_t position, std::size_t base) const;

  /// Length-prefixed byte string whose length word starts at `position`.
  bytes_t read_bytes(std::size_t position) const;

 private:
  bytes_view_t word(std::size_t position) const;
  void require_zero(bytes_view_t bytes, const char* what) const;
  std::size_t read_size(std::size_t position, const char* what) const;

  bytes_view_t data_;
};

}  // namespace courier::schema::encoding::abi
