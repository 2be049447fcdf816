#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace courier::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = std::array<uint8_t, 20>;
using selector_t = std::array<uint8_t, 4>;
using amount_t = boost::multiprecision::uint256_t;
using duration_milliseconds_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

/// Parse a 20-byte account from `0x`-prefixed (or bare) hex; case-insensitive.
address_t make_address(const std::string_view& hex);
std::optional<address_t> try_make_address(const std::string_view& hex);

/// Parse an unsigned 256-bit amount from decimal or `0x` hex text.
///
/// Returns std::nullopt on empty input, stray characters or overflow.
std::optional<amount_t> try_make_amount(const std::string_view& text);
amount_t make_amount(const std::string_view& text);

/// Lowercase hex without prefix.
std::string to_hex(const bytes_view_t& bytes);
/// Lowercase hex with `0x` prefix.
std::string to_0x_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);
bytes_t from_hex(std::string_view hex);

std::string to_string(const address_t& address);
std::string to_string(const hash32_t& hash);
std::string to_string(const selector_t& selector);
std::string to_string(const amount_t& amount);

/// JSON-RPC quantity form: `0x` followed by lowercase hex without leading
/// zeros (`0x0` for zero).
std::string to_hex_quantity(const amount_t& amount);

}  // namespace courier::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
