#include <courier/common/critical.hpp>
#include <courier/schema/primitives.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <limits>
#include <string_view>

namespace courier::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::optional<courier::schema::bytes_t> try_from_hex_internal(
    std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = courier::schema::bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

template <std::size_t N>
std::optional<std::array<uint8_t, N>> try_make_fixed_internal(
    std::string_view hex) {
  auto decoded = try_from_hex_internal(hex);
  if (!decoded || decoded->size() != N) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, N>{};
  std::copy(decoded->begin(), decoded->end(), out.begin());
  return out;
}

std::optional<uint8_t> digit_value(const char c, const uint32_t base) {
  auto nibble = hex_nibble(c);
  if (!nibble || *nibble >= base) {
    return std::nullopt;
  }
  return nibble;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

hash32_t make_hash32(const bytes_t& bytes) {
  if (bytes.size() != 32) {
    courier::common::critical("make_hash32 expected exactly 32 bytes");
  }
  auto hash = hash32_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(hash));
  return hash;
}

hash32_t make_hash32(const std::string_view& hex) {
  auto hash = try_make_fixed_internal<32>(hex);
  if (!hash) {
    courier::common::critical("make_hash32 expected 64 hex characters");
  }
  return *hash;
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  return try_make_fixed_internal<32>(hex);
}

hash32_t make_zero_hash() {
  return {};
}

address_t make_address(const std::string_view& hex) {
  auto address = try_make_fixed_internal<20>(hex);
  if (!address) {
    courier::common::critical("make_address expected 40 hex characters");
  }
  return *address;
}

std::optional<address_t> try_make_address(const std::string_view& hex) {
  return try_make_fixed_internal<20>(hex);
}

std::optional<amount_t> try_make_amount(const std::string_view& text) {
  auto digits = text;
  auto base = uint32_t{10};
  if (digits.size() >= 2 && digits[0] == '0' &&
      (digits[1] == 'x' || digits[1] == 'X')) {
    digits.remove_prefix(2);
    base = 16;
  }
  if (digits.empty()) {
    return std::nullopt;
  }

  const auto max = std::numeric_limits<amount_t>::max();
  auto value = amount_t{0};
  for (const auto c : digits) {
    auto digit = digit_value(c, base);
    if (!digit) {
      return std::nullopt;
    }
    if (value > (max - *digit) / base) {
      return std::nullopt;
    }
    value = (value * base) + *digit;
  }
  return value;
}

amount_t make_amount(const std::string_view& text) {
  auto amount = try_make_amount(text);
  if (!amount) {
    courier::common::critical("invalid 256-bit amount");
  }
  return *amount;
}

std::string to_hex(const courier::schema::bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::string to_0x_hex(const courier::schema::bytes_view_t& bytes) {
  return "0x" + to_hex(bytes);
}

std::optional<bytes_t> try_from_hex(const std::string_view hex) {
  return try_from_hex_internal(hex);
}

bytes_t from_hex(const std::string_view hex) {
  auto decoded = try_from_hex_internal(hex);
  if (!decoded.has_value()) {
    courier::common::critical("invalid hex input");
  }
  return *decoded;
}

std::string to_string(const address_t& address) {
  return to_0x_hex(address);
}

std::string to_string(const hash32_t& hash) {
  return to_0x_hex(hash);
}

std::string to_string(const selector_t& selector) {
  return to_0x_hex(selector);
}

std::string to_string(const amount_t& amount) {
  return amount.str();
}

std::string to_hex_quantity(const amount_t& amount) {
  auto digits = amount.str(0, std::ios_base::hex);
  std::ranges::transform(digits, digits.begin(), [](const unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return "0x" + digits;
}

}  // namespace courier::schema
