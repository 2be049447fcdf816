#include <courier/common/error.hpp>
#include <courier/schema/encoding/abi/primitives.hpp>

#include <boost/endian/conversion.hpp>
#include <boost/multiprecision/cpp_int.hpp>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <iterator>
#include <limits>

namespace courier::schema::encoding::abi {

namespace {

[[noreturn]] void throw_malformed(const std::string& message) {
  throw courier::common::decode_error{
      courier::common::error_code::decode_malformed, message};
}

}  // namespace

void append_uint256(bytes_t& out, const amount_t& value) {
  auto minimal = bytes_t{};
  boost::multiprecision::export_bits(value, std::back_inserter(minimal), 8);
  out.insert(std::end(out), kWordSize - minimal.size(), 0);
  out.insert(std::end(out), std::begin(minimal), std::end(minimal));
}

void append_uint32(bytes_t& out, const uint32_t value) {
  auto big_endian = std::array<uint8_t, sizeof(uint32_t)>{};
  boost::endian::store_big_u32(big_endian.data(), value);
  out.insert(std::end(out), kWordSize - big_endian.size(), 0);
  out.insert(std::end(out), std::begin(big_endian), std::end(big_endian));
}

void append_offset(bytes_t& out, const std::size_t offset) {
  append_uint256(out, amount_t{offset});
}

void append_bytes32(bytes_t& out, const hash32_t& value) {
  out.insert(std::end(out), std::begin(value), std::end(value));
}

void append_address(bytes_t& out, const address_t& value) {
  out.insert(std::end(out), kWordSize - value.size(), 0);
  out.insert(std::end(out), std::begin(value), std::end(value));
}

void append_bytes(bytes_t& out, const bytes_view_t& value) {
  append_offset(out, value.size());
  out.insert(std::end(out), std::begin(value), std::end(value));
  out.insert(std::end(out), padded_size(value.size()) - value.size(), 0);
}

reader::reader(const bytes_view_t data) : data_{data} {}

bytes_view_t reader::word(const std::size_t position) const {
  if (position > data_.size() || (data_.size() - position) < kWordSize) {
    throw_malformed(fmt::format(
        "word at byte {} exceeds argument block of {} bytes", position,
        data_.size()));
  }
  return data_.subspan(position, kWordSize);
}

void reader::require_zero(const bytes_view_t bytes, const char* what) const {
  if (std::ranges::any_of(bytes, [](const uint8_t b) { return b != 0; })) {
    throw_malformed(fmt::format("non-zero padding in {}", what));
  }
}

std::size_t reader::read_size(const std::size_t position,
                              const char* what) const {
  auto value = word(position);
  constexpr auto kSizeBytes = sizeof(uint64_t);
  require_zero(value.first(kWordSize - kSizeBytes), what);
  auto raw = boost::endian::load_big_u64(value.data() + kWordSize - kSizeBytes);
  if (raw > std::numeric_limits<std::size_t>::max()) {
    throw_malformed(fmt::format("{} does not fit in memory", what));
  }
  return static_cast<std::size_t>(raw);
}

amount_t reader::read_uint256(const std::size_t position) const {
  auto value = word(position);
  auto out = amount_t{};
  boost::multiprecision::import_bits(out, std::begin(value), std::end(value),
                                     8);
  return out;
}

uint32_t reader::read_uint32(const std::size_t position) const {
  auto value = word(position);
  require_zero(value.first(kWordSize - sizeof(uint32_t)), "uint32 word");
  return boost::endian::load_big_u32(value.data() + kWordSize -
                                     sizeof(uint32_t));
}

hash32_t reader::read_bytes32(const std::size_t position) const {
  auto value = word(position);
  auto out = hash32_t{};
  std::ranges::copy(value, std::begin(out));
  return out;
}

address_t reader::read_address(const std::size_t position) const {
  auto value = word(position);
  auto out = address_t{};
  require_zero(value.first(kWordSize - out.size()), "address word");
  std::ranges::copy(value.last(out.size()), std::begin(out));
  return out;
}

std::size_t reader::read_offset(const std::size_t position,
                                const std::size_t base) const {
  auto offset = read_size(position, "dynamic offset");
  if (base > data_.size() || offset > (data_.size() - base)) {
    throw_malformed(fmt::format(
        "dynamic offset {} from byte {} exceeds argument block of {} bytes",
        offset, base, data_.size()));
  }
  return base + offset;
}

bytes_t reader::read_bytes(const std::size_t position) const {
  auto length = read_size(position, "byte string length");
  auto start = position + kWordSize;
  auto available = data_.size() - start;
  if (length > available || padded_size(length) > available) {
    throw_malformed(fmt::format(
        "byte string of {} bytes at byte {} is truncated", length, position));
  }
  require_zero(data_.subspan(start + length, padded_size(length) - length),
               "byte string tail");
  auto content = data_.subspan(start, length);
  return bytes_t{std::begin(content), std::end(content)};
}

}  // namespace courier::schema::encoding::abi
