#pragma once
#include <courier/common/error.hpp>
#include <courier/schema/encoding/abi/fee_quote.hpp>
#include <courier/schema/encoding/abi/primitives.hpp>
#include <courier/schema/encoding/abi/transfer_call.hpp>
#include <courier/schema/encoding/abi/transfer_parameters.hpp>
#include <courier/schema/encoding/encoder.hpp>
#include <spdlog/spdlog.h>
#include <iterator>

namespace courier::schema::encoding {

struct abi_encoder_tag {};

template <>
struct encoder<abi_encoder_tag> final {
  template <typename T>
  courier::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, courier::schema::bytes_t& out);

  template <typename T>
  T decode(const courier::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const courier::schema::bytes_view_t& bytes);
};

template <typename T>
courier::schema::bytes_t encoder<abi_encoder_tag>::encode(const T& obj) {
  auto encoded = courier::schema::bytes_t{};
  encode(obj, encoded);
  return encoded;
}

template <typename T>
void encoder<abi_encoder_tag>::encode(const T& obj,
                                      courier::schema::bytes_t& out) {
  abi::encode(obj, out);
}

template <typename T>
T encoder<abi_encoder_tag>::decode(
    const courier::schema::bytes_view_t& bytes) {
  auto decoded = T{};
  abi::decode(decoded, bytes);
  return decoded;
}

template <typename T>
std::optional<T> encoder<abi_encoder_tag>::try_decode(
    const courier::schema::bytes_view_t& bytes) {
  try {
    return decode<T>(bytes);
  } catch (const courier::common::decode_error& ex) {
    spdlog::debug("ABI decode rejected {} byte(s): {}", bytes.size(),
                  ex.what());
    return std::nullopt;
  }
}

}  // namespace courier::schema::encoding
