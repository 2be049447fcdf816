#pragma once
#include <courier/schema/primitives.hpp>
#include <optional>
#include <span>

namespace courier::schema::encoding {

// Build time seam for wire formats. Each format provides a tag and a
// specialization; call sites name the tag once through an alias:
//
//   using encoder_t = encoder<abi_encoder_tag>;
//   auto call = encoder_t{}.decode<transfer_call_t>(raw);
template <typename Library>
struct encoder {
  template <typename T>
  courier::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, courier::schema::bytes_t& out);

  template <typename T>
  T decode(const courier::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const courier::schema::bytes_view_t& bytes);
};

}  // namespace courier::schema::encoding
