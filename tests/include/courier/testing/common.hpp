#pragma once

#include <courier/schema/encoding/abi/encoder.hpp>
#include <courier/schema/primitives.hpp>
#include <courier/schema/route.hpp>
#include <courier/schema/selector.hpp>
#include <courier/schema/transfer_call.hpp>

#include <cstdint>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace courier::testing {

using encoder_t = courier::schema::encoding::encoder<
    courier::schema::encoding::abi_encoder_tag>;

inline courier::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = courier::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline courier::schema::address_t make_account(const uint8_t seed) {
  auto out = courier::schema::address_t{};
  out.fill(seed);
  return out;
}

inline courier::schema::transfer_call_t make_transfer_call(
    const courier::schema::address_t& refund) {
  auto call = courier::schema::transfer_call_t{};
  call.parameters.destination_endpoint_id = 30110;
  call.parameters.recipient = make_hash(0x40);
  call.parameters.amount = 1000000;
  call.parameters.minimum_amount = 950000;
  call.parameters.extra_options = courier::schema::bytes_t{0x00, 0x03};
  call.fee.native_fee = 123456789;
  call.fee.token_fee = 0;
  call.refund_address = refund;
  return call;
}

inline courier::schema::bytes_t make_approve_data() {
  auto data = courier::schema::bytes_t{std::begin(courier::schema::kApproveSelector),
                                       std::end(courier::schema::kApproveSelector)};
  data.insert(std::end(data), 64, 0x00);
  return data;
}

inline courier::schema::step_t make_step(std::string kind,
                                         courier::schema::bytes_t data,
                                         const uint8_t target_seed,
                                         const courier::schema::amount_t& value =
                                             0) {
  auto step = courier::schema::step_t{};
  step.kind = std::move(kind);
  step.chain_key = "base";
  step.transaction.data = std::move(data);
  step.transaction.to = make_account(target_seed);
  step.transaction.value = value;
  return step;
}

inline courier::schema::step_t make_approve_step() {
  return make_step("approve", make_approve_data(), 0x11);
}

inline courier::schema::step_t make_transfer_step(
    const courier::schema::address_t& refund,
    const courier::schema::amount_t& value = 123456789) {
  return make_step("bridge", encoder_t{}.encode(make_transfer_call(refund)),
                   0x22, value);
}

inline courier::schema::route_t make_route(
    std::string id,
    std::vector<courier::schema::step_t> steps) {
  auto route = courier::schema::route_t{};
  route.id = std::move(id);
  route.source_amount = 1000000;
  route.destination_amount = 999000;
  route.steps = std::move(steps);
  return route;
}

}  // namespace courier::testing
