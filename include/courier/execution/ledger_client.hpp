#pragma once

#include <courier/schema/confirmation.hpp>
#include <courier/schema/primitives.hpp>
#include <optional>

namespace courier::execution {

using submission_handle_t = courier::schema::hash32_t;

/// Network collaborator that broadcasts calls and waits for their receipts.
///
/// Both operations block and may throw (`courier::common::ledger_error` for
/// transport, rejection and timeout).
class ledger_client {
 public:
  virtual ~ledger_client() = default;

  /// Broadcast a call from the configured sender account.
  virtual submission_handle_t submit(
      const courier::schema::address_t& to,
      const courier::schema::bytes_t& data,
      const std::optional<courier::schema::amount_t>& value) = 0;

  /// Block until the call identified by `handle` is included.
  virtual courier::schema::confirmation_t await_confirmation(
      const submission_handle_t& handle) = 0;
};

}  // namespace courier::execution
