#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace courier::common {

enum class error_code : uint32_t {
  invalid_configuration = 1,
  quote_fetch_failed = 2,
  no_matching_route = 3,
  decode_selector_mismatch = 4,
  decode_malformed = 5,
  encode_verification_failed = 6,
  http_transport = 7,
  ledger_transport = 8,
  ledger_rejected = 9,
  confirmation_timeout = 10,
};

std::string_view to_string(error_code code);

/// Base for every runtime failure raised by courier.
///
/// Run-fatal errors (quote, route selection, codec) propagate to the caller.
/// Ledger errors are caught by the orchestrator and scoped to one route.
class error : public std::runtime_error {
 public:
  error(error_code code, const std::string& message);

  error_code code() const noexcept { return code_; }

 private:
  error_code code_;
};

class quote_fetch_error final : public error {
 public:
  explicit quote_fetch_error(const std::string& message)
      : error{error_code::quote_fetch_failed, message} {}
};

class no_matching_route_error final : public error {
 public:
  explicit no_matching_route_error(const std::string& message)
      : error{error_code::no_matching_route, message} {}
};

/// Raised by the call codec. `code()` is either `decode_selector_mismatch`
/// or `decode_malformed`.
class decode_error final : public error {
 public:
  using error::error;

  bool selector_mismatch() const noexcept {
    return code() == error_code::decode_selector_mismatch;
  }
};

class encode_verification_error final : public error {
 public:
  explicit encode_verification_error(const std::string& message)
      : error{error_code::encode_verification_failed, message} {}
};

class http_error final : public error {
 public:
  explicit http_error(const std::string& message)
      : error{error_code::http_transport, message} {}
};

/// Raised by ledger clients. `code()` is `ledger_transport`,
/// `ledger_rejected` or `confirmation_timeout`.
class ledger_error final : public error {
 public:
  using error::error;
};

}  // namespace courier::common
