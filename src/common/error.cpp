#include <courier/common/error.hpp>

namespace courier::common {

std::string_view to_string(const error_code code) {
  switch (code) {
    case error_code::invalid_configuration:
      return "invalid_configuration";
    case error_code::quote_fetch_failed:
      return "quote_fetch_failed";
    case error_code::no_matching_route:
      return "no_matching_route";
    case error_code::decode_selector_mismatch:
      return "decode_selector_mismatch";
    case error_code::decode_malformed:
      return "decode_malformed";
    case error_code::encode_verification_failed:
      return "encode_verification_failed";
    case error_code::http_transport:
      return "http_transport";
    case error_code::ledger_transport:
      return "ledger_transport";
    case error_code::ledger_rejected:
      return "ledger_rejected";
    case error_code::confirmation_timeout:
      return "confirmation_timeout";
  }
  return "unknown";
}

error::error(const error_code code, const std::string& message)
    : std::runtime_error{message}, code_{code} {}

}  // namespace courier::common
