#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

namespace ferry::schema {

// Codes 1-9 guard the inbound trust boundary, 10-19 come from custody,
// 20-29 from dispatch and 30+ from router administration.
enum class transaction_error_code : uint32_t {
  unauthorized_caller = 1,
  unenrolled_router = 2,
  malformed_payload = 3,
  token_missing = 10,
  not_token_owner = 11,
  token_exists = 12,
  token_not_escrowed = 13,
  invalid_recipient = 14,
  destination_unenrolled = 20,
  dispatch_failed = 21,
  not_router_owner = 30,
  local_domain_enrollment = 31,
};

inline constexpr auto kTransactionErrorCodeNames =
    std::array<std::pair<transaction_error_code, std::string_view>, 12>{{
        {transaction_error_code::unauthorized_caller, "unauthorized_caller"},
        {transaction_error_code::unenrolled_router, "unenrolled_router"},
        {transaction_error_code::malformed_payload, "malformed_payload"},
        {transaction_error_code::token_missing, "token_missing"},
        {transaction_error_code::not_token_owner, "not_token_owner"},
        {transaction_error_code::token_exists, "token_exists"},
        {transaction_error_code::token_not_escrowed, "token_not_escrowed"},
        {transaction_error_code::invalid_recipient, "invalid_recipient"},
        {transaction_error_code::destination_unenrolled,
         "destination_unenrolled"},
        {transaction_error_code::dispatch_failed, "dispatch_failed"},
        {transaction_error_code::not_router_owner, "not_router_owner"},
        {transaction_error_code::local_domain_enrollment,
         "local_domain_enrollment"},
    }};

/// Name used in result logs, or "unknown" for a value outside the table.
constexpr std::string_view to_string(const transaction_error_code value) {
  for (const auto& [code, name] : kTransactionErrorCodeNames) {
    if (code == value) {
      return name;
    }
  }
  return "unknown";
}

constexpr std::optional<transaction_error_code> try_parse_error_code(
    const std::string_view name) {
  for (const auto& [code, code_name] : kTransactionErrorCodeNames) {
    if (code_name == name) {
      return code;
    }
  }
  return std::nullopt;
}

}  // namespace ferry::schema
