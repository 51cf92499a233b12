#pragma once

#include <ferry/schema/primitives.hpp>
#include <ferry/schema/transaction_event.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace ferry::schema {

/// Outcome of one router entry point.
///
/// `code == 0` means the call committed. Non-zero codes come from
/// `transaction_error_code`; failed calls carry no events and persist nothing.
template <uint16_t Version>
struct transaction_result;

template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<transaction_event_t> events;
};

using transaction_result_t = transaction_result<1>;

}  // namespace ferry::schema
