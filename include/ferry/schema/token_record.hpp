#pragma once
#include <ferry/schema/primitives.hpp>
#include <string>

// Schema type: token record.
// Ledger row for one token held by a custody strategy. A zero `approved`
// address means no approval is outstanding.
namespace ferry::schema {

template <uint16_t Version>
struct token_record;

template <>
struct token_record<1> final {
  uint16_t version{1};
  address_t owner{};
  address_t approved{};
  std::string token_uri;
};

using token_record_t = token_record<1>;

}  // namespace ferry::schema
