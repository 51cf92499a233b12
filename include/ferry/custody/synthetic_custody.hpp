#pragma once

#include <ferry/custody/custody.hpp>

namespace ferry::custody {

/// Burn on departure, mint on arrival.
///
/// Used on domains where the collection exists only as a bridged copy of a
/// collection that lives elsewhere.
class synthetic_custody final : public custody {
 public:
  std::optional<ferry::schema::transaction_error_code> debit(
      state_t& state,
      const ferry::schema::address_t& sender,
      const ferry::schema::token_id_t& token_id) override;

  std::optional<ferry::schema::transaction_error_code> credit(
      state_t& state,
      const ferry::schema::address_t& recipient,
      const ferry::schema::token_id_t& token_id,
      std::string_view token_uri) override;
};

}  // namespace ferry::custody
