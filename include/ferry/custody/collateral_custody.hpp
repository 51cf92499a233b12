#pragma once

#include <ferry/custody/custody.hpp>

namespace ferry::custody {

/// Lock into escrow on departure, release from escrow on arrival.
///
/// Used on the collection's home domain, where tokens must keep existing while
/// a bridged copy circulates elsewhere. The escrow account is normally the
/// router's own address.
class collateral_custody final : public custody {
 public:
  explicit collateral_custody(const ferry::schema::address_t& escrow);

  std::optional<ferry::schema::transaction_error_code> debit(
      state_t& state,
      const ferry::schema::address_t& sender,
      const ferry::schema::token_id_t& token_id) override;

  std::optional<ferry::schema::transaction_error_code> credit(
      state_t& state,
      const ferry::schema::address_t& recipient,
      const ferry::schema::token_id_t& token_id,
      std::string_view token_uri) override;

  const ferry::schema::address_t& escrow() const { return escrow_; }

 private:
  ferry::schema::address_t escrow_;
};

}  // namespace ferry::custody
