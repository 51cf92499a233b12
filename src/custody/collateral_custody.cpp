#include <spdlog/spdlog.h>
#include <ferry/custody/collateral_custody.hpp>
#include <ferry/custody/token_ledger.hpp>

namespace ferry::custody {

collateral_custody::collateral_custody(const ferry::schema::address_t& escrow)
    : escrow_{escrow} {}

std::optional<ferry::schema::transaction_error_code> collateral_custody::debit(
    state_t& state,
    const ferry::schema::address_t& sender,
    const ferry::schema::token_id_t& token_id) {
  auto record = token_ledger::find(state, token_id);
  if (!record) {
    return ferry::schema::transaction_error_code::token_missing;
  }
  if (record->owner == escrow_ ||
      !token_ledger::is_approved_or_owner(*record, sender)) {
    return ferry::schema::transaction_error_code::not_token_owner;
  }
  record->owner = escrow_;
  record->approved = ferry::schema::make_zero_address();
  token_ledger::store(state, token_id, *record);
  spdlog::debug("Locked token {} in escrow", token_id.str());
  return std::nullopt;
}

// The uri travels with the message but the home collection already holds
// the authoritative one, so it is left unchanged.
std::optional<ferry::schema::transaction_error_code> collateral_custody::credit(
    state_t& state,
    const ferry::schema::address_t& recipient,
    const ferry::schema::token_id_t& token_id,
    const std::string_view token_uri) {
  static_cast<void>(token_uri);
  if (recipient == ferry::schema::make_zero_address()) {
    return ferry::schema::transaction_error_code::invalid_recipient;
  }
  auto record = token_ledger::find(state, token_id);
  if (!record || record->owner != escrow_) {
    return ferry::schema::transaction_error_code::token_not_escrowed;
  }
  record->owner = recipient;
  record->approved = ferry::schema::make_zero_address();
  token_ledger::store(state, token_id, *record);
  spdlog::debug("Released token {} from escrow", token_id.str());
  return std::nullopt;
}

}  // namespace ferry::custody
