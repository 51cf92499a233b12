#include <spdlog/spdlog.h>
#include <ferry/custody/synthetic_custody.hpp>
#include <ferry/custody/token_ledger.hpp>

namespace ferry::custody {

std::optional<ferry::schema::transaction_error_code> synthetic_custody::debit(
    state_t& state,
    const ferry::schema::address_t& sender,
    const ferry::schema::token_id_t& token_id) {
  auto record = token_ledger::find(state, token_id);
  if (!record) {
    return ferry::schema::transaction_error_code::token_missing;
  }
  if (!token_ledger::is_approved_or_owner(*record, sender)) {
    return ferry::schema::transaction_error_code::not_token_owner;
  }
  token_ledger::remove(state, token_id);
  spdlog::debug("Burned token {}", token_id.str());
  return std::nullopt;
}

std::optional<ferry::schema::transaction_error_code> synthetic_custody::credit(
    state_t& state,
    const ferry::schema::address_t& recipient,
    const ferry::schema::token_id_t& token_id,
    const std::string_view token_uri) {
  auto error = token_ledger::mint(state, recipient, token_id, token_uri);
  if (!error) {
    spdlog::debug("Minted token {}", token_id.str());
  }
  return error;
}

}  // namespace ferry::custody
