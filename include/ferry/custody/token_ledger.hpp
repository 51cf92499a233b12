#pragma once

#include <ferry/custody/custody.hpp>
#include <ferry/schema/token_record.hpp>

#include <optional>
#include <string_view>

// Ownership rows shared by the bundled custody strategies.
namespace ferry::custody::token_ledger {

std::optional<ferry::schema::token_record_t> find(
    const state_t& state,
    const ferry::schema::token_id_t& token_id);

void store(state_t& state,
           const ferry::schema::token_id_t& token_id,
           const ferry::schema::token_record_t& record);

void remove(state_t& state, const ferry::schema::token_id_t& token_id);

std::optional<ferry::schema::address_t> owner_of(
    const state_t& state,
    const ferry::schema::token_id_t& token_id);

/// True when `account` owns `token_id` or holds its approval.
bool is_approved_or_owner(const ferry::schema::token_record_t& record,
                          const ferry::schema::address_t& account);

/// Create `token_id` for `owner`. Fails when the id is taken or the owner is
/// the zero address.
std::optional<ferry::schema::transaction_error_code> mint(
    state_t& state,
    const ferry::schema::address_t& owner,
    const ferry::schema::token_id_t& token_id,
    std::string_view token_uri);

/// Let `spender` move `token_id` on the owner's behalf. Only the owner may
/// approve; the approval is cleared whenever the token moves.
std::optional<ferry::schema::transaction_error_code> approve(
    state_t& state,
    const ferry::schema::address_t& caller,
    const ferry::schema::token_id_t& token_id,
    const ferry::schema::address_t& spender);

}  // namespace ferry::custody::token_ledger
