#include <ferry/custody/token_ledger.hpp>
#include <ferry/schema/encoding/scale/encoder.hpp>
#include <ferry/schema/key/router_keys.hpp>

#include <string>
#include <tuple>

namespace ferry::custody::token_ledger {

namespace {

using encoder_t = ferry::schema::encoding::encoder<
    ferry::schema::encoding::scale_encoder_tag>;
using record_row_t = std::tuple<uint16_t,
                                ferry::schema::address_t,
                                ferry::schema::address_t,
                                std::string>;

}  // namespace

std::optional<ferry::schema::token_record_t> find(
    const state_t& state,
    const ferry::schema::token_id_t& token_id) {
  auto key = ferry::schema::key::make_token_key(token_id);
  auto encoder = encoder_t{};
  auto row = state.get<record_row_t>(
      encoder, ferry::schema::bytes_view_t{key.data(), key.size()});
  if (!row) {
    return std::nullopt;
  }
  return ferry::schema::token_record_t{.version = std::get<0>(*row),
                                       .owner = std::get<1>(*row),
                                       .approved = std::get<2>(*row),
                                       .token_uri = std::get<3>(*row)};
}

void store(state_t& state,
           const ferry::schema::token_id_t& token_id,
           const ferry::schema::token_record_t& record) {
  auto key = ferry::schema::key::make_token_key(token_id);
  auto encoder = encoder_t{};
  state.put(encoder, ferry::schema::bytes_view_t{key.data(), key.size()},
            record_row_t{record.version, record.owner, record.approved,
                         record.token_uri});
}

void remove(state_t& state, const ferry::schema::token_id_t& token_id) {
  auto key = ferry::schema::key::make_token_key(token_id);
  state.erase(ferry::schema::bytes_view_t{key.data(), key.size()});
}

std::optional<ferry::schema::address_t> owner_of(
    const state_t& state,
    const ferry::schema::token_id_t& token_id) {
  auto record = find(state, token_id);
  if (!record) {
    return std::nullopt;
  }
  return record->owner;
}

bool is_approved_or_owner(const ferry::schema::token_record_t& record,
                          const ferry::schema::address_t& account) {
  if (account == ferry::schema::make_zero_address()) {
    return false;
  }
  return record.owner == account || record.approved == account;
}

std::optional<ferry::schema::transaction_error_code> mint(
    state_t& state,
    const ferry::schema::address_t& owner,
    const ferry::schema::token_id_t& token_id,
    const std::string_view token_uri) {
  if (owner == ferry::schema::make_zero_address()) {
    return ferry::schema::transaction_error_code::invalid_recipient;
  }
  if (find(state, token_id).has_value()) {
    return ferry::schema::transaction_error_code::token_exists;
  }
  store(state, token_id,
        ferry::schema::token_record_t{.owner = owner,
                                      .token_uri = std::string{token_uri}});
  return std::nullopt;
}

std::optional<ferry::schema::transaction_error_code> approve(
    state_t& state,
    const ferry::schema::address_t& caller,
    const ferry::schema::token_id_t& token_id,
    const ferry::schema::address_t& spender) {
  auto record = find(state, token_id);
  if (!record) {
    return ferry::schema::transaction_error_code::token_missing;
  }
  if (record->owner != caller) {
    return ferry::schema::transaction_error_code::not_token_owner;
  }
  record->approved = spender;
  store(state, token_id, *record);
  return std::nullopt;
}

}  // namespace ferry::custody::token_ledger
