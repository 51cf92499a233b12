#pragma once

#include <ferry/schema/primitives.hpp>
#include <ferry/schema/transaction_error_code.hpp>
#include <ferry/storage/pending_state.hpp>
#include <ferry/storage/rocksdb/storage.hpp>

#include <optional>
#include <string_view>

namespace ferry::custody {

using state_t =
    ferry::storage::pending_state<ferry::storage::rocksdb_storage_tag>;

/// Token custody strategy driven by the token router.
///
/// Both hooks write only through `state`; the router commits it after the
/// whole call succeeds, so a hook that fails, or a later dispatch failure,
/// leaves the ledger untouched. A hook returns std::nullopt on success.
class custody {
 public:
  virtual ~custody() = default;

  /// Revoke `sender`'s claim on `token_id` before it leaves this domain.
  virtual std::optional<ferry::schema::transaction_error_code> debit(
      state_t& state,
      const ferry::schema::address_t& sender,
      const ferry::schema::token_id_t& token_id) = 0;

  /// Grant `token_id` to `recipient` after it arrived from another domain.
  virtual std::optional<ferry::schema::transaction_error_code> credit(
      state_t& state,
      const ferry::schema::address_t& recipient,
      const ferry::schema::token_id_t& token_id,
      std::string_view token_uri) = 0;
};

}  // namespace ferry::custody
