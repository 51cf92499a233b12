#pragma once

#include <ferry/custody/custody.hpp>
#include <ferry/mailbox/mailbox.hpp>
#include <ferry/schema/primitives.hpp>
#include <ferry/schema/transaction_result.hpp>
#include <ferry/storage/rocksdb/storage.hpp>

#include <mutex>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace ferry::routing {

/// Caller of an outbound transfer and the fee attached to it.
struct call_context final {
  ferry::schema::address_t sender{};
  ferry::schema::amount_t value{};
};

using remote_router_t =
    std::pair<ferry::schema::domain_t, ferry::schema::hash32_t>;

/// Moves non-fungible tokens between domains through a mailbox.
///
/// Outbound: debit custody, encode, dispatch to the peer router enrolled for
/// the destination. Inbound: accept deliveries from the mailbox only, and only
/// from the enrolled peer of the origin, then decode and credit custody.
///
/// Every entry point is all-or-nothing: custody writes are buffered and
/// committed only after the whole call succeeded. Calls are serialized.
class token_router final {
 public:
  /// `address` is this router's identity on the local domain; it is what
  /// peers enroll and what the mailbox records as sender. `owner` may change
  /// the remote router table.
  token_router(
      ferry::mailbox::mailbox& mailbox,
      ferry::custody::custody& custody,
      ferry::storage::storage<ferry::storage::rocksdb_storage_tag>& storage,
      const ferry::schema::address_t& address,
      const ferry::schema::address_t& owner);

  token_router(const token_router&) = delete;
  token_router& operator=(const token_router&) = delete;

  ferry::schema::domain_t local_domain() const;
  const ferry::schema::address_t& address() const { return address_; }
  const ferry::schema::address_t& owner() const { return owner_; }

  /// Send `token_id` to `recipient` on `destination`.
  ///
  /// On success the result carries the mailbox message id in `data` and one
  /// sent_transfer_remote event. `context.value` is forwarded as the dispatch
  /// fee.
  ferry::schema::transaction_result_t transfer_remote(
      const call_context& context,
      ferry::schema::domain_t destination,
      const ferry::schema::hash32_t& recipient,
      const ferry::schema::token_id_t& token_id,
      std::string_view token_uri);

  /// Fee the mailbox would charge for the same transfer, or std::nullopt
  /// when no peer is enrolled for `destination`.
  std::optional<ferry::schema::amount_t> quote_transfer_remote(
      ferry::schema::domain_t destination,
      const ferry::schema::hash32_t& recipient,
      const ferry::schema::token_id_t& token_id,
      std::string_view token_uri) const;

  /// Inbound delivery. `caller` must be the mailbox's address and `sender`
  /// the peer enrolled for `origin`; on success the result carries one
  /// received_transfer_remote event.
  ferry::schema::transaction_result_t handle(
      const ferry::schema::address_t& caller,
      ferry::schema::domain_t origin,
      const ferry::schema::hash32_t& sender,
      const ferry::schema::bytes_view_t& payload);

  ferry::schema::transaction_result_t enroll_remote_router(
      const ferry::schema::address_t& caller,
      ferry::schema::domain_t domain,
      const ferry::schema::hash32_t& router);

  /// Enroll several peers in one atomic update.
  ferry::schema::transaction_result_t enroll_remote_routers(
      const ferry::schema::address_t& caller,
      const std::vector<remote_router_t>& routers);

  ferry::schema::transaction_result_t unenroll_remote_router(
      const ferry::schema::address_t& caller,
      ferry::schema::domain_t domain);

  std::optional<ferry::schema::hash32_t> remote_router(
      ferry::schema::domain_t domain) const;

  /// Domains with an enrolled peer, ascending.
  std::vector<ferry::schema::domain_t> domains() const;

 private:
  std::optional<ferry::schema::hash32_t> find_remote_router(
      ferry::schema::domain_t domain) const;

  mutable std::mutex mutex_;
  ferry::mailbox::mailbox& mailbox_;
  ferry::custody::custody& custody_;
  ferry::storage::storage<ferry::storage::rocksdb_storage_tag>& storage_;
  ferry::schema::address_t address_;
  ferry::schema::address_t owner_;
};

}  // namespace ferry::routing
