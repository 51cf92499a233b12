#pragma once

#include <ferry/schema/primitives.hpp>

#include <optional>
#include <string>

namespace ferry::mailbox {

/// Cross-domain messaging endpoint the token router dispatches through.
///
/// Implementations authenticate and relay messages between domains. On the
/// destination they call `token_router::handle` passing their own
/// `address()` as the caller, and only after the message's origin has been
/// verified. Routers trust that call unconditionally.
class mailbox {
 public:
  virtual ~mailbox() = default;

  /// Domain this mailbox serves.
  virtual ferry::schema::domain_t local_domain() const = 0;

  /// Identity presented as the caller of inbound deliveries.
  virtual const ferry::schema::address_t& address() const = 0;

  /// Fee required to dispatch `body` to `destination`.
  virtual ferry::schema::amount_t quote_dispatch(
      ferry::schema::domain_t destination,
      const ferry::schema::hash32_t& recipient,
      const ferry::schema::bytes_view_t& body) const = 0;

  /// Record `body` in the outbound queue for `destination`.
  ///
  /// Returns the message id, or std::nullopt with `error` set when the
  /// destination is unsupported or `fee` does not cover the quote. A failed
  /// dispatch records nothing.
  ///
  /// The router holds its lock across this call. Delivery to the destination
  /// router must happen after `dispatch` returns, never from inside it.
  virtual std::optional<ferry::schema::hash32_t> dispatch(
      const ferry::schema::hash32_t& sender,
      ferry::schema::domain_t destination,
      const ferry::schema::hash32_t& recipient,
      const ferry::schema::bytes_view_t& body,
      const ferry::schema::amount_t& fee,
      std::string& error) = 0;
};

}  // namespace ferry::mailbox
