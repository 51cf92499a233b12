#pragma once

#include <ferry/schema/primitives.hpp>
#include <ferry/schema/transaction_event.hpp>
#include <string_view>

// Event builders for the two transfer records observers index on.
namespace ferry::schema {

inline constexpr auto kSentTransferRemoteEvent =
    std::string_view{"sent_transfer_remote"};
inline constexpr auto kReceivedTransferRemoteEvent =
    std::string_view{"received_transfer_remote"};

/// Emitted once per committed outbound transfer.
transaction_event_t make_sent_transfer_remote_event(domain_t destination,
                                                    const hash32_t& recipient,
                                                    const token_id_t& token_id);

/// Emitted once per committed inbound delivery.
transaction_event_t make_received_transfer_remote_event(
    domain_t origin,
    const hash32_t& recipient,
    const token_id_t& token_id);

}  // namespace ferry::schema
