#pragma once

#include <ferry/schema/primitives.hpp>
#include <optional>
#include <string_view>

// Schema key type: router keys.
// Canonical key prefixes and key codecs for custody ledger rows and remote
// router enrollment.
namespace ferry::schema::key {

inline constexpr std::string_view kTokenKeyPrefix{"SYS|STATE|TOKEN|"};
inline constexpr std::string_view kRemoteRouterKeyPrefix{"SYS|STATE|ROUTER|"};

ferry::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                         const ferry::schema::bytes_view_t& id);

/// Ledger row key: prefix followed by the 32-byte big-endian token id.
ferry::schema::bytes_t make_token_key(const ferry::schema::token_id_t& token_id);

/// Enrollment key: prefix followed by the 4-byte big-endian domain, so a
/// prefix scan yields domains in ascending order.
ferry::schema::bytes_t make_remote_router_key(ferry::schema::domain_t domain);

std::optional<ferry::schema::domain_t> parse_remote_router_key(
    const ferry::schema::bytes_view_t& key);

}  // namespace ferry::schema::key
