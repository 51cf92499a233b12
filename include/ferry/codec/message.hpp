#pragma once

#include <ferry/schema/primitives.hpp>
#include <ferry/schema/transfer_message.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

// Wire codec for transfer messages.
//
// Layout:
//   [0, 32)   recipient, 32-byte chain-agnostic identity
//   [32, 64)  token id, big-endian unsigned 256-bit integer
//   [64, end) token uri bytes, no length prefix
//
// Peers on every domain must agree on this layout byte for byte. It carries
// no version tag, so fields can only ever be appended by a new codec.
namespace ferry::codec {

inline constexpr std::size_t kRecipientOffset = 0;
inline constexpr std::size_t kTokenIdOffset = 32;
inline constexpr std::size_t kTokenUriOffset = 64;
inline constexpr std::size_t kPrefixSize = kTokenUriOffset;

ferry::schema::bytes_t format(const ferry::schema::hash32_t& recipient,
                              const ferry::schema::token_id_t& token_id,
                              std::string_view token_uri);

ferry::schema::bytes_t format(const ferry::schema::transfer_message_t& message);

/// Fixed-offset readers. Each throws std::out_of_range when `payload` is
/// shorter than kPrefixSize.
ferry::schema::hash32_t recipient(const ferry::schema::bytes_view_t& payload);
ferry::schema::token_id_t token_id(const ferry::schema::bytes_view_t& payload);
std::string token_uri(const ferry::schema::bytes_view_t& payload);

/// Same field as token_id(); kept for peers that name it the amount slot.
ferry::schema::token_id_t amount(const ferry::schema::bytes_view_t& payload);

/// Decode all fields, or std::nullopt when the payload is too short.
std::optional<ferry::schema::transfer_message_t> try_decode(
    const ferry::schema::bytes_view_t& payload);

}  // namespace ferry::codec
