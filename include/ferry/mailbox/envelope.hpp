#pragma once

#include <ferry/schema/primitives.hpp>
#include <cstdint>

// Schema type: mailbox envelope.
// What a mailbox records for each dispatched message: routing header plus the
// opaque body produced by ferry::codec.
namespace ferry::mailbox {

template <uint16_t Version>
struct envelope;

template <>
struct envelope<1> final {
  uint16_t version{1};
  uint32_t nonce{};
  ferry::schema::domain_t origin{};
  ferry::schema::hash32_t sender{};
  ferry::schema::domain_t destination{};
  ferry::schema::hash32_t recipient{};
  ferry::schema::bytes_t body;
};

using envelope_t = envelope<1>;

/// Content-derived message id: BLAKE3 over the SCALE encoding of the envelope.
ferry::schema::hash32_t message_id(const envelope_t& message);

}  // namespace ferry::mailbox
