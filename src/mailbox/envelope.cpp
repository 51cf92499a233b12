#include <ferry/blake3/hash.hpp>
#include <ferry/mailbox/envelope.hpp>
#include <ferry/schema/encoding/scale/encoder.hpp>

#include <tuple>

namespace ferry::mailbox {

ferry::schema::hash32_t message_id(const envelope_t& message) {
  auto encoder = ferry::schema::encoding::encoder<
      ferry::schema::encoding::scale_encoder_tag>{};
  auto encoded = encoder.encode(
      std::tuple{message.version, message.nonce, message.origin,
                 message.sender, message.destination, message.recipient,
                 message.body});
  return ferry::blake3::hash(
      ferry::schema::bytes_view_t{encoded.data(), encoded.size()});
}

}  // namespace ferry::mailbox
