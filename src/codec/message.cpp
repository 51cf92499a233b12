#include <ferry/codec/message.hpp>

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace ferry::codec {

namespace {

void require_prefix(const ferry::schema::bytes_view_t& payload) {
  if (payload.size() < kPrefixSize) {
    throw std::out_of_range{"transfer message shorter than " +
                            std::to_string(kPrefixSize) + " bytes (got " +
                            std::to_string(payload.size()) + ")"};
  }
}

}  // namespace

ferry::schema::bytes_t format(const ferry::schema::hash32_t& recipient,
                              const ferry::schema::token_id_t& token_id,
                              const std::string_view token_uri) {
  auto out = ferry::schema::bytes_t{};
  out.reserve(kPrefixSize + token_uri.size());
  out.insert(std::end(out), std::begin(recipient), std::end(recipient));
  auto word = ferry::schema::to_word(token_id);
  out.insert(std::end(out), std::begin(word), std::end(word));
  out.insert(std::end(out), std::begin(token_uri), std::end(token_uri));
  return out;
}

ferry::schema::bytes_t format(const ferry::schema::transfer_message_t& message) {
  return format(message.recipient, message.token_id, message.token_uri);
}

ferry::schema::hash32_t recipient(const ferry::schema::bytes_view_t& payload) {
  require_prefix(payload);
  auto out = ferry::schema::hash32_t{};
  std::copy_n(std::begin(payload) + kRecipientOffset, out.size(),
              std::begin(out));
  return out;
}

ferry::schema::token_id_t token_id(const ferry::schema::bytes_view_t& payload) {
  require_prefix(payload);
  return ferry::schema::from_word(payload.subspan(kTokenIdOffset, 32));
}

ferry::schema::token_id_t amount(const ferry::schema::bytes_view_t& payload) {
  return token_id(payload);
}

std::string token_uri(const ferry::schema::bytes_view_t& payload) {
  require_prefix(payload);
  return ferry::schema::make_string(payload.subspan(kTokenUriOffset));
}

std::optional<ferry::schema::transfer_message_t> try_decode(
    const ferry::schema::bytes_view_t& payload) {
  if (payload.size() < kPrefixSize) {
    return std::nullopt;
  }
  return ferry::schema::transfer_message_t{.recipient = recipient(payload),
                                           .token_id = token_id(payload),
                                           .token_uri = token_uri(payload)};
}

}  // namespace ferry::codec
