#include <ferry/schema/transfer_events.hpp>

#include <string>

namespace ferry::schema {

namespace {

transaction_event_t make_transfer_event(const std::string_view type,
                                        const std::string_view domain_key,
                                        const domain_t domain,
                                        const hash32_t& recipient,
                                        const token_id_t& token_id) {
  auto event = transaction_event_t{};
  event.type = std::string{type};
  event.attributes.push_back(transaction_event_attribute_t{
      .key = std::string{domain_key},
      .value = std::to_string(domain),
      .index = true});
  event.attributes.push_back(transaction_event_attribute_t{
      .key = "recipient",
      .value = "0x" + to_hex(bytes_view_t{recipient.data(), recipient.size()}),
      .index = true});
  event.attributes.push_back(transaction_event_attribute_t{
      .key = "token_id", .value = token_id.str(), .index = true});
  return event;
}

}  // namespace

transaction_event_t make_sent_transfer_remote_event(
    const domain_t destination,
    const hash32_t& recipient,
    const token_id_t& token_id) {
  return make_transfer_event(kSentTransferRemoteEvent, "destination",
                             destination, recipient, token_id);
}

transaction_event_t make_received_transfer_remote_event(
    const domain_t origin,
    const hash32_t& recipient,
    const token_id_t& token_id) {
  return make_transfer_event(kReceivedTransferRemoteEvent, "origin", origin,
                             recipient, token_id);
}

}  // namespace ferry::schema
