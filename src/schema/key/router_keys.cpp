#include <boost/endian/conversion.hpp>
#include <ferry/schema/key/router_keys.hpp>

#include <algorithm>
#include <iterator>

namespace ferry::schema::key {

ferry::schema::bytes_t make_prefixed_key(const std::string_view prefix,
                                         const ferry::schema::bytes_view_t& id) {
  auto key = ferry::schema::make_bytes(prefix);
  key.insert(std::end(key), std::begin(id), std::end(id));
  return key;
}

ferry::schema::bytes_t make_token_key(
    const ferry::schema::token_id_t& token_id) {
  auto word = ferry::schema::to_word(token_id);
  return make_prefixed_key(kTokenKeyPrefix,
                           ferry::schema::bytes_view_t{word.data(), word.size()});
}

ferry::schema::bytes_t make_remote_router_key(
    const ferry::schema::domain_t domain) {
  auto encoded = ferry::schema::to_big_endian(domain);
  return make_prefixed_key(
      kRemoteRouterKeyPrefix,
      ferry::schema::bytes_view_t{encoded.data(), encoded.size()});
}

std::optional<ferry::schema::domain_t> parse_remote_router_key(
    const ferry::schema::bytes_view_t& key) {
  if (key.size() != kRemoteRouterKeyPrefix.size() + 4) {
    return std::nullopt;
  }
  if (!std::equal(std::begin(kRemoteRouterKeyPrefix),
                  std::end(kRemoteRouterKeyPrefix), std::begin(key),
                  [](const char lhs, const uint8_t rhs) {
                    return static_cast<uint8_t>(lhs) == rhs;
                  })) {
    return std::nullopt;
  }
  auto suffix = key.subspan(kRemoteRouterKeyPrefix.size());
  return boost::endian::load_big_u32(suffix.data());
}

}  // namespace ferry::schema::key
