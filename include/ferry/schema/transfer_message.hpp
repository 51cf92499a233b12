#pragma once
#include <ferry/schema/primitives.hpp>
#include <string>

// Schema type: transfer message.
// One token crossing between domains: who receives it, which token, and the
// metadata uri the destination collection should carry.
namespace ferry::schema {

template <uint16_t Version>
struct transfer_message;

template <>
struct transfer_message<1> final {
  uint16_t version{1};
  hash32_t recipient{};
  token_id_t token_id{};
  std::string token_uri;

  bool operator==(const transfer_message<1>&) const = default;
};

using transfer_message_t = transfer_message<1>;

}  // namespace ferry::schema
