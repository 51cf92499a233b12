#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema types: transaction events.
// Externally observable record of a committed router call. Attributes marked
// `index` are the ones observers are expected to filter on.
namespace ferry::schema {

template <uint16_t Version>
struct transaction_event_attribute;

template <>
struct transaction_event_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
  bool index{};
};

using transaction_event_attribute_t = transaction_event_attribute<1>;

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<transaction_event_attribute_t> attributes;
};

using transaction_event_t = transaction_event<1>;

inline std::optional<std::string> find_attribute(
    const transaction_event_t& event,
    const std::string_view key) {
  for (const auto& attribute : event.attributes) {
    if (attribute.key == key) {
      return attribute.value;
    }
  }
  return std::nullopt;
}

}  // namespace ferry::schema
