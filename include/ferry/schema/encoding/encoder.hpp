#pragma once
#include <ferry/schema/primitives.hpp>
#include <optional>
#include <span>

namespace ferry::schema::encoding {

// Storage value encoder, selected at build time by tag. Only SCALE is
// provided; the wire payload of a transfer is not SCALE and lives in
// ferry::codec.
template <typename Library>
struct encoder {
  template <typename T>
  ferry::schema::bytes_t encode(const T& obj);

  template <typename T>
  T decode(const ferry::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const ferry::schema::bytes_view_t& bytes);
};

}  // namespace ferry::schema::encoding
