#pragma once
#include <ferry/common/critical.hpp>
#include <ferry/schema/encoding/encoder.hpp>
#include <scale/scale.hpp>
#include <utility>

namespace ferry::schema::encoding {

struct scale_encoder_tag {};

/// SCALE codec for ledger rows and envelope hashing. Rows are tuples of
/// SCALE-native types (integers, std::array, std::vector, std::string).
template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  ferry::schema::bytes_t encode(const T& obj) {
    auto encoded = ::scale::impl::memory::encode(obj);
    if (!encoded) {
      ferry::common::critical("SCALE encode failed: {}",
                              encoded.error().message());
    }
    return std::move(encoded.value());
  }

  /// Decoding a stored row that does not parse means the ledger is corrupt.
  template <typename T>
  T decode(const ferry::schema::bytes_view_t& bytes) {
    auto decoded = try_decode<T>(bytes);
    if (!decoded) {
      ferry::common::critical("SCALE decode of {} bytes failed", bytes.size());
    }
    return std::move(*decoded);
  }

  template <typename T>
  std::optional<T> try_decode(const ferry::schema::bytes_view_t& bytes) {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      return std::nullopt;
    }
    return std::move(decoded.value());
  }
};

}  // namespace ferry::schema::encoding
