#include <boost/algorithm/hex.hpp>
#include <ferry/common/critical.hpp>
#include <ferry/schema/primitives.hpp>

#include <algorithm>
#include <iterator>

namespace ferry::schema {

namespace {

std::string_view strip_hex_prefix(std::string_view hex) {
  if (hex.starts_with("0x") || hex.starts_with("0X")) {
    hex.remove_prefix(2);
  }
  return hex;
}

// Copies `value` into the low end of a fixed-width big-endian field.
template <std::size_t N>
std::array<uint8_t, N> left_pad(const bytes_view_t& value) {
  auto out = std::array<uint8_t, N>{};
  std::copy(std::begin(value), std::end(value),
            std::end(out) - static_cast<std::ptrdiff_t>(value.size()));
  return out;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

std::string make_string(const bytes_t& bytes) {
  return std::string{std::begin(bytes), std::end(bytes)};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{std::begin(bytes), std::end(bytes)};
}

hash32_t make_hash32(const bytes_t& bytes) {
  if (bytes.size() != 32) {
    ferry::common::critical("make_hash32 expected 32 bytes, got {}",
                            bytes.size());
  }
  return left_pad<32>(bytes_view_t{bytes.data(), bytes.size()});
}

hash32_t make_hash32(const std::string& bytes) {
  return make_hash32(std::string_view{bytes});
}

hash32_t make_hash32(const std::string_view& bytes) {
  auto hash = try_make_hash32(bytes);
  if (!hash) {
    ferry::common::critical("invalid hash32 hex input '{}'", bytes);
  }
  return *hash;
}

std::optional<hash32_t> try_make_hash32(const std::string& bytes) {
  return try_make_hash32(std::string_view{bytes});
}

// Shorter values are left-padded, so "0x01ab" names the same identity as its
// full 32-byte form.
std::optional<hash32_t> try_make_hash32(const std::string_view& bytes) {
  auto decoded = try_from_hex(bytes);
  if (!decoded || decoded->size() > 32) {
    return std::nullopt;
  }
  return left_pad<32>(bytes_view_t{decoded->data(), decoded->size()});
}

hash32_t make_zero_hash() {
  return {};
}

std::string to_hex(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  boost::algorithm::hex_lower(std::begin(bytes), std::end(bytes),
                              std::back_inserter(out));
  return out;
}

std::optional<bytes_t> try_from_hex(const std::string_view hex) {
  auto digits = strip_hex_prefix(hex);
  auto out = bytes_t{};
  out.reserve(digits.size() / 2);
  try {
    boost::algorithm::unhex(std::begin(digits), std::end(digits),
                            std::back_inserter(out));
  } catch (const boost::algorithm::hex_decode_error&) {
    return std::nullopt;
  }
  return out;
}

bytes_t from_hex(const std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded) {
    ferry::common::critical("invalid hex input '{}'", hex);
  }
  return *decoded;
}

hash32_t to_bytes32(const address_t& address) {
  return left_pad<32>(bytes_view_t{address.data(), address.size()});
}

address_t to_address(const hash32_t& value) {
  auto out = address_t{};
  std::copy(std::end(value) - static_cast<std::ptrdiff_t>(out.size()),
            std::end(value), std::begin(out));
  return out;
}

address_t make_zero_address() {
  return {};
}

hash32_t to_word(const amount_t& value) {
  auto significant = bytes_t{};
  // Emits one byte for zero and at most 32 for a uint256.
  boost::multiprecision::export_bits(value, std::back_inserter(significant), 8);
  return left_pad<32>(bytes_view_t{significant.data(), significant.size()});
}

amount_t from_word(const bytes_view_t& bytes) {
  if (bytes.size() != 32) {
    ferry::common::critical("from_word expected 32 bytes, got {}",
                            bytes.size());
  }
  auto value = amount_t{};
  boost::multiprecision::import_bits(value, std::begin(bytes), std::end(bytes),
                                     8);
  return value;
}

std::array<uint8_t, 4> to_big_endian(const domain_t domain) {
  auto buffer = boost::endian::big_uint32_buf_t{domain};
  auto out = std::array<uint8_t, 4>{};
  std::copy_n(reinterpret_cast<const uint8_t*>(buffer.data()), out.size(),
              std::begin(out));
  return out;
}

}  // namespace ferry::schema
