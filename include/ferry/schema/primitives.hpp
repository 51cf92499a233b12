#pragma once
#include <array>
#include <boost/endian/buffers.hpp>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ferry::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = std::array<uint8_t, 20>;  // Native account address
using domain_t = uint32_t;
using amount_t = boost::multiprecision::uint256_t;
using token_id_t = amount_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string& bytes);
hash32_t make_hash32(const std::string_view& bytes);
std::optional<hash32_t> try_make_hash32(const std::string& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& bytes);
hash32_t make_zero_hash();

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);
bytes_t from_hex(std::string_view hex);

/// Left-pad a native address into its 32-byte chain-agnostic form.
hash32_t to_bytes32(const address_t& address);

/// Native address held in the low 20 bytes of a 32-byte identity.
///
/// The upper 12 bytes are ignored, matching how EVM-style chains truncate
/// `bytes32` to `address`.
address_t to_address(const hash32_t& value);

address_t make_zero_address();

/// 256-bit unsigned integer as a 32-byte big-endian word.
hash32_t to_word(const amount_t& value);

/// Big-endian word to 256-bit unsigned integer. `bytes` must be 32 bytes.
amount_t from_word(const bytes_view_t& bytes);

/// Domain identifier as 4 big-endian bytes (key ordering by domain).
std::array<uint8_t, 4> to_big_endian(domain_t domain);

}  // namespace ferry::schema

