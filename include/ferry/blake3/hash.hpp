#pragma once
#include <ferry/schema/primitives.hpp>

namespace ferry::blake3 {

ferry::schema::hash32_t hash(const ferry::schema::bytes_view_t& bytes);

}  // namespace ferry::blake3
