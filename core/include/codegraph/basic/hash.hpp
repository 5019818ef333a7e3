// codegraph/basic/hash.hpp - Stable hashing for entity identity
//
// std::hash is not stable across processes or platforms, so node ids are
// derived with 64-bit FNV-1a instead.
//
#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace codegraph
{

inline constexpr uint64_t k_fnv_offset_basis = 0xcbf29ce484222325ULL;
inline constexpr uint64_t k_fnv_prime = 0x100000001b3ULL;

/// Feed bytes into a running FNV-1a state
[[nodiscard]] constexpr uint64_t fnv1a(std::string_view bytes, uint64_t state = k_fnv_offset_basis)
{
  for (const char c : bytes) {
    state ^= static_cast<uint8_t>(c);
    state *= k_fnv_prime;
  }
  return state;
}

/**
 * Hash a sequence of fields.
 *
 * Fields are separated by a 0x1f unit separator so ("ab", "c") and
 * ("a", "bc") hash differently.
 */
[[nodiscard]] uint64_t hash_fields(std::initializer_list<std::string_view> fields);

/// Render a hash as 16 lowercase hex digits
[[nodiscard]] std::string to_hex(uint64_t value);

}  // namespace codegraph
