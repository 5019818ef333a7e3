// codegraph/basic/hash.cpp
//
#include "codegraph/basic/hash.hpp"

namespace codegraph
{

uint64_t hash_fields(std::initializer_list<std::string_view> fields)
{
  uint64_t state = k_fnv_offset_basis;
  bool first = true;
  for (const std::string_view f : fields) {
    if (!first) {
      state = fnv1a(std::string_view("\x1f", 1), state);
    }
    state = fnv1a(f, state);
    first = false;
  }
  return state;
}

std::string to_hex(uint64_t value)
{
  static constexpr char k_digits[] = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<size_t>(i)] = k_digits[value & 0xfU];
    value >>= 4U;
  }
  return out;
}

}  // namespace codegraph
