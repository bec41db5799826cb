#include "ifra/core/hashing.hpp"

#include <bit>
#include <cmath>

namespace ifra {

namespace {

constexpr uint64_t kPrime = 1099511628211ull;
constexpr uint64_t kCanonicalNaNBits = 0x7ff8000000000000ull;

} // namespace

Fnv1a64& Fnv1a64::add_byte(uint8_t b) noexcept {
  h_ ^= static_cast<uint64_t>(b);
  h_ *= kPrime;
  return *this;
}

Fnv1a64& Fnv1a64::add(uint64_t v) noexcept {
  for (int i = 0; i < 8; ++i) add_byte(static_cast<uint8_t>((v >> (8 * i)) & 0xFFu));
  return *this;
}

Fnv1a64& Fnv1a64::add(double v) noexcept {
  if (std::isnan(v)) return add(kCanonicalNaNBits);
  if (v == 0.0) v = 0.0;  // -0.0 => +0.0
  return add(std::bit_cast<uint64_t>(v));
}

Fnv1a64& Fnv1a64::add(std::string_view s) noexcept {
  add(static_cast<uint64_t>(s.size()));
  for (char c : s) add_byte(static_cast<uint8_t>(c));
  return *this;
}

std::string hash_to_hex(Hash64 h) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 0; i < 16; ++i) {
    out[15 - i] = kHex[(h.value >> (4 * i)) & 0xFu];
  }
  return out;
}

}  // namespace ifra
