#pragma once
/*
================================================================================
Core: Reference Data Fingerprint Hashing
FILE: cpp/ifra/core/hashing.hpp

A 64-bit FNV-1a digest over the normalized reference tables. Every
ComplianceResult carries it so a report can be traced to the exact data set
it was computed from.

  - Independent of std::hash (not stable across processes or platforms).
  - Integers are fed little-endian; strings are length-prefixed.
  - Doubles are fed by bit pattern after folding -0.0 and NaN payloads.
  - Not cryptographic.
================================================================================
*/

#include <cstdint>
#include <string>
#include <string_view>

namespace ifra {

struct Hash64 {
  uint64_t value = 0;

  constexpr bool operator==(const Hash64& o) const noexcept { return value == o.value; }
  constexpr bool operator!=(const Hash64& o) const noexcept { return value != o.value; }
};

class Fnv1a64 {
 public:
  Hash64 digest() const noexcept { return Hash64{h_}; }

  Fnv1a64& add(uint64_t v) noexcept;
  Fnv1a64& add(bool v) noexcept { return add_byte(v ? 1u : 0u); }
  Fnv1a64& add(double v) noexcept;
  Fnv1a64& add(std::string_view s) noexcept;

 private:
  Fnv1a64& add_byte(uint8_t b) noexcept;

  uint64_t h_ = 14695981039346656037ull;
};

// 16 lower-case hex digits, most significant first.
std::string hash_to_hex(Hash64 h);

}  // namespace ifra
