/***
 * Name: pyrite::support::BigInt
 * Purpose: Unbounded non-negative integer used for integer literal payloads.
 * Inputs: Digit strings in base 2, 8, 10 or 16 (separators already removed)
 * Outputs: Canonical decimal text; optional int64 view when the value fits
 * Theory of Operation: Digits are folded into base-1e9 limbs (little endian)
 *   by repeated multiply-add; the canonical decimal rendering is produced once
 *   at construction so equality and printing are plain string operations.
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace pyrite {
namespace support {

class BigInt {
 public:
  BigInt() = default;
  explicit BigInt(uint64_t value);

  /*** fromDigits: Build from digits in the given base; returns false on a bad digit. */
  static bool fromDigits(std::string_view digits, int base, BigInt& out);

  const std::string& toString() const { return decimal_; }
  bool fitsInt64() const;
  int64_t toInt64() const;  // valid only when fitsInt64()

  bool operator==(const BigInt& other) const { return decimal_ == other.decimal_; }
  bool operator!=(const BigInt& other) const { return !(*this == other); }

 private:
  std::string decimal_{"0"};
};

}  // namespace support
}  // namespace pyrite
