/***
 * Name: pyrite::support::BigInt (impl)
 * Purpose: Convert digit strings of any supported base into canonical decimal.
 */
#include "pyrite/support/big_int.h"

#include <cstdint>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace pyrite::support {

namespace {
constexpr uint32_t kLimbBase = 1000000000U;
constexpr int kLimbDigits = 9;

int digitValue(char chr) {
  if (chr >= '0' && chr <= '9') { return chr - '0'; }
  if (chr >= 'a' && chr <= 'f') { return chr - 'a' + 10; }
  if (chr >= 'A' && chr <= 'F') { return chr - 'A' + 10; }
  return -1;
}

// limbs = limbs * mul + add
void mulAdd(std::vector<uint32_t>& limbs, uint32_t mul, uint32_t add) {
  uint64_t carry = add;
  for (auto& limb : limbs) {
    const uint64_t cur = static_cast<uint64_t>(limb) * mul + carry;
    limb = static_cast<uint32_t>(cur % kLimbBase);
    carry = cur / kLimbBase;
  }
  while (carry != 0) {
    limbs.push_back(static_cast<uint32_t>(carry % kLimbBase));
    carry /= kLimbBase;
  }
}

std::string render(const std::vector<uint32_t>& limbs) {
  if (limbs.empty()) { return "0"; }
  std::ostringstream oss;
  oss << limbs.back();
  for (size_t i = limbs.size() - 1; i-- > 0;) {
    oss << std::setw(kLimbDigits) << std::setfill('0') << limbs[i];
  }
  return oss.str();
}
}  // namespace

BigInt::BigInt(uint64_t value) : decimal_(std::to_string(value)) {}

bool BigInt::fromDigits(std::string_view digits, int base, BigInt& out) {
  if (digits.empty()) { return false; }
  std::vector<uint32_t> limbs;
  for (const char chr : digits) {
    const int val = digitValue(chr);
    if (val < 0 || val >= base) { return false; }
    mulAdd(limbs, static_cast<uint32_t>(base), static_cast<uint32_t>(val));
  }
  while (!limbs.empty() && limbs.back() == 0) { limbs.pop_back(); }
  out.decimal_ = render(limbs);
  return true;
}

bool BigInt::fitsInt64() const {
  static const std::string kMax = std::to_string(std::numeric_limits<int64_t>::max());
  if (decimal_.size() != kMax.size()) { return decimal_.size() < kMax.size(); }
  return decimal_ <= kMax;
}

int64_t BigInt::toInt64() const {
  int64_t value = 0;
  for (const char chr : decimal_) { value = (value * 10) + (chr - '0'); }
  return value;
}

}  // namespace pyrite::support
