/***
 * Name: pyrite::support (utf8 impl)
 * Purpose: ICU-backed UTF-8 helpers.
 */
#include "pyrite/support/utf8.h"

#include <unicode/unorm2.h>
#include <unicode/ustring.h>
#include <unicode/utf8.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pyrite::support {

namespace {
constexpr long kMaxCodePoint = 0x10FFFF;
}  // namespace

bool AppendUtf8(std::string& out, long codepoint) {
  if (codepoint < 0 || codepoint > kMaxCodePoint) { return false; }
  const auto cp = static_cast<uint32_t>(codepoint);
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
  return true;
}

int DecodeUtf8(std::string_view text, size_t& pos) {
  if (pos >= text.size()) { return -1; }
  const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
  const auto length = static_cast<int32_t>(text.size());
  auto offset = static_cast<int32_t>(pos);
  UChar32 cp = 0;
  U8_NEXT(bytes, offset, length, cp);
  pos = static_cast<size_t>(offset);
  return cp;
}

bool NormalizeNfkc(const std::string& text, std::string& out) {
  UErrorCode status = U_ZERO_ERROR;
  const UNormalizer2* nfkc = unorm2_getNFKCInstance(&status);
  if (U_FAILURE(status)) { return false; }

  int32_t wideLen = 0;
  status = U_ZERO_ERROR;
  u_strFromUTF8(nullptr, 0, &wideLen, text.data(), static_cast<int32_t>(text.size()), &status);
  if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) { return false; }
  std::vector<UChar> wide(static_cast<size_t>(wideLen) + 1);
  status = U_ZERO_ERROR;
  u_strFromUTF8(wide.data(), static_cast<int32_t>(wide.size()), &wideLen, text.data(),
                static_cast<int32_t>(text.size()), &status);
  if (U_FAILURE(status)) { return false; }

  status = U_ZERO_ERROR;
  const int32_t normLen = unorm2_normalize(nfkc, wide.data(), wideLen, nullptr, 0, &status);
  if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) { return false; }
  std::vector<UChar> norm(static_cast<size_t>(normLen) + 1);
  status = U_ZERO_ERROR;
  unorm2_normalize(nfkc, wide.data(), wideLen, norm.data(), static_cast<int32_t>(norm.size()), &status);
  if (U_FAILURE(status)) { return false; }

  int32_t outLen = 0;
  status = U_ZERO_ERROR;
  u_strToUTF8(nullptr, 0, &outLen, norm.data(), normLen, &status);
  if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) { return false; }
  std::string result(static_cast<size_t>(outLen), '\0');
  status = U_ZERO_ERROR;
  u_strToUTF8(result.data(), outLen, nullptr, norm.data(), normLen, &status);
  if (U_FAILURE(status) && status != U_STRING_NOT_TERMINATED_WARNING) { return false; }
  out = std::move(result);
  return true;
}

}  // namespace pyrite::support
