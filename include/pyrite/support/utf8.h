/***
 * Name: pyrite::support (utf8)
 * Purpose: UTF-8 encode/decode helpers shared by the lexer and diagnostics.
 * Inputs: Code points or byte buffers with a cursor
 * Outputs: Encoded bytes or decoded code points
 * Theory of Operation: Decoding uses ICU's U8_NEXT so malformed sequences are
 *   reported as negative code points instead of being silently accepted.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace pyrite {
namespace support {

/*** AppendUtf8: Append code point as UTF-8; returns false above U+10FFFF. */
bool AppendUtf8(std::string& out, long codepoint);

/*** DecodeUtf8: Decode one code point at pos and advance it; negative on malformed input. */
int DecodeUtf8(std::string_view text, size_t& pos);

/*** NormalizeNfkc: NFKC-normalize UTF-8 text; returns false when ICU rejects the input. */
bool NormalizeNfkc(const std::string& text, std::string& out);

}  // namespace support
}  // namespace pyrite
