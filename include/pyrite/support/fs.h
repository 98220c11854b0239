/***
 * Name: pyrite::support (fs)
 * Purpose: File reading helper for tools; the lexer and parser never touch the filesystem.
 * Inputs: Path and string buffers
 * Outputs: File contents
 * Theory of Operation: Thin wrapper over fstream to centralize error handling.
 */
#pragma once

#include <string>

namespace pyrite {
namespace support {

/*** ReadFile: Read entire file into out. Return true on success. */
bool ReadFile(const std::string& path, std::string& out, std::string& err);

}  // namespace support
}  // namespace pyrite
