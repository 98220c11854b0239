/***
 * Name: pyrite::support::ReadFile
 * Purpose: Read the full contents of a source file into a string.
 * Inputs:
 *   - path: filesystem path to read
 * Outputs:
 *   - out: populated with file contents on success (bytes, no newline translation)
 *   - err: error message on failure
 * Theory of Operation: Uses std::ifstream in binary mode so CR/LF pairs reach the
 *   lexer untouched; checks stream state after the read.
 */
#include "pyrite/support/fs.h"

#include <fstream>
#include <ios>
#include <sstream>
#include <string>

namespace pyrite {
namespace support {

bool ReadFile(const std::string& path, std::string& out, std::string& err) {
  std::ifstream file_stream(path, std::ios::in | std::ios::binary);
  if (!file_stream.good()) {
    err = "failed to open file: " + path;
    return false;
  }
  std::ostringstream stream;
  stream << file_stream.rdbuf();
  if (file_stream.bad()) {
    err = "failed to read file: " + path;
    return false;
  }
  out = stream.str();
  return true;
}

}  // namespace support
}  // namespace pyrite
