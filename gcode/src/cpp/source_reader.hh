/**
 * Source Reader - Header
 *
 * Reads G-code source files into lines without failing on bad encoding.
 */

#ifndef GCODE_CHECK_SOURCE_READER_HH
#define GCODE_CHECK_SOURCE_READER_HH

#include <string>
#include <vector>

namespace GCodeCheck
{

  /**
   * Drop invalid UTF-8 sequences and NUL bytes from a buffer.
   *
   * @param bytes Raw file contents
   * @return The valid part of the input, in order
   */
  std::string sanitizeText(const std::string &bytes);

  /**
   * Split text into lines on '\n', removing a trailing '\r' from each.
   * A final newline does not produce an extra empty line.
   */
  std::vector<std::string> splitLines(const std::string &text);

  /**
   * Read a G-code file into lines.
   *
   * A UTF-8 byte-order mark is skipped and undecodable bytes are dropped.
   *
   * @param filepath Path to the file
   * @return Lines of the file, line N at index N-1
   * @throws std::runtime_error if the file is missing or cannot be read
   */
  std::vector<std::string> readSourceLines(const std::string &filepath);

} // namespace GCodeCheck

#endif // GCODE_CHECK_SOURCE_READER_HH
