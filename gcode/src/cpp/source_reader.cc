/**
 * Source Reader - Implementation
 */

#include "source_reader.hh"

#include <sys/stat.h>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace GCodeCheck
{

  namespace
  {

    // Length of the UTF-8 sequence starting at `pos`, or 0 if it is invalid.
    size_t validSequenceLength(const std::string &bytes, size_t pos)
    {
      const auto lead = static_cast<unsigned char>(bytes[pos]);
      size_t length = 0;
      unsigned int codepoint = 0;

      if (lead < 0x80)
        return 1;
      else if ((lead & 0xE0) == 0xC0)
      {
        length = 2;
        codepoint = lead & 0x1F;
      }
      else if ((lead & 0xF0) == 0xE0)
      {
        length = 3;
        codepoint = lead & 0x0F;
      }
      else if ((lead & 0xF8) == 0xF0)
      {
        length = 4;
        codepoint = lead & 0x07;
      }
      else
        return 0;

      if (pos + length > bytes.size())
        return 0;

      for (size_t i = 1; i < length; i++)
      {
        const auto cont = static_cast<unsigned char>(bytes[pos + i]);
        if ((cont & 0xC0) != 0x80)
          return 0;
        codepoint = (codepoint << 6) | (cont & 0x3F);
      }

      // Reject overlong forms, surrogates and values past U+10FFFF
      static const unsigned int minimum[] = {0, 0, 0x80, 0x800, 0x10000};
      if (codepoint < minimum[length] || codepoint > 0x10FFFF ||
          (codepoint >= 0xD800 && codepoint <= 0xDFFF))
        return 0;

      return length;
    }

  } // namespace

  std::string sanitizeText(const std::string &bytes)
  {
    std::string text;
    text.reserve(bytes.size());

    size_t pos = 0;
    while (pos < bytes.size())
    {
      size_t length = validSequenceLength(bytes, pos);
      if (length == 0)
      {
        pos++;
        continue;
      }
      if (!(length == 1 && bytes[pos] == '\0'))
        text.append(bytes, pos, length);
      pos += length;
    }
    return text;
  }

  std::vector<std::string> splitLines(const std::string &text)
  {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size())
    {
      size_t end = text.find('\n', start);
      if (end == std::string::npos)
        end = text.size();

      std::string line = text.substr(start, end - start);
      if (!line.empty() && line.back() == '\r')
        line.pop_back();
      lines.push_back(std::move(line));

      start = end + 1;
    }
    return lines;
  }

  std::vector<std::string> readSourceLines(const std::string &filepath)
  {
    struct stat fileStat;
    if (stat(filepath.c_str(), &fileStat) != 0 || !S_ISREG(fileStat.st_mode))
    {
      throw std::runtime_error("G-code file not found: " + filepath);
    }

    std::string bytes;
    {
      std::ifstream file(filepath, std::ios::in | std::ios::binary);
      if (!file)
      {
        throw std::runtime_error("Failed to open G-code file: " + filepath);
      }
      bytes.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
      if (file.bad())
      {
        throw std::runtime_error("Failed to read G-code file: " + filepath);
      }
    }

    static const std::string bom = "\xEF\xBB\xBF";
    if (bytes.compare(0, bom.size(), bom) == 0)
      bytes.erase(0, bom.size());

    return splitLines(sanitizeText(bytes));
  }

} // namespace GCodeCheck
