/**
 * Line Tokenizer - Implementation
 */

#include "line_tokenizer.hh"

#include <cctype>
#include <cstdlib>
#include <cstring>

namespace GCodeCheck
{

  namespace
  {

    const char *const KNOWN_ADDRESSES = "GMONXYZIJKRFSTP";

    bool isSpace(char c)
    {
      return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    bool isLetter(char c)
    {
      return std::isalpha(static_cast<unsigned char>(c)) != 0;
    }

    bool isDigit(char c)
    {
      return std::isdigit(static_cast<unsigned char>(c)) != 0;
    }

    // Length of the number starting at `pos`: [+-]? (digits [. digits?] | . digits)
    size_t scanNumber(const std::string &s, size_t pos)
    {
      size_t i = pos;
      size_t digits = 0;

      if (i < s.size() && (s[i] == '+' || s[i] == '-'))
        i++;
      while (i < s.size() && isDigit(s[i]))
      {
        i++;
        digits++;
      }
      if (i < s.size() && s[i] == '.')
      {
        i++;
        while (i < s.size() && isDigit(s[i]))
        {
          i++;
          digits++;
        }
      }
      return digits > 0 ? i - pos : 0;
    }

  } // namespace

  bool isKnownAddress(char letter)
  {
    return letter != '\0' && std::strchr(KNOWN_ADDRESSES, letter) != nullptr;
  }

  std::string stripComments(const std::string &text, char delimiter, bool &unterminated)
  {
    std::string result;
    result.reserve(text.size());
    unterminated = false;

    for (size_t i = 0; i < text.size(); i++)
    {
      char c = text[i];
      if (c == delimiter)
        break;
      if (c == '(')
      {
        size_t close = text.find(')', i + 1);
        if (close == std::string::npos)
        {
          unterminated = true;
          break;
        }
        // Keep words on both sides apart
        result.push_back(' ');
        i = close;
        continue;
      }
      result.push_back(c);
    }
    return result;
  }

  TokenizedLine tokenizeLine(const std::string &text,
                             int lineNumber,
                             const CheckerConfig &config,
                             std::vector<Issue> &issues)
  {
    TokenizedLine line;
    line.lineNumber = lineNumber;
    line.text = text;

    bool unterminated = false;
    const std::string code = stripComments(text, config.commentDelimiter, unterminated);
    if (unterminated)
    {
      issues.push_back(makeWarning(lineNumber, "unterminated comment"));
    }

    size_t i = 0;

    // Leading tape delimiters and block delete
    while (i < code.size() && (isSpace(code[i]) || code[i] == '%' || code[i] == '/'))
      i++;

    while (i < code.size())
    {
      char c = code[i];

      if (isSpace(c))
      {
        i++;
        continue;
      }

      if (isLetter(c))
      {
        Token token;
        token.letter = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        token.known = isKnownAddress(token.letter);

        size_t start = i + 1;
        while (start < code.size() && isSpace(code[start]))
          start++;

        size_t length = scanNumber(code, start);
        if (length == 0)
        {
          // A dangling sign or point belongs to the same bad word
          size_t end = start;
          while (end < code.size() && (code[end] == '+' || code[end] == '-' || code[end] == '.'))
            end++;
          issues.push_back(makeError(lineNumber,
                                     "malformed coordinate/command: " + std::string(1, token.letter) +
                                         code.substr(start, end - start)));
          line.tokens.push_back(std::move(token));
          i = end > start ? end : i + 1;
          continue;
        }

        token.text = code.substr(start, length);
        token.value = std::strtod(token.text.c_str(), nullptr);
        line.tokens.push_back(std::move(token));
        i = start + length;
        continue;
      }

      // Not a word start: skip up to the next word and report it
      size_t end = i;
      while (end < code.size() && !isLetter(code[end]) && !isSpace(code[end]))
        end++;
      issues.push_back(makeError(lineNumber,
                                 "malformed coordinate/command: " + code.substr(i, end - i)));
      i = end;
    }

    return line;
  }

} // namespace GCodeCheck
