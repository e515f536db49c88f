/**
 * Validation Rules - Implementation
 */

#include "validation_rules.hh"

#include <cctype>
#include <cmath>
#include <cstdio>

namespace GCodeCheck
{

  namespace
  {

    // Longest program number accepted, keeps the value inside a long
    constexpr size_t MAX_PROGRAM_DIGITS = 9;

    std::string word(const Token &token)
    {
      return std::string(1, token.letter) + token.text;
    }

    std::string trim(const std::string &text)
    {
      size_t start = 0;
      while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start])))
        start++;
      size_t end = text.size();
      while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1])))
        end--;
      return text.substr(start, end - start);
    }

    bool isInteger(double value)
    {
      return std::floor(value) == value;
    }

    std::string malformed(const Token &token)
    {
      return "malformed coordinate/command: " + word(token);
    }

  } // namespace

  std::string formatCode(char letter, double value)
  {
    if (!isInteger(value) || std::fabs(value) >= 1e9)
      return std::string(1, letter) + formatNumber(value);

    char buf[32];
    snprintf(buf, sizeof(buf), "%c%02ld", letter, static_cast<long>(value));
    return buf;
  }

  std::string formatNumber(double value)
  {
    int length = snprintf(nullptr, 0, "%.4f", value);
    if (length <= 0)
      return std::string();
    std::string text(static_cast<size_t>(length) + 1, '\0');
    snprintf(&text[0], text.size(), "%.4f", value);
    text.resize(static_cast<size_t>(length));
    if (text.find('.') != std::string::npos)
    {
      while (!text.empty() && text.back() == '0')
        text.pop_back();
      if (!text.empty() && text.back() == '.')
        text.pop_back();
    }
    if (text == "-0")
      text = "0";
    return text;
  }

  bool isProgramNumber(const Token &token)
  {
    if (!token.value || token.text.empty() || token.text.size() > MAX_PROGRAM_DIGITS)
      return false;
    for (char c : token.text)
    {
      if (!std::isdigit(static_cast<unsigned char>(c)))
        return false;
    }
    return true;
  }

  std::vector<Issue> checkSyntax(const TokenizedLine &line,
                                 const ProgramState & /*state*/,
                                 const CheckerConfig &config)
  {
    std::vector<Issue> issues;
    if (line.empty())
      return issues;

    if (!line.tokens.front().known)
    {
      issues.push_back(makeError(line.lineNumber, "Invalid command format: " + trim(line.text)));
    }

    const bool subprogramCall = line.hasCode('M', 98);

    for (size_t i = 0; i < line.tokens.size(); i++)
    {
      const Token &token = line.tokens[i];
      // Bare letters were already reported by the tokenizer
      if (!token.value)
        continue;

      if (!token.known)
      {
        if (i > 0)
          issues.push_back(makeWarning(line.lineNumber, std::string("unrecognized address ") + token.letter));
        continue;
      }

      double value = *token.value;
      switch (token.letter)
      {
      case 'G':
        if (value < 0)
          issues.push_back(makeError(line.lineNumber, malformed(token)));
        else if (!config.isSupportedGCode(formatCode('G', value)))
          issues.push_back(makeWarning(line.lineNumber, "unsupported command " + formatCode('G', value)));
        break;
      case 'M':
        if (value < 0 || !isInteger(value))
          issues.push_back(makeError(line.lineNumber, malformed(token)));
        else if (!config.isSupportedMCode(formatCode('M', value)))
          issues.push_back(makeWarning(line.lineNumber, "unsupported command " + formatCode('M', value)));
        break;
      case 'O':
        if (!isProgramNumber(token))
          issues.push_back(makeError(line.lineNumber, malformed(token)));
        break;
      case 'P':
        if (subprogramCall && !isProgramNumber(token))
          issues.push_back(makeError(line.lineNumber, malformed(token)));
        break;
      default:
        break;
      }
    }

    if (subprogramCall && !line.has('P'))
    {
      issues.push_back(makeWarning(line.lineNumber, "subprogram call M98 without P program number"));
    }

    return issues;
  }

  std::vector<Issue> checkCoordinates(const TokenizedLine &line,
                                      const ProgramState & /*state*/,
                                      const CheckerConfig &config)
  {
    std::vector<Issue> issues;
    for (const auto &token : line.tokens)
    {
      if (!token.value)
        continue;
      if (token.letter != 'X' && token.letter != 'Y' && token.letter != 'Z')
        continue;

      if (std::fabs(*token.value) > config.maxTravel)
      {
        issues.push_back(makeWarning(line.lineNumber,
                                     std::string(1, token.letter) + " coordinate " +
                                         formatNumber(*token.value) + " exceeds typical travel range"));
      }
    }
    return issues;
  }

  std::vector<Issue> checkFeedRate(const TokenizedLine &line,
                                   const ProgramState & /*state*/,
                                   const CheckerConfig &config)
  {
    std::vector<Issue> issues;
    for (const auto &token : line.tokens)
    {
      if (token.letter != 'F' || !token.value)
        continue;

      double feed = *token.value;
      if (feed <= 0)
      {
        issues.push_back(makeError(line.lineNumber,
                                   "feed rate must be positive (F" + formatNumber(feed) + ")"));
      }
      else if (feed > config.maxFeedRate)
      {
        issues.push_back(makeWarning(line.lineNumber,
                                     "high feed rate: " + formatNumber(feed) + " mm/min"));
      }
    }
    return issues;
  }

  std::vector<Issue> checkSpindleAndTool(const TokenizedLine &line,
                                         const ProgramState &state,
                                         const CheckerConfig & /*config*/)
  {
    std::vector<Issue> issues;
    std::optional<double> speed = state.spindleSpeed;

    for (const auto &token : line.tokens)
    {
      if (!token.value)
        continue;
      double value = *token.value;

      if (token.letter == 'S')
      {
        speed = value;
        if (value < 0)
        {
          issues.push_back(makeError(line.lineNumber,
                                     "spindle speed must not be negative (S" + formatNumber(value) + ")"));
        }
      }
      else if (token.letter == 'T' && !isToolNumber(value))
      {
        issues.push_back(makeError(line.lineNumber, "invalid tool number T" + formatNumber(value)));
      }
    }

    if (line.hasCode('M', 3) && (!speed || *speed <= 0))
    {
      issues.push_back(makeWarning(line.lineNumber, "spindle started without spindle speed"));
    }

    return issues;
  }

  void recordStructure(const TokenizedLine &line, ProgramStructure &structure)
  {
    const bool subprogramCall = line.hasCode('M', 98);

    for (const auto &token : line.tokens)
    {
      if (!token.value)
        continue;

      switch (token.letter)
      {
      case 'O':
        if (isProgramNumber(token))
          structure.declare({static_cast<long>(*token.value), token.text, line.lineNumber});
        break;
      case 'P':
        if (subprogramCall && isProgramNumber(token))
          structure.calls.push_back({static_cast<long>(*token.value), token.text, line.lineNumber});
        break;
      case 'M':
        if (*token.value == 99)
          structure.returns.push_back(line.lineNumber);
        else if (*token.value == 30)
          structure.addTerminator("M30");
        else if (*token.value == 2)
          structure.addTerminator("M02");
        break;
      default:
        break;
      }
    }
  }

  std::vector<Issue> validateLine(const TokenizedLine &line,
                                  ProgramState &state,
                                  const CheckerConfig &config)
  {
    std::vector<Issue> issues = checkSyntax(line, state, config);

    for (auto &issue : checkCoordinates(line, state, config))
      issues.push_back(std::move(issue));
    for (auto &issue : checkFeedRate(line, state, config))
      issues.push_back(std::move(issue));
    for (auto &issue : checkSpindleAndTool(line, state, config))
      issues.push_back(std::move(issue));

    recordStructure(line, state.structure);
    return issues;
  }

} // namespace GCodeCheck
