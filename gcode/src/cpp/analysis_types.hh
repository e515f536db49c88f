/**
 * Analysis Types for the G-code Checker
 *
 * These structures hold the tokenized program, the per-file analysis and
 * the merged report before they are converted to JavaScript objects.
 */

#ifndef GCODE_CHECK_ANALYSIS_TYPES_HH
#define GCODE_CHECK_ANALYSIS_TYPES_HH

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace GCodeCheck
{

  // ============================================================================
  // Enums (matching TypeScript)
  // ============================================================================

  enum class Severity
  {
    ERROR = 1,
    WARNING = 2,
  };

  enum class MotionMode
  {
    RAPID = 0,
    LINEAR = 1,
    ARC_CW = 2,
    ARC_CCW = 3,
  };

  // ============================================================================
  // Tokens
  // ============================================================================

  struct Token
  {
    char letter = 0;
    std::optional<double> value;
    std::string text; // numeric part as written, e.g. "0001"
    bool known = false;

    bool hasValue() const { return value.has_value(); }
  };

  struct TokenizedLine
  {
    int lineNumber = 0;
    std::string text;
    std::vector<Token> tokens;

    bool empty() const { return tokens.empty(); }

    const Token *find(char letter) const
    {
      for (const auto &token : tokens)
      {
        if (token.letter == letter)
          return &token;
      }
      return nullptr;
    }

    bool has(char letter) const { return find(letter) != nullptr; }

    bool hasCode(char letter, double code) const
    {
      for (const auto &token : tokens)
      {
        if (token.letter == letter && token.value && *token.value == code)
          return true;
      }
      return false;
    }
  };

  // ============================================================================
  // Positions and Travel
  // ============================================================================

  struct Position3
  {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    bool operator==(const Position3 &other) const
    {
      return x == other.x && y == other.y && z == other.z;
    }
  };

  struct AxisRange
  {
    double min = 0.0;
    double max = 0.0;
    bool defined = false;

    void update(double value)
    {
      if (!defined)
      {
        min = value;
        max = value;
        defined = true;
        return;
      }
      if (value < min)
        min = value;
      if (value > max)
        max = value;
    }

    void merge(const AxisRange &other)
    {
      if (!other.defined)
        return;
      update(other.min);
      update(other.max);
    }

    bool operator==(const AxisRange &other) const
    {
      if (defined != other.defined)
        return false;
      return !defined || (min == other.min && max == other.max);
    }
  };

  struct TravelRange
  {
    AxisRange x;
    AxisRange y;
    AxisRange z;

    bool isValid() const
    {
      return x.defined || y.defined || z.defined;
    }

    void merge(const TravelRange &other)
    {
      x.merge(other.x);
      y.merge(other.y);
      z.merge(other.z);
    }

    bool operator==(const TravelRange &other) const
    {
      return x == other.x && y == other.y && z == other.z;
    }
  };

  // ============================================================================
  // Issues
  // ============================================================================

  struct Issue
  {
    Severity severity = Severity::ERROR;
    std::string message;
    std::string file;
    int lineNumber = 0;

    bool operator==(const Issue &other) const
    {
      return severity == other.severity && message == other.message &&
             file == other.file && lineNumber == other.lineNumber;
    }
  };

  inline Issue makeError(int lineNumber, const std::string &message)
  {
    return Issue{Severity::ERROR, message, std::string(), lineNumber};
  }

  inline Issue makeWarning(int lineNumber, const std::string &message)
  {
    return Issue{Severity::WARNING, message, std::string(), lineNumber};
  }

  inline size_t countSeverity(const std::vector<Issue> &issues, Severity severity)
  {
    return static_cast<size_t>(std::count_if(issues.begin(), issues.end(),
                                             [severity](const Issue &issue)
                                             { return issue.severity == severity; }));
  }

  // ============================================================================
  // Program Structure
  // ============================================================================

  struct ProgramDeclaration
  {
    long number = 0;
    std::string text;
    int lineNumber = 0;

    bool operator==(const ProgramDeclaration &other) const
    {
      return number == other.number && text == other.text && lineNumber == other.lineNumber;
    }
  };

  struct ProgramCall
  {
    long number = 0;
    std::string text; // as spelled after P, used for file lookup
    int lineNumber = 0;

    bool operator==(const ProgramCall &other) const
    {
      return number == other.number && text == other.text && lineNumber == other.lineNumber;
    }
  };

  struct ProgramStructure
  {
    std::vector<ProgramDeclaration> declared;
    std::vector<ProgramCall> calls;
    std::vector<std::string> terminators;
    std::vector<int> returns;

    bool isDeclared(long number) const
    {
      return std::any_of(declared.begin(), declared.end(),
                         [number](const ProgramDeclaration &d)
                         { return d.number == number; });
    }

    bool isCalled(long number) const
    {
      return std::any_of(calls.begin(), calls.end(),
                         [number](const ProgramCall &c)
                         { return c.number == number; });
    }

    void declare(const ProgramDeclaration &declaration)
    {
      if (!isDeclared(declaration.number))
        declared.push_back(declaration);
    }

    void addTerminator(const std::string &code)
    {
      if (std::find(terminators.begin(), terminators.end(), code) == terminators.end())
        terminators.push_back(code);
    }

    // Distinct call sites, first occurrence of each number.
    std::vector<ProgramCall> distinctCalls() const
    {
      std::vector<ProgramCall> result;
      for (const auto &call : calls)
      {
        bool seen = std::any_of(result.begin(), result.end(),
                                [&call](const ProgramCall &c)
                                { return c.number == call.number; });
        if (!seen)
          result.push_back(call);
      }
      return result;
    }

    void merge(const ProgramStructure &other)
    {
      for (const auto &declaration : other.declared)
        declare(declaration);
      calls.insert(calls.end(), other.calls.begin(), other.calls.end());
      for (const auto &code : other.terminators)
        addTerminator(code);
      returns.insert(returns.end(), other.returns.begin(), other.returns.end());
    }

    bool operator==(const ProgramStructure &other) const
    {
      return declared == other.declared && calls == other.calls &&
             terminators == other.terminators && returns == other.returns;
    }
  };

  // ============================================================================
  // Counters and Progress
  // ============================================================================

  struct CommandCounts
  {
    size_t lines = 0;
    size_t blocks = 0;
    size_t rapidMoves = 0;
    size_t linearMoves = 0;
    size_t arcMoves = 0;
    size_t unqualifiedMoves = 0;
    size_t subprogramCalls = 0;
    size_t toolChanges = 0;

    size_t motionCommands() const
    {
      return rapidMoves + linearMoves + arcMoves + unqualifiedMoves;
    }

    CommandCounts &operator+=(const CommandCounts &other)
    {
      lines += other.lines;
      blocks += other.blocks;
      rapidMoves += other.rapidMoves;
      linearMoves += other.linearMoves;
      arcMoves += other.arcMoves;
      unqualifiedMoves += other.unqualifiedMoves;
      subprogramCalls += other.subprogramCalls;
      toolChanges += other.toolChanges;
      return *this;
    }

    bool operator==(const CommandCounts &other) const
    {
      return lines == other.lines && blocks == other.blocks &&
             rapidMoves == other.rapidMoves && linearMoves == other.linearMoves &&
             arcMoves == other.arcMoves && unqualifiedMoves == other.unqualifiedMoves &&
             subprogramCalls == other.subprogramCalls && toolChanges == other.toolChanges;
    }
  };

  struct CheckProgress
  {
    std::string file;
    size_t linesRead = 0;
    size_t totalLines = 0;
    double percent = 0.0;
    size_t issueCount = 0;
  };

  // ============================================================================
  // Analysis Results
  // ============================================================================

  struct SubprogramResult;

  struct AnalysisResult
  {
    std::string file; // base name, used to tag issues
    std::string path;
    std::vector<Position3> positions;
    TravelRange travel;
    std::vector<Issue> issues;
    ProgramStructure structure;
    CommandCounts counts;
    std::vector<ProgramCall> unresolvedCalls;
    std::vector<SubprogramResult> subprograms;

    size_t errorCount() const { return countSeverity(issues, Severity::ERROR); }
    size_t warningCount() const { return countSeverity(issues, Severity::WARNING); }
  };

  struct SubprogramResult
  {
    long programNumber = 0;
    std::string file;
    AnalysisResult result;
  };

  inline bool operator==(const AnalysisResult &a, const AnalysisResult &b);

  inline bool operator==(const SubprogramResult &a, const SubprogramResult &b)
  {
    return a.programNumber == b.programNumber && a.file == b.file && a.result == b.result;
  }

  inline bool operator==(const AnalysisResult &a, const AnalysisResult &b)
  {
    return a.file == b.file && a.path == b.path && a.positions == b.positions &&
           a.travel == b.travel && a.issues == b.issues && a.structure == b.structure &&
           a.counts == b.counts && a.unresolvedCalls == b.unresolvedCalls &&
           a.subprograms == b.subprograms;
  }

  // ============================================================================
  // Check Report
  // ============================================================================

  struct CheckReport
  {
    std::string mainFile;
    std::vector<Position3> positions;
    TravelRange travel;
    std::vector<Issue> issues;
    ProgramStructure structure;
    CommandCounts counts;
    std::vector<std::string> files;
    size_t errorCount = 0;
    size_t warningCount = 0;
    bool passed = true;
    AnalysisResult root;
  };

} // namespace GCodeCheck

#endif // GCODE_CHECK_ANALYSIS_TYPES_HH
