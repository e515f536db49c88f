/**
 * Validation Rules - Header
 *
 * Per-line checks. Each rule looks at one tokenized line and the state
 * before the line is applied, and returns the issues it finds.
 */

#ifndef GCODE_CHECK_VALIDATION_RULES_HH
#define GCODE_CHECK_VALIDATION_RULES_HH

#include "analysis_types.hh"
#include "checker_config.hh"
#include "program_state.hh"

#include <string>
#include <vector>

namespace GCodeCheck
{

  /**
   * Format a G or M word the way it appears in the supported-code lists:
   * two-digit integers ("G01", "M30") or the decimal form ("G38.2").
   */
  std::string formatCode(char letter, double value);

  /**
   * Format a number for messages: up to four decimals, trailing zeros removed.
   */
  std::string formatNumber(double value);

  /**
   * Whether a token carries a plain non-negative integer usable as a
   * program number (digits only).
   */
  bool isProgramNumber(const Token &token);

  // Word format, unknown addresses and unsupported G/M codes
  std::vector<Issue> checkSyntax(const TokenizedLine &line,
                                 const ProgramState &state,
                                 const CheckerConfig &config);

  // X/Y/Z words beyond the configured travel limit (warnings)
  std::vector<Issue> checkCoordinates(const TokenizedLine &line,
                                      const ProgramState &state,
                                      const CheckerConfig &config);

  // F <= 0 is an error, F above the limit a warning
  std::vector<Issue> checkFeedRate(const TokenizedLine &line,
                                   const ProgramState &state,
                                   const CheckerConfig &config);

  // Negative spindle speed, bad tool numbers, spindle start without speed
  std::vector<Issue> checkSpindleAndTool(const TokenizedLine &line,
                                         const ProgramState &state,
                                         const CheckerConfig &config);

  /**
   * Record program declarations (O), calls (M98 P), returns (M99) and
   * program ends (M30/M02). Never reports issues; the structure is checked
   * once the whole call graph is known.
   */
  void recordStructure(const TokenizedLine &line, ProgramStructure &structure);

  /**
   * Run every rule on a line in order: syntax, coordinates, feed rate,
   * spindle/tool, then record the structural markers into `state`.
   *
   * @return All issues for the line, in rule order
   */
  std::vector<Issue> validateLine(const TokenizedLine &line,
                                  ProgramState &state,
                                  const CheckerConfig &config);

} // namespace GCodeCheck

#endif // GCODE_CHECK_VALIDATION_RULES_HH
