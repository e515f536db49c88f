/**
 * Line Tokenizer - Header
 *
 * Splits one line of G-code into address words.
 */

#ifndef GCODE_CHECK_LINE_TOKENIZER_HH
#define GCODE_CHECK_LINE_TOKENIZER_HH

#include "analysis_types.hh"
#include "checker_config.hh"

#include <string>
#include <vector>

namespace GCodeCheck
{

  /**
   * Whether `letter` is one of the address letters the checker understands
   * (G, M, O, N, X, Y, Z, I, J, K, R, F, S, T, P).
   */
  bool isKnownAddress(char letter);

  /**
   * Remove comments from a line.
   *
   * Everything after `delimiter` is dropped, as is any "( ... )" group.
   *
   * @param text Raw line
   * @param delimiter Comment-to-end-of-line character
   * @param unterminated Set when a '(' has no closing ')'
   * @return The line without comments
   */
  std::string stripComments(const std::string &text, char delimiter, bool &unterminated);

  /**
   * Tokenize one line.
   *
   * Malformed words are skipped and reported as errors in `issues`; the
   * remaining words are still returned. Never throws on bad input.
   *
   * @param text Raw line
   * @param lineNumber 1-based line number for diagnostics
   * @param config Checker configuration (comment delimiter)
   * @param issues Receives tokenizer issues
   * @return The line's words in source order
   */
  TokenizedLine tokenizeLine(const std::string &text,
                             int lineNumber,
                             const CheckerConfig &config,
                             std::vector<Issue> &issues);

} // namespace GCodeCheck

#endif // GCODE_CHECK_LINE_TOKENIZER_HH
