/**
 * G-Code Checker - Header
 *
 * Runs the tokenizer, validation rules and state tracker over a G-code
 * file, resolves its subprogram calls and produces the merged report.
 */

#ifndef GCODE_CHECK_GCODE_CHECKER_HH
#define GCODE_CHECK_GCODE_CHECKER_HH

#include "analysis_types.hh"
#include "checker_config.hh"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace GCodeCheck
{

  using ProgressCallback = std::function<void(const CheckProgress &)>;

  /**
   * Check the lines of one file without touching the file system.
   * Subprogram calls are recorded but not resolved.
   *
   * @param lines Source lines, line N at index N-1
   * @param file Name used to tag the issues
   * @param config Checker configuration
   * @param progressCallback Optional callback for progress updates
   */
  AnalysisResult analyzeLines(const std::vector<std::string> &lines,
                              const std::string &file,
                              const CheckerConfig &config,
                              ProgressCallback progressCallback = nullptr);

  /**
   * Warning for a file name whose extension is not a usual G-code one.
   */
  std::optional<Issue> checkFileFormat(const std::string &filepath, const CheckerConfig &config);

  /**
   * Check a G-code file and every subprogram file it calls.
   *
   * @param filepath Path to the main G-code file
   * @param config Checker configuration
   * @param progressCallback Optional callback for progress updates
   * @return Result tree, subprograms nested under their caller
   * @throws std::runtime_error if the main file cannot be read
   */
  AnalysisResult analyzeFile(const std::string &filepath,
                             const CheckerConfig &config,
                             ProgressCallback progressCallback = nullptr);

  /**
   * Check a G-code file and merge all results into one report.
   *
   * @param filepath Path to the main G-code file
   * @param config Checker configuration
   * @param progressCallback Optional callback for progress updates
   * @return Merged report with verdict
   * @throws std::runtime_error if the main file cannot be read
   */
  CheckReport checkFile(const std::string &filepath,
                        const CheckerConfig &config,
                        ProgressCallback progressCallback = nullptr);

} // namespace GCodeCheck

#endif // GCODE_CHECK_GCODE_CHECKER_HH
