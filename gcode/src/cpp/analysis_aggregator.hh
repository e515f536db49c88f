/**
 * Analysis Aggregator - Header
 *
 * Merges a main program's result with the results of all subprograms it
 * resolved into one report and decides the verdict.
 */

#ifndef GCODE_CHECK_ANALYSIS_AGGREGATOR_HH
#define GCODE_CHECK_ANALYSIS_AGGREGATOR_HH

#include "analysis_types.hh"

#include <vector>

namespace GCodeCheck
{

  /**
   * Results of the tree in depth-first order, main program first.
   */
  std::vector<const AnalysisResult *> flattenResults(const AnalysisResult &root);

  /**
   * Merge a result tree into a report.
   *
   * Issues are ordered by file (depth-first) and then by line. Call and
   * declaration mismatches across the whole call graph are added as
   * warnings. The report passes if and only if it holds no errors.
   *
   * @param root Result of the main program
   */
  CheckReport aggregate(AnalysisResult root);

} // namespace GCodeCheck

#endif // GCODE_CHECK_ANALYSIS_AGGREGATOR_HH
