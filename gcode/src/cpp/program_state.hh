/**
 * Program State - Header
 *
 * Modal machine state carried from line to line while one file is checked:
 * position, motion mode, feed, spindle and tool, plus the accumulated
 * position history, travel range, structure and counters.
 */

#ifndef GCODE_CHECK_PROGRAM_STATE_HH
#define GCODE_CHECK_PROGRAM_STATE_HH

#include "analysis_types.hh"
#include <functional>
#include <optional>

namespace GCodeCheck
{

  /**
   * State for one file. Created fresh per file and threaded explicitly
   * through the validation rules; nothing here is shared between files.
   */
  struct ProgramState
  {
    // Output
    std::vector<Position3> positions;
    TravelRange travel;
    ProgramStructure structure;
    CommandCounts counts;

    // Current state
    Position3 currentPosition;
    std::optional<MotionMode> motionMode;
    std::optional<double> feedRate;
    std::optional<double> spindleSpeed;
    std::optional<long> selectedTool;

    // Progress callback
    std::function<void(const CheckProgress &)> progressCallback;
    std::string file;
    size_t totalLines = 0;

    // Helper methods
    void addPosition(const Position3 &pos);
    void reportProgress(size_t linesRead, size_t issueCount);

    /**
     * Apply the modal effects of one line: motion mode, position, feed,
     * spindle, tool and counters. Ambiguous arcs are reported in `issues`.
     */
    void applyLine(const TokenizedLine &line, std::vector<Issue> &issues);
  };

  /**
   * G-codes that take X/Y/Z words without moving to them
   * (dwell, offsets, reference returns).
   */
  bool consumesAxisWords(double gcode);

  // Largest tool number a T word may select
  constexpr double MAX_TOOL_NUMBER = 999999999;

  /**
   * True for a non-negative integral T value no larger than MAX_TOOL_NUMBER.
   */
  bool isToolNumber(double value);

} // namespace GCodeCheck

#endif // GCODE_CHECK_PROGRAM_STATE_HH
