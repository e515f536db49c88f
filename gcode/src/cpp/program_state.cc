/**
 * Program State - Implementation
 *
 * Arcs are tracked by their end point only; the tool path between start
 * and end is not interpolated.
 */

#include "program_state.hh"

#include <cmath>

namespace GCodeCheck
{

  bool consumesAxisWords(double gcode)
  {
    return gcode == 4 || gcode == 10 || gcode == 28 || gcode == 30 || gcode == 92;
  }

  bool isToolNumber(double value)
  {
    return value >= 0 && value <= MAX_TOOL_NUMBER && std::floor(value) == value;
  }

  void ProgramState::addPosition(const Position3 &pos)
  {
    currentPosition = pos;
    positions.push_back(pos);
  }

  void ProgramState::reportProgress(size_t linesRead, size_t issueCount)
  {
    if (progressCallback && totalLines > 0)
    {
      CheckProgress progress;
      progress.file = file;
      progress.linesRead = linesRead;
      progress.totalLines = totalLines;
      progress.percent = (static_cast<double>(linesRead) / totalLines) * 100.0;
      progress.issueCount = issueCount;
      progressCallback(progress);
    }
  }

  void ProgramState::applyLine(const TokenizedLine &line, std::vector<Issue> &issues)
  {
    bool explicitArc = false;
    bool axisConsumer = false;
    bool hasArcCenter = false;
    bool hasAxis = false;

    for (const auto &token : line.tokens)
    {
      if (!token.value)
        continue;
      double value = *token.value;

      switch (token.letter)
      {
      case 'G':
        if (value == 0 || value == 1 || value == 2 || value == 3)
        {
          motionMode = static_cast<MotionMode>(static_cast<int>(value));
          explicitArc = (value == 2 || value == 3);
        }
        else if (consumesAxisWords(value))
        {
          axisConsumer = true;
        }
        break;
      case 'F':
        feedRate = value;
        break;
      case 'S':
        spindleSpeed = value;
        break;
      case 'T':
        if (isToolNumber(value))
        {
          selectedTool = static_cast<long>(value);
          counts.toolChanges++;
        }
        break;
      case 'M':
        if (value == 98)
          counts.subprogramCalls++;
        break;
      case 'I':
      case 'J':
      case 'K':
      case 'R':
        hasArcCenter = true;
        break;
      case 'X':
      case 'Y':
      case 'Z':
        hasAxis = true;
        break;
      default:
        break;
      }
    }

    bool arcMode = motionMode && (*motionMode == MotionMode::ARC_CW || *motionMode == MotionMode::ARC_CCW);
    bool moves = hasAxis && !axisConsumer;

    if ((explicitArc || (arcMode && moves)) && !hasArcCenter)
    {
      issues.push_back(makeWarning(line.lineNumber, "arc command without center/radius"));
    }

    if (!moves)
      return;

    // Modal merge: only the axes on this line change
    Position3 pos = currentPosition;
    for (const auto &token : line.tokens)
    {
      if (!token.value)
        continue;
      switch (token.letter)
      {
      case 'X':
        pos.x = *token.value;
        travel.x.update(pos.x);
        break;
      case 'Y':
        pos.y = *token.value;
        travel.y.update(pos.y);
        break;
      case 'Z':
        pos.z = *token.value;
        travel.z.update(pos.z);
        break;
      default:
        break;
      }
    }
    addPosition(pos);

    if (!motionMode)
    {
      counts.unqualifiedMoves++;
      return;
    }
    switch (*motionMode)
    {
    case MotionMode::RAPID:
      counts.rapidMoves++;
      break;
    case MotionMode::LINEAR:
      counts.linearMoves++;
      break;
    case MotionMode::ARC_CW:
    case MotionMode::ARC_CCW:
      counts.arcMoves++;
      break;
    }
  }

} // namespace GCodeCheck
