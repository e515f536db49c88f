/**
 * Checker Config - Header
 *
 * Thresholds and naming conventions used by the checker. Every field has a
 * default; the addon overrides them from the JavaScript options object.
 */

#ifndef GCODE_CHECK_CHECKER_CONFIG_HH
#define GCODE_CHECK_CHECKER_CONFIG_HH

#include <algorithm>
#include <string>
#include <vector>

namespace GCodeCheck
{

  struct CheckerConfig
  {
    // Limits
    double maxTravel = 1000.0;    // mm, absolute value per axis
    double maxFeedRate = 10000.0; // mm/min

    // Tokenizer
    char commentDelimiter = ';';

    // File discovery
    std::vector<std::string> supportedExtensions = {".nc", ".txt", ".gcode", ".cnc"};
    std::vector<std::string> candidatePrefixes = {"O", "o", ""};
    std::vector<std::string> candidateExtensions = {".txt", ".nc"};

    // Recognized codes, normalized ("G01", "M30")
    std::vector<std::string> supportedGCodes = {"G00", "G01", "G02", "G03"};
    std::vector<std::string> supportedMCodes = {"M03", "M05", "M98", "M99", "M30", "M02"};

    // Print found subprograms to stdout
    bool verbose = false;

    bool isSupportedGCode(const std::string &code) const
    {
      return std::find(supportedGCodes.begin(), supportedGCodes.end(), code) != supportedGCodes.end();
    }

    bool isSupportedMCode(const std::string &code) const
    {
      return std::find(supportedMCodes.begin(), supportedMCodes.end(), code) != supportedMCodes.end();
    }
  };

} // namespace GCodeCheck

#endif // GCODE_CHECK_CHECKER_CONFIG_HH
