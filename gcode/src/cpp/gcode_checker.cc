/**
 * G-Code Checker - Implementation
 */

#include "gcode_checker.hh"
#include "analysis_aggregator.hh"
#include "line_tokenizer.hh"
#include "program_state.hh"
#include "source_reader.hh"
#include "subprogram_resolver.hh"
#include "validation_rules.hh"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace GCodeCheck
{

  namespace
  {

    const size_t progressInterval = 50; // Report progress every N lines

    bool isBlank(const std::string &line)
    {
      return std::all_of(line.begin(), line.end(), [](char c)
                         { return std::isspace(static_cast<unsigned char>(c)) != 0; });
    }

    AnalysisResult analyzeRecursive(const fs::path &path,
                                    const CheckerConfig &config,
                                    ResolutionState &state,
                                    const ProgressCallback &progressCallback)
    {
      std::vector<std::string> lines = readSourceLines(path.string());

      AnalysisResult result = analyzeLines(lines, path.filename().string(), config, progressCallback);
      result.path = path.string();

      if (auto formatIssue = checkFileFormat(path.string(), config))
      {
        formatIssue->file = result.file;
        result.issues.insert(result.issues.begin(), *formatIssue);
      }

      const fs::path key = canonicalPath(path);
      state.active.push_back(key);

      SubprogramResolver resolver(config);
      resolver.resolve(result, path.parent_path(), state,
                       [&](const fs::path &subprogram)
                       { return analyzeRecursive(subprogram, config, state, progressCallback); });

      state.active.pop_back();
      state.completed.insert(key);

      return result;
    }

  } // namespace

  AnalysisResult analyzeLines(const std::vector<std::string> &lines,
                              const std::string &file,
                              const CheckerConfig &config,
                              ProgressCallback progressCallback)
  {
    ProgramState state;
    state.file = file;
    state.totalLines = lines.size();
    state.progressCallback = progressCallback;

    std::vector<Issue> issues;

    for (size_t i = 0; i < lines.size(); i++)
    {
      const int lineNumber = static_cast<int>(i + 1);
      const std::string &raw = lines[i];

      if (!isBlank(raw))
      {
        state.counts.lines++;

        TokenizedLine line = tokenizeLine(raw, lineNumber, config, issues);
        if (!line.empty())
        {
          state.counts.blocks++;

          for (auto &issue : validateLine(line, state, config))
            issues.push_back(std::move(issue));
          state.applyLine(line, issues);
        }
      }

      if (progressCallback && ((i + 1) % progressInterval == 0))
      {
        state.reportProgress(i + 1, issues.size());
      }
    }

    // Final progress report
    state.reportProgress(lines.size(), issues.size());

    for (auto &issue : issues)
      issue.file = file;

    AnalysisResult result;
    result.file = file;
    result.positions = std::move(state.positions);
    result.travel = state.travel;
    result.issues = std::move(issues);
    result.structure = std::move(state.structure);
    result.counts = state.counts;
    return result;
  }

  std::optional<Issue> checkFileFormat(const std::string &filepath, const CheckerConfig &config)
  {
    std::string extension = fs::path(filepath).extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(), [](char c)
                   { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });

    const auto &supported = config.supportedExtensions;
    if (std::find(supported.begin(), supported.end(), extension) != supported.end())
      return std::nullopt;

    return makeWarning(0, "File extension '" + extension + "' may not be standard G-code format");
  }

  AnalysisResult analyzeFile(const std::string &filepath,
                             const CheckerConfig &config,
                             ProgressCallback progressCallback)
  {
    ResolutionState state;
    return analyzeRecursive(fs::path(filepath), config, state, progressCallback);
  }

  CheckReport checkFile(const std::string &filepath,
                        const CheckerConfig &config,
                        ProgressCallback progressCallback)
  {
    return aggregate(analyzeFile(filepath, config, progressCallback));
  }

} // namespace GCodeCheck
