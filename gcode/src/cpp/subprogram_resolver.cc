/**
 * Subprogram Resolver - Implementation
 */

#include "subprogram_resolver.hh"

#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace GCodeCheck
{

  bool ResolutionState::isActive(const fs::path &path) const
  {
    return std::find(active.begin(), active.end(), path) != active.end();
  }

  fs::path canonicalPath(const fs::path &path)
  {
    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(fs::absolute(path, ec), ec);
    if (ec)
      return path.lexically_normal();
    return resolved;
  }

  SubprogramResolver::SubprogramResolver(const CheckerConfig &config)
      : config_(config)
  {
  }

  std::vector<std::string> SubprogramResolver::candidateNames(const std::string &number) const
  {
    std::vector<std::string> names;
    names.reserve(config_.candidatePrefixes.size() * config_.candidateExtensions.size());
    for (const auto &prefix : config_.candidatePrefixes)
    {
      for (const auto &extension : config_.candidateExtensions)
      {
        names.push_back(prefix + number + extension);
      }
    }
    return names;
  }

  std::optional<fs::path> SubprogramResolver::locate(const std::string &number,
                                                     const fs::path &directory) const
  {
    const fs::path base = directory.empty() ? fs::path(".") : directory;
    for (const auto &name : candidateNames(number))
    {
      fs::path candidate = base / name;
      std::error_code ec;
      if (fs::is_regular_file(candidate, ec))
        return candidate;
    }
    return std::nullopt;
  }

  void SubprogramResolver::resolve(AnalysisResult &parent,
                                   const fs::path &directory,
                                   ResolutionState &state,
                                   const AnalyzeFn &analyze) const
  {
    for (const auto &call : parent.structure.distinctCalls())
    {
      if (parent.structure.isDeclared(call.number))
        continue;

      std::optional<fs::path> found = locate(call.text, directory);
      if (!found)
      {
        parent.unresolvedCalls.push_back(call);
        continue;
      }

      const std::string name = found->filename().string();
      const fs::path key = canonicalPath(*found);

      if (state.isActive(key))
      {
        Issue issue = makeWarning(call.lineNumber,
                                  "circular subprogram reference P" + call.text + " (" + name + ")");
        issue.file = parent.file;
        parent.issues.push_back(std::move(issue));
        continue;
      }

      // Already analyzed through another caller
      if (state.completed.count(key) > 0)
        continue;

      if (config_.verbose)
      {
        printf("Found subprogram: %s\n", found->string().c_str());
      }

      try
      {
        SubprogramResult sub;
        sub.programNumber = call.number;
        sub.file = name;
        sub.result = analyze(*found);

        if (config_.verbose)
        {
          printf("Analyzed subprogram: %s (commands: %zu, errors: %zu, warnings: %zu)\n",
                 name.c_str(), sub.result.counts.blocks,
                 sub.result.errorCount(), sub.result.warningCount());
        }

        parent.subprograms.push_back(std::move(sub));
      }
      catch (const std::runtime_error &e)
      {
        if (config_.verbose)
        {
          fprintf(stderr, "SubprogramResolver: %s\n", e.what());
        }
        Issue issue = makeWarning(call.lineNumber,
                                  "subprogram P" + call.text + " file " + name +
                                      " could not be read: " + e.what());
        issue.file = parent.file;
        parent.issues.push_back(std::move(issue));
      }
    }
  }

} // namespace GCodeCheck
