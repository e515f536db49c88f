/**
 * Subprogram Resolver - Header
 *
 * Finds the files behind M98 P<n> calls next to the calling file and runs
 * the checker on them.
 */

#ifndef GCODE_CHECK_SUBPROGRAM_RESOLVER_HH
#define GCODE_CHECK_SUBPROGRAM_RESOLVER_HH

#include "analysis_types.hh"
#include "checker_config.hh"

#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace GCodeCheck
{

  /**
   * Files visited during one resolution pass, keyed by canonical path.
   */
  struct ResolutionState
  {
    std::vector<std::filesystem::path> active; // recursion stack
    std::set<std::filesystem::path> completed;

    bool isActive(const std::filesystem::path &path) const;
  };

  /**
   * Canonical absolute form of a path, used to compare files.
   */
  std::filesystem::path canonicalPath(const std::filesystem::path &path);

  class SubprogramResolver
  {
  public:
    using AnalyzeFn = std::function<AnalysisResult(const std::filesystem::path &)>;

    explicit SubprogramResolver(const CheckerConfig &config);

    /**
     * File names to try for a called program, in lookup order:
     * every candidate prefix with every candidate extension.
     *
     * @param number Program number as written in the call
     */
    std::vector<std::string> candidateNames(const std::string &number) const;

    /**
     * First candidate that exists as a regular file in `directory`.
     */
    std::optional<std::filesystem::path> locate(const std::string &number,
                                                const std::filesystem::path &directory) const;

    /**
     * Resolve every distinct call of `parent` that is not declared in the
     * same file.
     *
     * Found files are analyzed through `analyze` and attached to
     * `parent.subprograms`. Calls without a file are added to
     * `parent.unresolvedCalls`. Circular references and unreadable files
     * become warnings on `parent`.
     *
     * @param parent Result of the calling file
     * @param directory Directory searched for candidates
     * @param state Visited files for this pass
     * @param analyze Runs the full checker on a file
     */
    void resolve(AnalysisResult &parent,
                 const std::filesystem::path &directory,
                 ResolutionState &state,
                 const AnalyzeFn &analyze) const;

  private:
    const CheckerConfig &config_;
  };

} // namespace GCodeCheck

#endif // GCODE_CHECK_SUBPROGRAM_RESOLVER_HH
