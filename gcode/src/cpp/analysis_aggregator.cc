/**
 * Analysis Aggregator - Implementation
 */

#include "analysis_aggregator.hh"

#include <algorithm>
#include <set>

namespace GCodeCheck
{

  namespace
  {

    void collect(const AnalysisResult &result, std::vector<const AnalysisResult *> &out)
    {
      out.push_back(&result);
      for (const auto &sub : result.subprograms)
        collect(sub.result, out);
    }

    // Structural warnings for one file against the merged call graph
    std::vector<Issue> structuralIssues(const AnalysisResult &result,
                                        const ProgramStructure &merged,
                                        const std::set<long> &resolved)
    {
      std::vector<Issue> issues;

      for (const auto &call : result.unresolvedCalls)
      {
        if (merged.isDeclared(call.number) || resolved.count(call.number) > 0)
          continue;
        issues.push_back(makeWarning(call.lineNumber,
                                     "subprogram P" + call.text + " called but not defined"));
      }

      // The first declaration is the file's own program
      const auto &declared = result.structure.declared;
      for (size_t i = 1; i < declared.size(); i++)
      {
        if (merged.isCalled(declared[i].number))
          continue;
        issues.push_back(makeWarning(declared[i].lineNumber,
                                     "subprogram O" + declared[i].text + " defined but never called"));
      }

      for (auto &issue : issues)
        issue.file = result.file;
      return issues;
    }

  } // namespace

  std::vector<const AnalysisResult *> flattenResults(const AnalysisResult &root)
  {
    std::vector<const AnalysisResult *> results;
    collect(root, results);
    return results;
  }

  CheckReport aggregate(AnalysisResult root)
  {
    CheckReport report;
    report.root = std::move(root);

    const AnalysisResult &main = report.root;
    const std::vector<const AnalysisResult *> results = flattenResults(main);

    std::set<long> resolved;
    for (const auto *result : results)
    {
      report.structure.merge(result->structure);
      for (const auto &sub : result->subprograms)
        resolved.insert(sub.programNumber);
    }

    for (const auto *result : results)
    {
      std::vector<Issue> issues = result->issues;
      for (auto &issue : structuralIssues(*result, report.structure, resolved))
        issues.push_back(std::move(issue));

      std::stable_sort(issues.begin(), issues.end(), [](const Issue &a, const Issue &b)
                       { return a.lineNumber < b.lineNumber; });
      report.issues.insert(report.issues.end(), issues.begin(), issues.end());

      report.travel.merge(result->travel);
      report.counts += result->counts;
      report.files.push_back(result->file);
    }

    report.mainFile = main.path.empty() ? main.file : main.path;
    report.positions = main.positions;
    report.errorCount = countSeverity(report.issues, Severity::ERROR);
    report.warningCount = countSeverity(report.issues, Severity::WARNING);
    report.passed = report.errorCount == 0;

    return report;
  }

} // namespace GCodeCheck
