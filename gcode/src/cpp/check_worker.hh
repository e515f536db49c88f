/**
 * Check Worker - Header
 *
 * Async worker for background G-code checking with progress reporting.
 */

#ifndef GCODE_CHECK_CHECK_WORKER_HH
#define GCODE_CHECK_CHECK_WORKER_HH

#include <napi.h>
#include "analysis_types.hh"
#include "checker_config.hh"

namespace GCodeCheck
{

  /**
   * Async worker that checks a G-code file in a background thread.
   */
  class CheckWorker : public Napi::AsyncProgressWorker<CheckProgress>
  {
  public:
    CheckWorker(
        Napi::Function &callback,
        Napi::Function &progressCallback,
        const std::string &filepath,
        const CheckerConfig &config);

    ~CheckWorker();

    void Execute(const ExecutionProgress &progress) override;
    void OnProgress(const CheckProgress *data, size_t count) override;
    void OnOK() override;
    void OnError(const Napi::Error &error) override;

  private:
    std::string filepath_;
    CheckerConfig config_;
    CheckReport report_;
    Napi::FunctionReference progressCallback_;

    // Helpers to convert the report to JS objects
    Napi::Object reportToJS(Napi::Env env);
    Napi::Float64Array position3ToJS(Napi::Env env, const Position3 &pos);
    Napi::Value axisRangeToJS(Napi::Env env, const AxisRange &range);
    Napi::Object travelToJS(Napi::Env env, const TravelRange &travel);
    Napi::Object issueToJS(Napi::Env env, const Issue &issue);
    Napi::Object structureToJS(Napi::Env env, const ProgramStructure &structure);
    Napi::Object countsToJS(Napi::Env env, const CommandCounts &counts);
    Napi::Object subprogramToJS(Napi::Env env, const SubprogramResult &sub);
  };

} // namespace GCodeCheck

#endif // GCODE_CHECK_CHECK_WORKER_HH
