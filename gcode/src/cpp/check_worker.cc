/**
 * Check Worker - Implementation
 *
 * Async worker for background G-code checking with progress reporting.
 */

#include "check_worker.hh"
#include "gcode_checker.hh"

namespace GCodeCheck
{

  CheckWorker::CheckWorker(
      Napi::Function &callback,
      Napi::Function &progressCallback,
      const std::string &filepath,
      const CheckerConfig &config)
      : Napi::AsyncProgressWorker<CheckProgress>(callback),
        filepath_(filepath),
        config_(config)
  {
    if (!progressCallback.IsEmpty() && progressCallback.IsFunction())
    {
      progressCallback_ = Napi::Persistent(progressCallback);
    }
  }

  CheckWorker::~CheckWorker() {}

  void CheckWorker::Execute(const ExecutionProgress &progress)
  {
    try
    {
      // Create progress callback that reports to Node.js
      auto progressFn = [&progress](const CheckProgress &p)
      {
        progress.Send(&p, 1);
      };

      report_ = checkFile(filepath_, config_, progressFn);
    }
    catch (const std::exception &e)
    {
      SetError(e.what());
    }
  }

  void CheckWorker::OnProgress(const CheckProgress *data, size_t count)
  {
    if (count > 0 && !progressCallback_.IsEmpty())
    {
      Napi::Env env = progressCallback_.Env();
      Napi::HandleScope scope(env);

      const CheckProgress &p = data[0];

      Napi::Object progressObj = Napi::Object::New(env);
      progressObj.Set("file", Napi::String::New(env, p.file));
      progressObj.Set("linesRead", Napi::Number::New(env, static_cast<double>(p.linesRead)));
      progressObj.Set("totalLines", Napi::Number::New(env, static_cast<double>(p.totalLines)));
      progressObj.Set("percent", Napi::Number::New(env, p.percent));
      progressObj.Set("issueCount", Napi::Number::New(env, static_cast<double>(p.issueCount)));

      progressCallback_.Call({progressObj});
    }
  }

  void CheckWorker::OnOK()
  {
    Napi::Env env = Env();
    Napi::HandleScope scope(env);

    Callback().Call({env.Null(), reportToJS(env)});
  }

  void CheckWorker::OnError(const Napi::Error &error)
  {
    Napi::Env env = Env();
    Napi::HandleScope scope(env);

    Callback().Call({error.Value(), env.Null()});
  }

  Napi::Float64Array CheckWorker::position3ToJS(Napi::Env env, const Position3 &pos)
  {
    // Return as Float64Array(3): [x, y, z]
    Napi::Float64Array arr = Napi::Float64Array::New(env, 3);
    arr[0] = pos.x;
    arr[1] = pos.y;
    arr[2] = pos.z;
    return arr;
  }

  Napi::Value CheckWorker::axisRangeToJS(Napi::Env env, const AxisRange &range)
  {
    // null when the axis never moved
    if (!range.defined)
    {
      return env.Null();
    }
    Napi::Object obj = Napi::Object::New(env);
    obj.Set("min", Napi::Number::New(env, range.min));
    obj.Set("max", Napi::Number::New(env, range.max));
    return obj;
  }

  Napi::Object CheckWorker::travelToJS(Napi::Env env, const TravelRange &travel)
  {
    Napi::Object obj = Napi::Object::New(env);
    obj.Set("x", axisRangeToJS(env, travel.x));
    obj.Set("y", axisRangeToJS(env, travel.y));
    obj.Set("z", axisRangeToJS(env, travel.z));
    return obj;
  }

  Napi::Object CheckWorker::issueToJS(Napi::Env env, const Issue &issue)
  {
    Napi::Object obj = Napi::Object::New(env);
    obj.Set("severity", Napi::Number::New(env, static_cast<int>(issue.severity)));
    obj.Set("message", Napi::String::New(env, issue.message));
    obj.Set("file", Napi::String::New(env, issue.file));
    obj.Set("lineNumber", Napi::Number::New(env, issue.lineNumber));
    return obj;
  }

  Napi::Object CheckWorker::structureToJS(Napi::Env env, const ProgramStructure &structure)
  {
    Napi::Object obj = Napi::Object::New(env);

    Napi::Array declared = Napi::Array::New(env, structure.declared.size());
    for (size_t i = 0; i < structure.declared.size(); i++)
    {
      Napi::Object decl = Napi::Object::New(env);
      decl.Set("number", Napi::Number::New(env, static_cast<double>(structure.declared[i].number)));
      decl.Set("name", Napi::String::New(env, "O" + structure.declared[i].text));
      decl.Set("lineNumber", Napi::Number::New(env, structure.declared[i].lineNumber));
      declared[i] = decl;
    }
    obj.Set("declared", declared);

    std::vector<ProgramCall> distinct = structure.distinctCalls();
    Napi::Array called = Napi::Array::New(env, distinct.size());
    for (size_t i = 0; i < distinct.size(); i++)
    {
      Napi::Object call = Napi::Object::New(env);
      call.Set("number", Napi::Number::New(env, static_cast<double>(distinct[i].number)));
      call.Set("name", Napi::String::New(env, "P" + distinct[i].text));
      call.Set("lineNumber", Napi::Number::New(env, distinct[i].lineNumber));
      called[i] = call;
    }
    obj.Set("called", called);

    Napi::Array terminators = Napi::Array::New(env, structure.terminators.size());
    for (size_t i = 0; i < structure.terminators.size(); i++)
    {
      terminators[i] = Napi::String::New(env, structure.terminators[i]);
    }
    obj.Set("terminators", terminators);
    obj.Set("returnCount", Napi::Number::New(env, static_cast<double>(structure.returns.size())));

    return obj;
  }

  Napi::Object CheckWorker::countsToJS(Napi::Env env, const CommandCounts &counts)
  {
    Napi::Object obj = Napi::Object::New(env);
    obj.Set("lines", Napi::Number::New(env, static_cast<double>(counts.lines)));
    obj.Set("commands", Napi::Number::New(env, static_cast<double>(counts.blocks)));
    obj.Set("rapidMoves", Napi::Number::New(env, static_cast<double>(counts.rapidMoves)));
    obj.Set("linearMoves", Napi::Number::New(env, static_cast<double>(counts.linearMoves)));
    obj.Set("arcMoves", Napi::Number::New(env, static_cast<double>(counts.arcMoves)));
    obj.Set("unqualifiedMoves", Napi::Number::New(env, static_cast<double>(counts.unqualifiedMoves)));
    obj.Set("subprogramCalls", Napi::Number::New(env, static_cast<double>(counts.subprogramCalls)));
    obj.Set("toolChanges", Napi::Number::New(env, static_cast<double>(counts.toolChanges)));
    return obj;
  }

  Napi::Object CheckWorker::subprogramToJS(Napi::Env env, const SubprogramResult &sub)
  {
    Napi::Object obj = Napi::Object::New(env);
    obj.Set("programNumber", Napi::Number::New(env, static_cast<double>(sub.programNumber)));
    obj.Set("file", Napi::String::New(env, sub.file));
    obj.Set("path", Napi::String::New(env, sub.result.path));
    obj.Set("errors", Napi::Number::New(env, static_cast<double>(sub.result.errorCount())));
    obj.Set("warnings", Napi::Number::New(env, static_cast<double>(sub.result.warningCount())));
    obj.Set("commands", Napi::Number::New(env, static_cast<double>(sub.result.counts.blocks)));
    obj.Set("travel", travelToJS(env, sub.result.travel));

    Napi::Array nested = Napi::Array::New(env, sub.result.subprograms.size());
    for (size_t i = 0; i < sub.result.subprograms.size(); i++)
    {
      nested[i] = subprogramToJS(env, sub.result.subprograms[i]);
    }
    obj.Set("subprograms", nested);
    return obj;
  }

  Napi::Object CheckWorker::reportToJS(Napi::Env env)
  {
    Napi::Object result = Napi::Object::New(env);

    result.Set("mainFile", Napi::String::New(env, report_.mainFile));

    // Position history of the main program
    Napi::Array positions = Napi::Array::New(env, report_.positions.size());
    for (size_t i = 0; i < report_.positions.size(); i++)
    {
      positions[i] = position3ToJS(env, report_.positions[i]);
    }
    result.Set("positions", positions);

    result.Set("travel", travelToJS(env, report_.travel));

    Napi::Array issues = Napi::Array::New(env, report_.issues.size());
    for (size_t i = 0; i < report_.issues.size(); i++)
    {
      issues[i] = issueToJS(env, report_.issues[i]);
    }
    result.Set("issues", issues);

    result.Set("structure", structureToJS(env, report_.structure));
    result.Set("counts", countsToJS(env, report_.counts));

    Napi::Array subprograms = Napi::Array::New(env, report_.root.subprograms.size());
    for (size_t i = 0; i < report_.root.subprograms.size(); i++)
    {
      subprograms[i] = subprogramToJS(env, report_.root.subprograms[i]);
    }
    result.Set("subprograms", subprograms);

    Napi::Array files = Napi::Array::New(env, report_.files.size());
    for (size_t i = 0; i < report_.files.size(); i++)
    {
      files[i] = Napi::String::New(env, report_.files[i]);
    }
    result.Set("files", files);

    result.Set("errorCount", Napi::Number::New(env, static_cast<double>(report_.errorCount)));
    result.Set("warningCount", Napi::Number::New(env, static_cast<double>(report_.warningCount)));
    result.Set("passed", Napi::Boolean::New(env, report_.passed));
    result.Set("status", Napi::String::New(env, report_.passed ? "PASS" : "FAIL"));

    return result;
  }

} // namespace GCodeCheck
