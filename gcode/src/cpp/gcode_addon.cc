/**
 * G-Code Check Addon - N-API Module Entry Point
 *
 * Exports the checkGCode function to JavaScript.
 */

#include <napi.h>
#include "check_worker.hh"
#include "analysis_types.hh"
#include "checker_config.hh"

namespace GCodeCheck
{

  namespace
  {

    bool readStringArray(Napi::Env env, Napi::Object options, const char *key,
                         std::vector<std::string> &out)
    {
      if (!options.Has(key))
        return true;

      Napi::Value value = options.Get(key);
      if (!value.IsArray())
      {
        Napi::TypeError::New(env, std::string(key) + " must be an array of strings")
            .ThrowAsJavaScriptException();
        return false;
      }

      Napi::Array arr = value.As<Napi::Array>();
      std::vector<std::string> items;
      for (uint32_t i = 0; i < arr.Length(); i++)
      {
        Napi::Value item = arr.Get(i);
        if (!item.IsString())
        {
          Napi::TypeError::New(env, std::string(key) + " must be an array of strings")
              .ThrowAsJavaScriptException();
          return false;
        }
        items.push_back(item.As<Napi::String>().Utf8Value());
      }
      out = std::move(items);
      return true;
    }

    bool readPositiveNumber(Napi::Env env, Napi::Object options, const char *key, double &out)
    {
      if (!options.Has(key))
        return true;

      Napi::Value value = options.Get(key);
      if (!value.IsNumber())
      {
        Napi::TypeError::New(env, std::string(key) + " must be a number")
            .ThrowAsJavaScriptException();
        return false;
      }

      double number = value.As<Napi::Number>().DoubleValue();
      if (!(number > 0))
      {
        Napi::RangeError::New(env, std::string(key) + " must be positive")
            .ThrowAsJavaScriptException();
        return false;
      }
      out = number;
      return true;
    }

    /**
     * Fill a CheckerConfig from the options object. Missing keys keep
     * their defaults. Returns false with a pending JS exception on bad input.
     */
    bool parseOptions(Napi::Env env, Napi::Object options, CheckerConfig &config)
    {
      if (!readPositiveNumber(env, options, "maxTravel", config.maxTravel))
        return false;
      if (!readPositiveNumber(env, options, "maxFeedRate", config.maxFeedRate))
        return false;

      if (options.Has("commentDelimiter"))
      {
        Napi::Value value = options.Get("commentDelimiter");
        if (!value.IsString())
        {
          Napi::TypeError::New(env, "commentDelimiter must be a string")
              .ThrowAsJavaScriptException();
          return false;
        }
        std::string delimiter = value.As<Napi::String>().Utf8Value();
        if (delimiter.size() != 1)
        {
          Napi::RangeError::New(env, "commentDelimiter must be a single character")
              .ThrowAsJavaScriptException();
          return false;
        }
        config.commentDelimiter = delimiter[0];
      }

      if (!readStringArray(env, options, "supportedExtensions", config.supportedExtensions))
        return false;
      if (!readStringArray(env, options, "candidatePrefixes", config.candidatePrefixes))
        return false;
      if (!readStringArray(env, options, "candidateExtensions", config.candidateExtensions))
        return false;
      if (!readStringArray(env, options, "supportedGCodes", config.supportedGCodes))
        return false;
      if (!readStringArray(env, options, "supportedMCodes", config.supportedMCodes))
        return false;

      if (options.Has("verbose"))
      {
        Napi::Value value = options.Get("verbose");
        if (!value.IsBoolean())
        {
          Napi::TypeError::New(env, "verbose must be a boolean")
              .ThrowAsJavaScriptException();
          return false;
        }
        config.verbose = value.As<Napi::Boolean>().Value();
      }

      return true;
    }

  } // namespace

  /**
   * checkGCode(filepath, options, progressCallback, callback)
   *
   * Asynchronously check a G-code file and the subprogram files it calls.
   *
   * @param filepath - Path to the main G-code file
   * @param options - Thresholds and naming conventions (may be empty)
   * @param progressCallback - Function called with progress updates
   * @param callback - Function called with (error, report) when complete
   */
  Napi::Value CheckGCode(const Napi::CallbackInfo &info)
  {
    Napi::Env env = info.Env();

    // Validate arguments
    if (info.Length() < 4)
    {
      Napi::TypeError::New(env, "Expected 4 arguments: filepath, options, progressCallback, callback")
          .ThrowAsJavaScriptException();
      return env.Undefined();
    }

    if (!info[0].IsString())
    {
      Napi::TypeError::New(env, "filepath must be a string")
          .ThrowAsJavaScriptException();
      return env.Undefined();
    }

    if (!info[1].IsObject())
    {
      Napi::TypeError::New(env, "options must be an object")
          .ThrowAsJavaScriptException();
      return env.Undefined();
    }

    if (!info[2].IsFunction())
    {
      Napi::TypeError::New(env, "progressCallback must be a function")
          .ThrowAsJavaScriptException();
      return env.Undefined();
    }

    if (!info[3].IsFunction())
    {
      Napi::TypeError::New(env, "callback must be a function")
          .ThrowAsJavaScriptException();
      return env.Undefined();
    }

    std::string filepath = info[0].As<Napi::String>().Utf8Value();
    CheckerConfig config;
    if (!parseOptions(env, info[1].As<Napi::Object>(), config))
    {
      return env.Undefined();
    }
    Napi::Function progressCallback = info[2].As<Napi::Function>();
    Napi::Function callback = info[3].As<Napi::Function>();

    // Create and queue async worker
    CheckWorker *worker = new CheckWorker(callback, progressCallback, filepath, config);
    worker->Queue();

    return env.Undefined();
  }

  /**
   * Module initialization
   */
  Napi::Object Init(Napi::Env env, Napi::Object exports)
  {
    exports.Set("checkGCode", Napi::Function::New(env, CheckGCode));

    // Export severity constants
    exports.Set("SEVERITY_ERROR", Napi::Number::New(env, static_cast<int>(Severity::ERROR)));
    exports.Set("SEVERITY_WARNING", Napi::Number::New(env, static_cast<int>(Severity::WARNING)));

    // Export defaults so callers can extend them
    CheckerConfig defaults;
    exports.Set("DEFAULT_MAX_TRAVEL", Napi::Number::New(env, defaults.maxTravel));
    exports.Set("DEFAULT_MAX_FEED_RATE", Napi::Number::New(env, defaults.maxFeedRate));

    return exports;
  }

  NODE_API_MODULE(gcode_check, Init)

} // namespace GCodeCheck
