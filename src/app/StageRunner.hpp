#pragma once

#include "../utils/Diagnostics.hpp"
#include "../utils/ErrorReporter.hpp"

#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <utility>

#include <plog/Log.h>

namespace lexanon::app
{

// Outcome of one front-end pipeline stage.
template<typename T>
struct StageResult
{
    T result;
    bool succeeded = true;
    std::optional<std::string> error;
    std::chrono::microseconds duration{ 0 };
    std::string stage_name;

    static StageResult success(T r, std::chrono::microseconds time, const std::string& name)
    {
        StageResult res;
        res.result = std::move(r);
        res.succeeded = true;
        res.duration = time;
        res.stage_name = name;
        return res;
    }

    static StageResult failure(const std::string& err, std::chrono::microseconds time, const std::string& name)
    {
        StageResult res;
        res.succeeded = false;
        res.error = err;
        res.duration = time;
        res.stage_name = name;
        return res;
    }
};

// Runs a stage (callable returning T) and turns exceptions into a failed
// StageResult reported under `category`.
template<typename T, typename Fn>
StageResult<T> run_stage(const std::string& stage_name, utils::ErrorCategory category, Fn&& fn)
{
    using namespace std::chrono;
    auto start = steady_clock::now();
    try
    {
        T res = fn();
        auto dur = duration_cast<microseconds>(steady_clock::now() - start);
        if (utils::Diagnostics::IsVerbose())
        {
            PLOG_INFO_(utils::Diagnostics::kLogInstance)
                << "Stage '" << stage_name << "' succeeded in " << dur.count() << "us";
        }
        return StageResult<T>::success(std::move(res), dur, stage_name);
    }
    catch (const std::exception& ex)
    {
        auto dur = duration_cast<microseconds>(steady_clock::now() - start);
        PLOG_ERROR_(utils::Diagnostics::kLogInstance)
            << "Stage '" << stage_name << "' failed in " << dur.count() << "us: " << ex.what();
        utils::ErrorReporter::ReportError(category, "Stage '" + stage_name + "' failed", ex.what());
        return StageResult<T>::failure(ex.what(), dur, stage_name);
    }
    catch (...)
    {
        auto dur = duration_cast<microseconds>(steady_clock::now() - start);
        PLOG_ERROR_(utils::Diagnostics::kLogInstance)
            << "Stage '" << stage_name << "' failed with unknown exception in " << dur.count() << "us";
        utils::ErrorReporter::ReportError(category, "Stage '" + stage_name + "' failed", "unknown exception");
        return StageResult<T>::failure("unknown exception", dur, stage_name);
    }
}

} // namespace lexanon::app
