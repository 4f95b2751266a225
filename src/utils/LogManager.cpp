#include "LogManager.hpp"
#include "Diagnostics.hpp"
#include "ErrorReporter.hpp"

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>

#include <filesystem>
#include <fstream>

namespace utils
{

bool LogManager::s_initialized = false;
bool LogManager::s_append_logs = true;
plog::Severity LogManager::s_default_level = plog::info;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

namespace
{

using FileAppender = plog::RollingFileAppender<plog::TxtFormatter>;
using ConsoleAppender = plog::ConsoleAppender<plog::TxtFormatter>;

// A fresh run starts from an empty file unless appending was asked for
void truncateLog(const std::string& filepath)
{
    std::ofstream out(filepath, std::ios::trunc);
}

} // namespace

bool LogManager::Initialize(bool append_logs, plog::Severity default_level)
{
    if (!s_initialized)
    {
        s_append_logs = append_logs;
        s_default_level = default_level;
        s_initialized = true;
    }
    return true;
}

template<int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Configuration, "Logging used before initialization",
                                   "logger '" + config.name + "'");
        return false;
    }

    try
    {
        PrepareLogDirectory(config.filepath);
        if (!config.append_override.value_or(s_append_logs))
            truncateLog(config.filepath);

        auto file = std::make_unique<FileAppender>(config.filepath.c_str(), config.max_file_size,
                                                   config.backup_count);
        auto& logger = plog::init<InstanceId>(config.level_override.value_or(s_default_level), file.get());
        s_appenders.push_back(std::move(file));

        if (config.add_console_appender)
        {
            auto console = std::make_unique<ConsoleAppender>();
            logger.addAppender(console.get());
            s_appenders.push_back(std::move(console));
        }
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Configuration, "Cannot open log file " + config.filepath,
                                   ex.what());
        return false;
    }
}

template<int InstanceId>
bool LogManager::ForwardToDefault(std::optional<plog::Severity> level_override)
{
    plog::Logger<0>* target = plog::get<0>();
    if (target == nullptr)
    {
        ErrorReporter::ReportError(ErrorCategory::Configuration, "No default logger to forward to",
                                   "instance " + std::to_string(InstanceId));
        return false;
    }

    plog::init<InstanceId>(level_override.value_or(s_default_level), target);
    return true;
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);
template bool LogManager::ForwardToDefault<Diagnostics::kLogInstance>(std::optional<plog::Severity>);

void LogManager::Shutdown()
{
    // Loggers keep raw pointers to the appenders; silence them first
    if (auto* engine = plog::get<Diagnostics::kLogInstance>())
        engine->setMaxSeverity(plog::none);
    if (auto* main = plog::get<0>())
        main->setMaxSeverity(plog::none);

    s_appenders.clear();
    s_initialized = false;
}

void LogManager::PrepareLogDirectory(const std::string& filepath)
{
    const auto dir = std::filesystem::path(filepath).parent_path();
    if (dir.empty())
        return;

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Cannot create log directory " + dir.string(),
                                     ec.message());
}

} // namespace utils
