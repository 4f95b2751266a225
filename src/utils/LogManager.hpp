#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

// Owns the plog appenders for one run of the front end. Engine code only
// ever logs; it never touches appenders.
class LogManager
{
public:
    struct LoggerConfig
    {
        std::string name;
        std::string filepath;
        std::optional<bool> append_override;
        std::optional<plog::Severity> level_override;
        std::size_t max_file_size = 10 * 1024 * 1024;
        std::size_t backup_count = 3;
        bool add_console_appender = false;
    };

    static bool Initialize(bool append_logs, plog::Severity default_level);

    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    // Routes an additional plog instance into the default logger's appenders.
    template<int InstanceId>
    static bool ForwardToDefault(std::optional<plog::Severity> level_override = std::nullopt);

    static void Shutdown();

    /// Creates the parent directory of a log file; failures are reported,
    /// not thrown.
    static void PrepareLogDirectory(const std::string& filepath);

private:
    LogManager() = default;

    static bool s_initialized;
    static bool s_append_logs;
    static plog::Severity s_default_level;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
