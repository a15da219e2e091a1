#pragma once

#include <string>
#include <optional>
#include <vector>
#include <memory>
#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace config
{
struct LoggingSettings;
}

namespace utils
{

// Owns the plog appenders of every logger instance the program registers
class LogManager
{
public:
    struct LoggerConfig
    {
        std::string name;
        std::string filepath;
        std::optional<bool> append_override;
        std::optional<plog::Severity> level_override;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t backup_count = 3;
        bool add_console_appender = false;
    };

    // Takes the default level and append mode from settings and creates the log directory
    static bool Initialize(const config::LoggingSettings& settings);

    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    static void Shutdown();

    // Path of a secondary log file placed in the same directory as main_file
    static std::string SiblingLogPath(const std::string& main_file, const std::string& file_name);

    static bool IsAppendMode();
    static plog::Severity GetDefaultLogLevel();

private:
    LogManager() = default;

    static bool PrepareLogDirectory(const std::string& filepath);

    static bool s_initialized;
    static bool s_append_logs;
    static plog::Severity s_default_level;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
