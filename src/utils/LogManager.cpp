#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "Profile.hpp"
#include "../config/DiffConfig.hpp"
#include "../processing/Diagnostics.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

bool LogManager::s_initialized = false;
bool LogManager::s_append_logs = true;
plog::Severity LogManager::s_default_level = plog::info;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const config::LoggingSettings& settings)
{
    if (s_initialized)
        return true;

    s_append_logs = settings.append;
    if (settings.level >= plog::none && settings.level <= plog::verbose)
        s_default_level = static_cast<plog::Severity>(settings.level);

    if (!PrepareLogDirectory(settings.file))
        return false;

    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization,
                                   "LogManager not initialized before registering logger", config.name);
        return false;
    }

    try
    {
        PrepareLogDirectory(config.filepath);

        bool append = config.append_override.value_or(s_append_logs);
        if (!append)
        {
            std::ofstream(config.filepath, std::ios::trunc).close();
        }

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            config.filepath.c_str(), config.max_file_size, config.backup_count);

        plog::Severity level = config.level_override.value_or(s_default_level);

        plog::init<InstanceId>(level, file_appender.get());

        if (config.add_console_appender)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>(plog::streamStdErr);
            if (auto logger = plog::get<InstanceId>())
            {
                logger->addAppender(console_appender.get());
                s_appenders.push_back(std::move(console_appender));
            }
        }

        s_appenders.push_back(std::move(file_appender));
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to register logger: " + config.name,
                                   ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);
template bool LogManager::RegisterLogger<processing::Diagnostics::kLogInstance>(const LoggerConfig&);

#if TDIFF_PROFILING_LEVEL >= 1
template bool LogManager::RegisterLogger<profiling::kProfilingLogInstance>(const LoggerConfig&);
#endif

void LogManager::Shutdown()
{
    s_appenders.clear();
    s_initialized = false;
}

std::string LogManager::SiblingLogPath(const std::string& main_file, const std::string& file_name)
{
    return (std::filesystem::path(main_file).parent_path() / file_name).string();
}

bool LogManager::IsAppendMode() { return s_append_logs; }

plog::Severity LogManager::GetDefaultLogLevel() { return s_default_level; }

bool LogManager::PrepareLogDirectory(const std::string& filepath)
{
    const auto dir = std::filesystem::path(filepath).parent_path();
    if (dir.empty())
        return true;

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory",
                                     dir.string() + ": " + ec.message());
        return false;
    }
    return true;
}

} // namespace utils
