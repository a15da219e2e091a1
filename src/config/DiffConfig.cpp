#include "DiffConfig.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <sstream>

namespace config
{

namespace
{

template <typename T>
std::optional<T> readValue(const toml::table& root, const char* section, const char* key,
                           std::vector<std::string>& problems)
{
    auto node = root[section][key];
    if (!node)
        return std::nullopt;

    auto value = node.template value<T>();
    if (!value)
        problems.push_back(std::string(section) + "." + key + " has the wrong type");
    return value;
}

std::string describe(const toml::parse_error& pe)
{
    std::ostringstream oss;
    if (pe.source().begin.line > 0)
        oss << "Error at line " << pe.source().begin.line << ": ";
    oss << pe.description();
    return oss.str();
}

} // anonymous namespace

DiffConfig DiffConfig::loadFile(const std::string& path)
{
    DiffConfig cfg;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        PLOG_DEBUG << "No configuration at " << path << ", using defaults";
        return cfg;
    }

    try
    {
        cfg.applyTable(toml::parse_file(path));
    }
    catch (const toml::parse_error& pe)
    {
        cfg.problems_.push_back(describe(pe));
    }

    cfg.reportProblems(path);
    return cfg;
}

DiffConfig DiffConfig::loadString(std::string_view document, std::string_view source_name)
{
    DiffConfig cfg;
    try
    {
        cfg.applyTable(toml::parse(document, source_name));
    }
    catch (const toml::parse_error& pe)
    {
        cfg.problems_.push_back(describe(pe));
    }

    cfg.reportProblems(source_name);
    return cfg;
}

void DiffConfig::applyTable(const toml::table& root)
{
    if (auto v = readValue<std::string>(root, "normalization", "language", problems_))
        normalization.language = *v;
    if (auto v = readValue<bool>(root, "normalization", "fault_tolerant", problems_))
        normalization.fault_tolerant = *v;

    if (auto v = readValue<bool>(root, "render", "colors", problems_))
        render.colors = *v;

    if (auto v = readValue<bool>(root, "diagnostics", "verbose", problems_))
        diagnostics.verbose = *v;
    if (auto v = readValue<std::int64_t>(root, "diagnostics", "max_preview", problems_))
    {
        if (*v > 0)
            diagnostics.max_preview = static_cast<std::size_t>(*v);
        else
            problems_.push_back("diagnostics.max_preview must be positive");
    }

    if (auto v = readValue<std::int64_t>(root, "logging", "level", problems_))
    {
        if (*v >= 0 && *v <= 6)
            logging.level = static_cast<int>(*v);
        else
            problems_.push_back("logging.level must be between 0 and 6");
    }
    if (auto v = readValue<std::string>(root, "logging", "file", problems_))
        logging.file = *v;
    if (auto v = readValue<bool>(root, "logging", "append", problems_))
        logging.append = *v;
    if (auto v = readValue<bool>(root, "logging", "console", problems_))
        logging.console = *v;
}

void DiffConfig::reportProblems(std::string_view source_name) const
{
    if (problems_.empty())
        return;

    std::string details;
    for (const auto& problem : problems_)
        details += problem + "\n";
    details += "File: " + std::string(source_name);

    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                        "Configuration file has errors. Using defaults for invalid entries.", details);
}

} // namespace config
