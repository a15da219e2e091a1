#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <toml++/toml.h>

namespace config
{

struct NormalizationSettings
{
    std::string language = "en-us";
    bool fault_tolerant = false;
};

struct RenderSettings
{
    bool colors = true;
};

struct DiagnosticsSettings
{
    bool verbose = false;
    std::size_t max_preview = 160;
};

struct LoggingSettings
{
    int level = 4; // plog::Severity, 4 = info
    std::string file = "logs/transcript_diff.log";
    bool append = true;
    bool console = false;
};

/**
 * @brief Settings of the transcript-diff tool, read from TOML
 *
 * [normalization] language, fault_tolerant
 * [render]        colors
 * [diagnostics]   verbose, max_preview
 * [logging]       level, file, append, console
 *
 * Unknown keys are ignored. A key of the wrong type or out of range keeps its default and is
 * listed in problems(); each load reports problems as a Configuration warning.
 */
class DiffConfig
{
public:
    NormalizationSettings normalization;
    RenderSettings render;
    DiagnosticsSettings diagnostics;
    LoggingSettings logging;

    // Missing file: defaults without a warning. Parse error: defaults plus a warning.
    [[nodiscard]] static DiffConfig loadFile(const std::string& path);

    [[nodiscard]] static DiffConfig loadString(std::string_view document, std::string_view source_name = "<string>");

    [[nodiscard]] const std::vector<std::string>& problems() const noexcept { return problems_; }

private:
    void applyTable(const toml::table& root);
    void reportProblems(std::string_view source_name) const;

    std::vector<std::string> problems_;
};

} // namespace config
