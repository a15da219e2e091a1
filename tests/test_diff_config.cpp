#include <catch2/catch_test_macros.hpp>
#include "config/DiffConfig.hpp"
#include "utils/ErrorReporter.hpp"

#include <filesystem>
#include <fstream>

using config::DiffConfig;

TEST_CASE("DiffConfig - defaults", "[config]")
{
    const DiffConfig cfg;
    REQUIRE(cfg.normalization.language == "en-us");
    REQUIRE_FALSE(cfg.normalization.fault_tolerant);
    REQUIRE(cfg.render.colors);
    REQUIRE_FALSE(cfg.diagnostics.verbose);
    REQUIRE(cfg.diagnostics.max_preview == 160);
    REQUIRE(cfg.logging.level == 4);
    REQUIRE(cfg.logging.file == "logs/transcript_diff.log");
    REQUIRE(cfg.problems().empty());
}

TEST_CASE("DiffConfig - reads every section", "[config]")
{
    const auto cfg = DiffConfig::loadString(R"(
[normalization]
language = "fr-CA"
fault_tolerant = true

[render]
colors = false

[diagnostics]
verbose = true
max_preview = 40

[logging]
level = 6
file = "out/diff.log"
append = false
console = true

[unrelated]
key = 1
)");

    REQUIRE(cfg.problems().empty());
    REQUIRE(cfg.normalization.language == "fr-CA");
    REQUIRE(cfg.normalization.fault_tolerant);
    REQUIRE_FALSE(cfg.render.colors);
    REQUIRE(cfg.diagnostics.verbose);
    REQUIRE(cfg.diagnostics.max_preview == 40);
    REQUIRE(cfg.logging.level == 6);
    REQUIRE(cfg.logging.file == "out/diff.log");
    REQUIRE_FALSE(cfg.logging.append);
    REQUIRE(cfg.logging.console);
    REQUIRE_FALSE(utils::ErrorReporter::HasPendingErrors());
}

TEST_CASE("DiffConfig - invalid entries keep their defaults", "[config]")
{
    const auto cfg = DiffConfig::loadString(R"(
[render]
colors = "yes"

[diagnostics]
max_preview = -3

[logging]
level = 9
)");

    REQUIRE(cfg.render.colors);
    REQUIRE(cfg.diagnostics.max_preview == 160);
    REQUIRE(cfg.logging.level == 4);
    REQUIRE(cfg.problems().size() == 3);

    const auto report = utils::ErrorReporter::GetLastError();
    REQUIRE(report.category == utils::ErrorCategory::Configuration);
    REQUIRE(report.severity == utils::ErrorSeverity::Warning);
}

TEST_CASE("DiffConfig - syntax errors fall back to defaults", "[config]")
{
    const auto cfg = DiffConfig::loadString("[render\ncolors = false", "broken.toml");
    REQUIRE(cfg.render.colors);
    REQUIRE(cfg.problems().size() == 1);
    REQUIRE(utils::ErrorReporter::GetLastError().technical_details.find("broken.toml") != std::string::npos);
}

TEST_CASE("DiffConfig - files", "[config]")
{
    SECTION("missing file is silently ignored")
    {
        const auto cfg = DiffConfig::loadFile("does/not/exist/transcript_diff.toml");
        REQUIRE(cfg.problems().empty());
        REQUIRE(cfg.normalization.language == "en-us");
        REQUIRE_FALSE(utils::ErrorReporter::HasPendingErrors());
    }

    SECTION("existing file")
    {
        const auto path = std::filesystem::temp_directory_path() / "transcript_diff_test_config.toml";
        {
            std::ofstream out(path);
            out << "[normalization]\nlanguage = \"en-gb\"\n";
        }

        const auto cfg = DiffConfig::loadFile(path.string());
        std::filesystem::remove(path);

        REQUIRE(cfg.normalization.language == "en-gb");
        REQUIRE(cfg.problems().empty());
    }
}
