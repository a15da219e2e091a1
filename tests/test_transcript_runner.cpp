#include <catch2/catch_test_macros.hpp>
#include "app/TranscriptRunner.hpp"
#include "diff/NeedlemanWunschAligner.hpp"
#include "diff/TextDiff.hpp"
#include "processing/ITextStage.hpp"
#include "processing/NormalizationPipeline.hpp"
#include "processing/TextUtils.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using processing::NormalizationPipeline;

namespace
{

// Passes text through unchanged, except that it refuses any line mentioning "boom"
class FragileStage : public processing::ITextStage
{
public:
    const char* name() const override { return "fragile"; }

    void run(const std::string& text, const ChunkSink& emit) const override
    {
        if (text.find("boom") != std::string::npos)
            throw std::runtime_error("cannot normalize " + text);
        emit(text, mapping::PositionMap::identity(processing::codepointLength(text)));
    }
};

NormalizationPipeline fragilePipeline()
{
    std::vector<std::unique_ptr<processing::ITextStage>> stages;
    stages.push_back(std::make_unique<FragileStage>());
    return NormalizationPipeline(std::move(stages), false);
}

} // namespace

TEST_CASE("TranscriptRunner - diff prints one line per pair", "[cli]")
{
    const auto pipeline = NormalizationPipeline::forLanguage("en-us");
    const diff::NeedlemanWunschAligner aligner;
    const diff::DiffProjector projector(aligner);

    std::ostringstream out;
    const int status = app::diffLines({ "the cat sat.", "Dr. Smith is here" }, { "the cats sat", "Doctor Smith is there" },
                                      pipeline, projector, false, out);

    REQUIRE(status == app::kExitOk);
    REQUIRE(out.str() == "the (cats|cat) sat.\nDr. Smith is (there|here)\n");
    REQUIRE_FALSE(utils::ErrorReporter::HasPendingErrors());
}

TEST_CASE("TranscriptRunner - a failed pair leaves an empty line", "[cli]")
{
    const auto pipeline = fragilePipeline();
    const diff::NeedlemanWunschAligner aligner;
    const diff::DiffProjector projector(aligner);

    std::ostringstream out;
    const int status = app::diffLines({ "one two", "boom", "three" }, { "one too", "boom", "three" }, pipeline,
                                      projector, false, out);

    REQUIRE(status == app::kExitFailure);
    REQUIRE(out.str() == "one (too|two)\n\nthree\n");

    const auto reports = utils::ErrorReporter::GetPendingErrors();
    REQUIRE(reports.size() == 1);
    REQUIRE(reports.front().category == utils::ErrorCategory::Alignment);
    REQUIRE(reports.front().user_message == "Failed to diff line 2");
}

TEST_CASE("TranscriptRunner - differing line counts are a usage error", "[cli]")
{
    const auto pipeline = NormalizationPipeline::forLanguage("en-us");
    const diff::NeedlemanWunschAligner aligner;
    const diff::DiffProjector projector(aligner);

    std::ostringstream out;
    const int status = app::diffLines({ "a", "b" }, { "a" }, pipeline, projector, false, out);

    REQUIRE(status == app::kExitUsage);
    REQUIRE(out.str().empty());
    REQUIRE(utils::ErrorReporter::GetLastError().category == utils::ErrorCategory::Initialization);
}

TEST_CASE("TranscriptRunner - normalize prints the clean text of each line", "[cli]")
{
    SECTION("all lines succeed")
    {
        std::ostringstream out;
        const int status =
            app::normalizeLines({ "Mr. Smith owes $5.", "", ". . ." }, NormalizationPipeline::forLanguage("en-us"), out);
        REQUIRE(status == app::kExitOk);
        REQUIRE(out.str() == "mister smith owes five dollars\n\n \n");
    }

    SECTION("a failed line stays empty")
    {
        std::ostringstream out;
        const int status = app::normalizeLines({ "boom", "fine" }, fragilePipeline(), out);
        REQUIRE(status == app::kExitFailure);
        REQUIRE(out.str() == "\nfine\n");
        REQUIRE(utils::ErrorReporter::GetLastError().category == utils::ErrorCategory::Normalization);
    }
}

TEST_CASE("TranscriptRunner - readLines strips carriage returns", "[cli]")
{
    const auto path = std::filesystem::temp_directory_path() / "transcript_diff_test_lines.txt";
    {
        std::ofstream ofs(path, std::ios::binary);
        ofs << "first\r\nsecond\n\nlast";
    }

    std::vector<std::string> lines;
    REQUIRE(app::readLines(path.string(), lines));
    REQUIRE(lines == std::vector<std::string>{ "first", "second", "", "last" });
    std::filesystem::remove(path);
}

TEST_CASE("TranscriptRunner - readLines reports a missing file", "[cli]")
{
    std::vector<std::string> lines;
    REQUIRE_FALSE(app::readLines("/nonexistent/transcript_diff/missing.txt", lines));
    REQUIRE(lines.empty());
    REQUIRE(utils::ErrorReporter::GetLastError().category == utils::ErrorCategory::Io);
}

TEST_CASE("LogManager - secondary logs sit beside the main log", "[cli]")
{
    const std::filesystem::path profiling =
        utils::LogManager::SiblingLogPath("var/log/transcript_diff.log", "profiling.log");
    REQUIRE(profiling == std::filesystem::path("var/log/profiling.log"));
    REQUIRE(utils::LogManager::SiblingLogPath("transcript_diff.log", "diagnostics.log") == "diagnostics.log");
}
