#include <catch2/catch_test_macros.hpp>
#include "processing/Diagnostics.hpp"
#include "processing/NormalizationPipeline.hpp"
#include "processing/ProcessingErrors.hpp"
#include "processing/TextUtils.hpp"
#include "processing/WhitespaceCollapser.hpp"
#include "utils/ErrorReporter.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using mapping::PositionMap;
using processing::ITextStage;
using processing::NormalizationPipeline;

namespace
{

// Doubles every character but claims an identity map
class BrokenMapStage : public ITextStage
{
public:
    const char* name() const override { return "broken_map"; }

    void run(const std::string& text, const ChunkSink& emit) const override
    {
        emit(text + text, PositionMap::identity(processing::codepointLength(text)));
    }
};

class ThrowingStage : public ITextStage
{
public:
    const char* name() const override { return "throwing"; }

    void run(const std::string&, const ChunkSink&) const override { throw std::runtime_error("stage exploded"); }
};

// Emits one chunk per character, upper-cased ASCII
class UpperCaseStage : public ITextStage
{
public:
    const char* name() const override { return "upper_case"; }

    void run(const std::string& text, const ChunkSink& emit) const override
    {
        for (char c : text)
        {
            const char upper = (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
            emit(std::string(1, upper), PositionMap::identity(1));
        }
    }
};

template <typename... Stages>
NormalizationPipeline makePipeline(bool fault_tolerant)
{
    std::vector<std::unique_ptr<ITextStage>> stages;
    (stages.push_back(std::make_unique<Stages>()), ...);
    return NormalizationPipeline(std::move(stages), fault_tolerant);
}

} // namespace

TEST_CASE("NormalizationPipeline - standard stage order", "[pipeline]")
{
    SECTION("English")
    {
        const auto pipeline = NormalizationPipeline::forLanguage("en-US");
        REQUIRE(pipeline.stageNames() ==
                std::vector<std::string>{ "standardize_characters", "collapse_whitespace", "expand_abbreviations",
                                          "normalize_numbers", "keep_pronounced_only", "collapse_whitespace" });
        REQUIRE_FALSE(pipeline.faultTolerant());
    }

    SECTION("other languages")
    {
        const auto pipeline = NormalizationPipeline::forLanguage("de_DE", true);
        REQUIRE(pipeline.stageNames() == std::vector<std::string>{ "standardize_characters", "collapse_whitespace",
                                                                   "keep_pronounced_only", "collapse_whitespace" });
        REQUIRE(pipeline.faultTolerant());
    }

    SECTION("invalid tag")
    {
        REQUIRE_THROWS_AS(NormalizationPipeline::forLanguage("1x"), processing::InvalidLanguageTagError);
    }
}

TEST_CASE("NormalizationPipeline - chunked stages are joined", "[pipeline]")
{
    const auto pipeline = makePipeline<UpperCaseStage, processing::WhitespaceCollapser>(false);
    const auto out = pipeline.process("ab  c");
    REQUIRE(out.text == "AB C");
    REQUIRE(out.map == PositionMap::identity(2) + PositionMap::lerp(2, 1) + PositionMap::identity(1));
}

TEST_CASE("NormalizationPipeline - no stages gives identity", "[pipeline]")
{
    const NormalizationPipeline pipeline({}, false);
    const auto out = pipeline.process("abc");
    REQUIRE(out.text == "abc");
    REQUIRE(out.map == PositionMap::identity(3));
}

TEST_CASE("NormalizationPipeline - inconsistent map in strict mode", "[pipeline][errors]")
{
    const auto pipeline = makePipeline<BrokenMapStage>(false);
    REQUIRE_THROWS_AS(pipeline.process("abc"), processing::ConsistencyError);
}

TEST_CASE("NormalizationPipeline - inconsistent map is replaced when fault tolerant", "[pipeline][errors]")
{
    const auto pipeline = makePipeline<BrokenMapStage, UpperCaseStage>(true);
    const auto out = pipeline.process("abc");
    REQUIRE(out.text == "ABCABC");
    REQUIRE(out.map == PositionMap::lerp(3, 6));

    const auto reports = utils::ErrorReporter::GetPendingErrors();
    REQUIRE(reports.size() == 1);
    REQUIRE(reports.front().category == utils::ErrorCategory::Normalization);
    REQUIRE(reports.front().severity == utils::ErrorSeverity::Warning);
}

TEST_CASE("NormalizationPipeline - throwing stage", "[pipeline][errors]")
{
    SECTION("strict mode propagates the exception")
    {
        const auto pipeline = makePipeline<UpperCaseStage, ThrowingStage>(false);
        REQUIRE_THROWS_AS(pipeline.process("abc"), std::runtime_error);
    }

    SECTION("fault tolerant mode skips the stage")
    {
        const auto pipeline = makePipeline<ThrowingStage, UpperCaseStage>(true);
        const auto out = pipeline.process("abc");
        REQUIRE(out.text == "ABC");
        REQUIRE(out.map == PositionMap::identity(3));
        REQUIRE(utils::ErrorReporter::HasPendingErrors());
        REQUIRE(utils::ErrorReporter::GetLastError().technical_details == "stage exploded");
    }
}

TEST_CASE("NormalizationPipeline - map dimensions follow the text", "[pipeline]")
{
    const auto pipeline = NormalizationPipeline::forLanguage("en-us");
    for (const std::string raw : { "Hello, World!", "  leading and trailing  ", "Dr. Who met 2 Daleks at 9:05pm.",
                                   "na\xC3\xAFve caf\xC3\xA9 \xE2\x84\x96 5", "\xEF\xBC\xA8\xEF\xBD\x89" })
    {
        INFO(raw);
        const auto out = pipeline.process(raw);
        REQUIRE(out.map.sourceLength() == processing::codepointLength(raw));
        REQUIRE(out.map.targetLength() == processing::codepointLength(out.text));
    }
}

TEST_CASE("Diagnostics - previews are single-line and bounded", "[pipeline][diagnostics]")
{
    using processing::Diagnostics;

    REQUIRE(Diagnostics::Preview("a\tb\nc") == "\"a\\tb\\nc\"");
    REQUIRE(Diagnostics::Preview(std::string("x\x01y")) == "\"x?y\"");

    Diagnostics::SetMaxPreview(3);
    REQUIRE(Diagnostics::Preview("abcdef") == "\"abc\"... (6 bytes)");

    Diagnostics::SetMaxPreview(0);
    REQUIRE(Diagnostics::MaxPreview() == 1);
}

TEST_CASE("Diagnostics - previews cut on a character boundary", "[pipeline][diagnostics]")
{
    using processing::Diagnostics;

    // "caf" + U+00E9 + "s": the limit lands inside the two-byte sequence
    const std::string text = "caf\xC3\xA9s";
    Diagnostics::SetMaxPreview(4);
    REQUIRE(Diagnostics::Preview(text) == "\"caf\"... (6 bytes)");

    Diagnostics::SetMaxPreview(5);
    REQUIRE(Diagnostics::Preview(text) == "\"caf\xC3\xA9\"... (6 bytes)");

    // Three-byte U+3053 twice, cut after four bytes
    Diagnostics::SetMaxPreview(4);
    REQUIRE(Diagnostics::Preview("\xE3\x81\x93\xE3\x82\x93") == "\"\xE3\x81\x93\"... (6 bytes)");
}

TEST_CASE("Diagnostics - verbose tracing does not change results", "[pipeline][diagnostics]")
{
    const auto pipeline = NormalizationPipeline::forLanguage("en-us");
    const auto quiet = pipeline.process("Mr. Smith owes $5.");

    processing::Diagnostics::SetVerbose(true);
    const auto traced = pipeline.process("Mr. Smith owes $5.");

    REQUIRE(traced.text == quiet.text);
    REQUIRE(traced.map == quiet.map);
    REQUIRE(traced.text == "mister smith owes five dollars");
}
