#include <catch2/catch_test_macros.hpp>
#include "asr/TranscriberRegistry.hpp"
#include "diff/TranscriptionDiff.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using asr::AudioClip;
using asr::ITranscriber;
using asr::TranscriptionResult;
using diff::DiffRegions;

namespace
{

// Replays canned transcripts and remembers what it was asked
class ScriptedTranscriber : public ITranscriber
{
public:
    ScriptedTranscriber(std::vector<std::string> texts, std::string language)
        : texts_(std::move(texts))
        , language_(std::move(language))
    {
    }

    TranscriptionResult transcribe(const std::vector<AudioClip>& clips,
                                   const std::optional<std::string>& language) override
    {
        ++calls;
        last_clip_count = clips.size();
        last_language = language;
        return { texts_, language.value_or(language_) };
    }

    int calls = 0;
    std::size_t last_clip_count = 0;
    std::optional<std::string> last_language;

private:
    std::vector<std::string> texts_;
    std::string language_;
};

class FailingTranscriber : public ITranscriber
{
public:
    TranscriptionResult transcribe(const std::vector<AudioClip>&, const std::optional<std::string>&) override
    {
        throw std::runtime_error("model not loaded");
    }
};

AudioClip silence() { return { std::vector<float>(1600, 0.0f), 16000 }; }

} // namespace

TEST_CASE("transcriptionDiff - diffs each clip against its text", "[transcription]")
{
    ScriptedTranscriber transcriber({ "the cats sat", "hello world" }, "en");
    const auto diffs = diff::transcriptionDiff(std::vector<std::string>{ "the cat sat", "Hello, world!" },
                                               std::vector<AudioClip>{ silence(), silence() }, transcriber);

    REQUIRE(transcriber.calls == 1);
    REQUIRE(transcriber.last_clip_count == 2);
    REQUIRE_FALSE(transcriber.last_language.has_value());
    REQUIRE(diffs.size() == 2);
    REQUIRE(diffs[0] == DiffRegions{ { "the ", "the ", true }, { "cat", "cats", false }, { " sat", " sat", true } });
    REQUIRE(diffs[1] == DiffRegions{ { "Hello, world!", "hello world", true } });
}

TEST_CASE("transcriptionDiff - language selects the normalization", "[transcription]")
{
    SECTION("detected language is used when none is given")
    {
        ScriptedTranscriber transcriber({ "doctor who" }, "fr");
        const auto regions = diff::transcriptionDiff("Dr. Who", silence(), transcriber);
        REQUIRE(regions.front().pronunciation_match == false);
    }

    SECTION("requested language is passed through")
    {
        ScriptedTranscriber transcriber({ "doctor who" }, "fr");
        const auto regions = diff::transcriptionDiff("Dr. Who", silence(), transcriber, std::string("en-us"));
        REQUIRE(transcriber.last_language == std::optional<std::string>("en-us"));
        REQUIRE(regions == DiffRegions{ { "Dr. Who", "doctor who", true } });
    }
}

TEST_CASE("transcriptionDiff - argument and transcriber errors", "[transcription]")
{
    ScriptedTranscriber transcriber({ "a", "b" }, "en");
    const std::vector<std::string> one_text{ "a" };
    REQUIRE_THROWS_AS(diff::transcriptionDiff(one_text, std::vector<AudioClip>{ silence(), silence() }, transcriber),
                      std::invalid_argument);
    // Two transcripts come back for a single clip
    REQUIRE_THROWS_AS(diff::transcriptionDiff(one_text, std::vector<AudioClip>{ silence() }, transcriber),
                      std::invalid_argument);

    FailingTranscriber failing;
    REQUIRE_THROWS_AS(diff::transcriptionDiff("a", silence(), failing), std::runtime_error);
}

TEST_CASE("TranscriberRegistry - builds each configuration once", "[transcription][registry]")
{
    std::atomic<int> builds{ 0 };
    asr::TranscriberRegistry registry(
        [&](const asr::TranscriberConfig& config) -> std::unique_ptr<ITranscriber>
        {
            ++builds;
            return std::make_unique<ScriptedTranscriber>(std::vector<std::string>{ config.model }, "en");
        });

    const asr::TranscriberConfig base;
    asr::TranscriberConfig large;
    large.model = "large";

    REQUIRE_FALSE(registry.contains(base));
    ITranscriber& first = registry.get(base);
    ITranscriber& again = registry.get(base);
    REQUIRE(&first == &again);
    REQUIRE(registry.contains(base));
    REQUIRE_FALSE(registry.contains(large));

    ITranscriber& other = registry.get(large);
    REQUIRE(&other != &first);
    REQUIRE(builds == 2);
}

TEST_CASE("TranscriberRegistry - concurrent requests share one instance", "[transcription][registry]")
{
    std::atomic<int> builds{ 0 };
    asr::TranscriberRegistry registry(
        [&](const asr::TranscriberConfig&) -> std::unique_ptr<ITranscriber>
        {
            ++builds;
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            return std::make_unique<FailingTranscriber>();
        });

    std::vector<ITranscriber*> seen(8, nullptr);
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < seen.size(); ++i)
        threads.emplace_back([&, i]() { seen[i] = &registry.get(asr::TranscriberConfig{}); });
    for (auto& thread : threads)
        thread.join();

    REQUIRE(builds == 1);
    for (auto* transcriber : seen)
        REQUIRE(transcriber == seen.front());
}

TEST_CASE("TranscriberRegistry - failed construction is retried", "[transcription][registry]")
{
    int attempts = 0;
    asr::TranscriberRegistry registry(
        [&](const asr::TranscriberConfig&) -> std::unique_ptr<ITranscriber>
        {
            if (++attempts == 1)
                return nullptr;
            return std::make_unique<FailingTranscriber>();
        });

    REQUIRE_THROWS_AS(registry.get({}), std::runtime_error);
    REQUIRE_FALSE(registry.contains({}));
    REQUIRE_NOTHROW(registry.get({}));
    REQUIRE(attempts == 2);
}
