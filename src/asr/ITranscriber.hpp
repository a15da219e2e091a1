#pragma once

#include <optional>
#include <string>
#include <vector>

namespace asr
{

// Mono PCM audio
struct AudioClip
{
    std::vector<float> samples;
    int sample_rate = 16000;
};

struct TranscriptionResult
{
    std::vector<std::string> texts; // one per input clip, same order
    std::string language;           // requested language, or the one detected on the first clip
};

// Configuration a speech recognizer is built from. Instances are cached per distinct value.
struct TranscriberConfig
{
    std::string model = "base";
    std::string device = "cpu";
    int accuracy_mode = 2; // 1 (fastest) to 5 (most accurate)

    auto operator<=>(const TranscriberConfig&) const = default;
};

/**
 * @brief Speech-to-text backend
 *
 * Treated as an opaque, possibly slow oracle. Implementations report failures by throwing; callers
 * let those exceptions propagate.
 */
class ITranscriber
{
public:
    virtual ~ITranscriber() = default;

    // language: IETF tag of the audio if known, std::nullopt to let the backend detect it
    [[nodiscard]] virtual TranscriptionResult transcribe(const std::vector<AudioClip>& clips,
                                                         const std::optional<std::string>& language) = 0;
};

} // namespace asr
