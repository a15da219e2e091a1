#include "TranscriptionDiff.hpp"

#include <plog/Log.h>
#include <stdexcept>

namespace diff
{

std::vector<DiffRegions> transcriptionDiff(const std::vector<std::string>& texts,
                                           const std::vector<asr::AudioClip>& clips, asr::ITranscriber& transcriber,
                                           const std::optional<std::string>& lang_tag, const TextDiffOptions& options)
{
    if (texts.size() != clips.size())
    {
        throw std::invalid_argument("Got " + std::to_string(texts.size()) + " texts for " +
                                    std::to_string(clips.size()) + " audio clips");
    }

    auto transcription = transcriber.transcribe(clips, lang_tag);
    if (transcription.texts.size() != clips.size())
    {
        throw std::invalid_argument("Transcriber returned " + std::to_string(transcription.texts.size()) +
                                    " texts for " + std::to_string(clips.size()) + " audio clips");
    }

    const std::string language = lang_tag.value_or(transcription.language);
    PLOG_DEBUG << "Diffing " << texts.size() << " transcription(s) as '" << language << "'";
    return text_diff(texts, transcription.texts, language, options);
}

DiffRegions transcriptionDiff(const std::string& text, const asr::AudioClip& clip, asr::ITranscriber& transcriber,
                              const std::optional<std::string>& lang_tag, const TextDiffOptions& options)
{
    return transcriptionDiff(std::vector<std::string>{ text }, std::vector<asr::AudioClip>{ clip }, transcriber,
                             lang_tag, options)
        .front();
}

} // namespace diff
