#pragma once

#include "TextDiff.hpp"
#include "asr/ITranscriber.hpp"

#include <optional>
#include <string>
#include <vector>

namespace diff
{

/**
 * @brief Transcribes each clip and diffs it against its reference text
 *
 * lang_tag is passed to the transcriber and used for normalization. Without one, the language
 * the transcriber detected is used.
 *
 * @throws std::invalid_argument if texts and clips differ in count or the transcriber returns a
 *         different number of texts. Transcriber exceptions propagate unchanged.
 */
[[nodiscard]] std::vector<DiffRegions> transcriptionDiff(const std::vector<std::string>& texts,
                                                         const std::vector<asr::AudioClip>& clips,
                                                         asr::ITranscriber& transcriber,
                                                         const std::optional<std::string>& lang_tag = std::nullopt,
                                                         const TextDiffOptions& options = {});

[[nodiscard]] DiffRegions transcriptionDiff(const std::string& text, const asr::AudioClip& clip,
                                            asr::ITranscriber& transcriber,
                                            const std::optional<std::string>& lang_tag = std::nullopt,
                                            const TextDiffOptions& options = {});

} // namespace diff
