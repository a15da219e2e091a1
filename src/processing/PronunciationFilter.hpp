#pragma once

#include "ITextStage.hpp"

namespace processing
{

/**
 * @brief Keeps only characters that influence pronunciation, lower-cased
 *
 * Letters, digits, hyphens, apostrophes and spaces survive. Removed characters map to an empty
 * span anchored after the last kept character before them.
 */
class PronunciationFilter : public ITextStage
{
public:
    [[nodiscard]] const char* name() const override { return "keep_pronounced_only"; }

    void run(const std::string& text, const ChunkSink& emit) const override;
};

} // namespace processing
