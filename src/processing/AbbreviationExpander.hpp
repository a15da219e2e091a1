#pragma once

#include "ITextStage.hpp"

#include <regex>
#include <string>
#include <vector>

namespace processing
{

/**
 * @brief Spells out common English abbreviations ("dr." -> "doctor")
 *
 * Matches are searched in the input text, case-insensitively and anchored on a word boundary.
 * Each replacement spreads the matched characters over the expansion; the rest of the text stays
 * identity-mapped.
 */
class AbbreviationExpander : public ITextStage
{
public:
    struct Abbreviation
    {
        std::regex pattern;
        std::string expansion;
    };

    AbbreviationExpander();

    [[nodiscard]] const char* name() const override { return "expand_abbreviations"; }

    void run(const std::string& text, const ChunkSink& emit) const override;

    [[nodiscard]] const std::vector<Abbreviation>& abbreviations() const noexcept { return abbreviations_; }

private:
    std::vector<Abbreviation> abbreviations_;
};

} // namespace processing
