#pragma once

#include "ITextStage.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace processing
{

/**
 * @brief Spells out numerals in English text, one whitespace-delimited word at a time
 *
 * The text is split into words and whitespace runs. An ordered battery of rules rewrites whole
 * words: thousands separators, years, abbreviated currency amounts ("$5B"), pounds, yen, euros,
 * units of measure, dollars, "#" numbers, decimals, times of day, ordinals and finally any
 * remaining digit run. Each word is emitted with a map spreading its original characters evenly
 * over its rewritten form.
 */
class NumberExpander : public ITextStage
{
public:
    // A word (or whitespace run) and the number of input code points it stands for
    struct Word
    {
        std::string text;
        std::size_t source_len = 0;
    };

    [[nodiscard]] const char* name() const override { return "normalize_numbers"; }

    void run(const std::string& text, const ChunkSink& emit) const override;

    // Splits text into words and applies every rule in order
    [[nodiscard]] static std::vector<Word> expandWords(const std::string& text);
};

} // namespace processing
