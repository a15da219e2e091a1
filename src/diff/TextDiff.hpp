#pragma once

#include "IAligner.hpp"
#include "mapping/PositionMap.hpp"
#include "processing/TextProcessingTypes.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace diff
{

// A stretch of reference and compared text, matching in pronunciation or not
struct DiffRegion
{
    std::string reference_text;
    std::string compared_text;
    bool pronunciation_match = true;

    bool operator==(const DiffRegion& other) const = default;
};

using DiffRegions = std::vector<DiffRegion>;

/**
 * @brief Aligns two normalized texts word by word and maps the result back onto the raw texts
 *
 * Regions alternate between matching and mismatching. Concatenating the reference (resp.
 * compared) texts of the returned regions reproduces the reference (resp. compared) input.
 */
class DiffProjector
{
public:
    explicit DiffProjector(const IAligner& aligner);

    /**
     * @brief Regions over the clean texts
     *
     * Texts are split on single spaces. The space separating two words travels with the word
     * after it and counts as matching, so spacing alone never makes a region mismatch.
     */
    [[nodiscard]] DiffRegions alignClean(const std::string& clean_reference, const std::string& clean_compared) const;

    /**
     * @brief Moves clean-space regions onto the raw texts
     *
     * Each region ends where the clean-to-raw map sends its end, never before the previous region.
     * The last region extends to the end of the raw text so characters erased by normalization
     * (trailing punctuation) are kept.
     *
     * @throws mapping::DimensionMismatchError if a map does not fit its texts
     */
    [[nodiscard]] DiffRegions project(const DiffRegions& clean_regions, const std::string& raw_reference,
                                      const mapping::PositionMap& clean_to_raw_reference,
                                      const std::string& raw_compared,
                                      const mapping::PositionMap& clean_to_raw_compared) const;

    // alignClean() then project(), from the normalization of each raw text
    [[nodiscard]] DiffRegions diff(const std::string& raw_reference, const text_processing::MappedText& reference,
                                   const std::string& raw_compared,
                                   const text_processing::MappedText& compared) const;

private:
    const IAligner& aligner_;
};

struct TextDiffOptions
{
    bool fault_tolerant = false;
    const IAligner* aligner = nullptr; // NeedlemanWunschAligner when null
};

/**
 * @brief Normalizes, aligns and projects each (reference, compared) pair
 *
 * @throws std::invalid_argument if the lists differ in length
 * @throws processing::InvalidLanguageTagError, processing::ConsistencyError, mapping::PositionMapError
 */
[[nodiscard]] std::vector<DiffRegions> text_diff(const std::vector<std::string>& reference_texts,
                                                 const std::vector<std::string>& compared_texts,
                                                 const std::string& lang_tag, const TextDiffOptions& options = {});

// Single pair
[[nodiscard]] DiffRegions text_diff(const std::string& reference_text, const std::string& compared_text,
                                    const std::string& lang_tag, const TextDiffOptions& options = {});

/**
 * @brief Matching regions verbatim, mismatches as "(compared|reference)"
 *
 * With colors the compared text is red and the reference text green (ANSI escapes).
 */
[[nodiscard]] std::string render_text_diff(const DiffRegions& regions, bool with_colors = true);

std::ostream& operator<<(std::ostream& os, const DiffRegion& region);

} // namespace diff
