#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace processing
{

// Language and optional territory of an IETF-style tag ("en-US" -> {"en", "US"})
struct LanguageTag
{
    std::string language;                 // lower-case ISO 639-1 code where one exists
    std::optional<std::string> territory; // upper-case region subtag

    [[nodiscard]] std::string toString() const;

    bool operator==(const LanguageTag& other) const = default;
};

/**
 * @brief Parses a language tag
 *
 * Accepts '-' or '_' separators in any case. Three-letter ISO 639-2 codes of common languages are
 * folded to their two-letter form ("eng" -> "en"). Script and variant subtags are skipped.
 *
 * @throws InvalidLanguageTagError if the primary subtag is not a 2-3 letter language code
 */
[[nodiscard]] LanguageTag resolveLanguageTag(const std::string& tag);

/**
 * @brief Indices of the available tags matching the requested one
 *
 * The language must always match. When the request names a territory and territory_match is set,
 * the territory must match as well. All returned matches are equally good.
 *
 * @throws InvalidLanguageTagError for an unparsable requested or available tag
 */
[[nodiscard]] std::vector<std::size_t> findLanguageMatch(const std::string& requested,
                                                         const std::vector<std::string>& available,
                                                         bool territory_match = true);

// True when text in this language gets the English abbreviation and number expansion
[[nodiscard]] bool isEnglish(const LanguageTag& tag);

} // namespace processing
