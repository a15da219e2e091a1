#include "LanguageTag.hpp"
#include "ProcessingErrors.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace processing
{

namespace
{

const std::unordered_map<std::string, std::string>& threeLetterAliases()
{
    static const std::unordered_map<std::string, std::string> aliases = {
        { "eng", "en" }, { "fra", "fr" }, { "fre", "fr" }, { "deu", "de" }, { "ger", "de" }, { "spa", "es" },
        { "ita", "it" }, { "por", "pt" }, { "nld", "nl" }, { "dut", "nl" }, { "rus", "ru" }, { "pol", "pl" },
        { "jpn", "ja" }, { "kor", "ko" }, { "zho", "zh" }, { "chi", "zh" }, { "ara", "ar" }, { "hin", "hi" },
        { "tur", "tr" }, { "swe", "sv" }, { "ukr", "uk" }, { "ces", "cs" }, { "cze", "cs" }, { "ell", "el" },
        { "gre", "el" },
    };
    return aliases;
}

bool isAlpha(const std::string& s)
{
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isalpha(c) != 0; });
}

bool isDigits(const std::string& s)
{
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::string toLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string toUpper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::vector<std::string> splitSubtags(const std::string& tag)
{
    std::vector<std::string> subtags(1);
    for (char c : tag)
    {
        if (c == '-' || c == '_')
            subtags.emplace_back();
        else
            subtags.back().push_back(c);
    }
    return subtags;
}

} // anonymous namespace

std::string LanguageTag::toString() const { return territory ? language + "-" + *territory : language; }

LanguageTag resolveLanguageTag(const std::string& tag)
{
    const auto subtags = splitSubtags(tag);

    const std::string& primary = subtags.front();
    if (primary.size() < 2 || primary.size() > 3 || !isAlpha(primary))
        throw InvalidLanguageTagError("'" + tag + "' is not a valid language tag");

    LanguageTag resolved;
    resolved.language = toLower(primary);
    if (auto alias = threeLetterAliases().find(resolved.language); alias != threeLetterAliases().end())
        resolved.language = alias->second;

    for (std::size_t i = 1; i < subtags.size(); ++i)
    {
        const std::string& subtag = subtags[i];
        if ((subtag.size() == 2 && isAlpha(subtag)) || (subtag.size() == 3 && isDigits(subtag)))
        {
            resolved.territory = toUpper(subtag);
            break;
        }
    }

    return resolved;
}

std::vector<std::size_t> findLanguageMatch(const std::string& requested, const std::vector<std::string>& available,
                                           bool territory_match)
{
    const LanguageTag wanted = resolveLanguageTag(requested);

    std::vector<std::size_t> matches;
    for (std::size_t i = 0; i < available.size(); ++i)
    {
        const LanguageTag candidate = resolveLanguageTag(available[i]);
        if (candidate.language != wanted.language)
            continue;
        if (territory_match && wanted.territory && candidate.territory != wanted.territory)
            continue;
        matches.push_back(i);
    }
    return matches;
}

bool isEnglish(const LanguageTag& tag) { return tag.language == "en"; }

} // namespace processing
