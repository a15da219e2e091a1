#include "AbbreviationExpander.hpp"
#include "TextUtils.hpp"

#include <iterator>
#include <utility>

namespace processing
{

namespace
{

// Abbreviation stems as regex fragments, in match order ("mrs" before "mr")
const std::pair<const char*, const char*> kAbbreviationTable[] = {
    { "mrs", "misess" },      { "mr", "mister" },       { "dr", "doctor" },       { "st", "saint" },
    { "co", "company" },      { "jr", "junior" },       { "maj", "major" },       { "gen", "general" },
    { "drs", "doctors" },     { "rev", "reverend" },    { "lt", "lieutenant" },   { "hon", "honorable" },
    { "sgt", "sergeant" },    { "capt", "captain" },    { "esq", "esquire" },     { "ltd", "limited" },
    { "col", "colonel" },     { "ft", "feet" },         { "abbrev", "abbreviation" }, { "ave", "avenue" },
    { "abstr", "abstract" },  { "addr", "address" },    { "jan", "january" },     { "feb", "february" },
    { "mar", "march" },       { "apr", "april" },       { "jul", "july" },        { "aug", "august" },
    { "sep", "september" },   { "sept", "september" },  { "oct", "october" },     { "nov", "november" },
    { "dec", "december" },    { "mon", "monday" },      { "tue", "tuesday" },     { "wed", "wednesday" },
    { "thur", "thursday" },   { "fri", "friday" },      { "sec", "second" },      { "min", "minute" },
    { "mo", "month" },        { "yr", "year" },         { "cal", "calorie" },     { "dept", "department" },
    { "gal", "gallon" },      { "kg", "kilogram" },     { "km", "kilometer" },    { "mt", "mount" },
    { "oz", "ounce" },        { "vol", "volume" },      { "vs", "versus" },       { "yd", "yard" },
    { "e\\.g", "eg" },        { "i\\.e", "ie" },        { "etc", "etc" },
};

} // anonymous namespace

AbbreviationExpander::AbbreviationExpander()
{
    abbreviations_.reserve(std::size(kAbbreviationTable));
    for (const auto& [stem, expansion] : kAbbreviationTable)
    {
        abbreviations_.push_back({ std::regex(std::string("\\b") + stem + "\\.",
                                              std::regex::ECMAScript | std::regex::icase),
                                   expansion });
    }
}

void AbbreviationExpander::run(const std::string& text, const ChunkSink& emit) const
{
    using mapping::PositionMap;

    const auto cp_offsets = byteToCodepointOffsets(text);
    auto orig_to_new = PositionMap::identity(cp_offsets.back());
    std::u32string new_text = utf8ToUtf32(text);

    for (const auto& abbreviation : abbreviations_)
    {
        auto it = std::sregex_iterator(text.begin(), text.end(), abbreviation.pattern);
        for (; it != std::sregex_iterator(); ++it)
        {
            const auto byte_begin = static_cast<std::size_t>(it->position(0));
            const auto byte_end = byte_begin + static_cast<std::size_t>(it->length(0));

            // Where the match sits in the partially expanded text
            const auto span = orig_to_new.lookup(cp_offsets[byte_begin], cp_offsets[byte_end]);
            const std::u32string replacement = utf8ToUtf32(abbreviation.expansion);
            new_text.replace(span.start, span.size(), replacement);

            const std::size_t tail = orig_to_new.targetLength() - span.stop;
            orig_to_new = orig_to_new * (PositionMap::identity(span.start) +
                                         PositionMap::lerp(span.size(), replacement.size()) +
                                         PositionMap::identity(tail));
        }
    }

    emit(utf32ToUtf8(new_text), std::move(orig_to_new));
}

} // namespace processing
