#include "NumberExpander.hpp"
#include "NumberWords.hpp"
#include "TextUtils.hpp"

#include <algorithm>
#include <array>
#include <functional>
#include <regex>

namespace processing
{

namespace
{

using Word = NumberExpander::Word;
using WordList = std::vector<Word>;
using MatchBuilder = std::function<std::string(const std::smatch&)>;

const char* const kCurrencySymbol = "(?:\\$|£|¥|€)";

// Rewrites every word fully matched by pattern
void rewriteWords(WordList& words, const std::regex& pattern, const MatchBuilder& build)
{
    std::smatch match;
    for (auto& word : words)
    {
        if (std::regex_match(word.text, match, pattern))
            word.text = build(match);
    }
}

std::string stripLeadingZeros(const std::string& digits)
{
    const auto pos = digits.find_first_not_of('0');
    return pos == std::string::npos ? "0" : digits.substr(pos);
}

std::string removeChar(std::string text, char ch)
{
    text.erase(std::remove(text.begin(), text.end(), ch), text.end());
    return text;
}

std::string replaceAll(std::string text, const std::string& from, const std::string& to)
{
    for (auto pos = text.find(from); pos != std::string::npos; pos = text.find(from, pos + to.size()))
        text.replace(pos, from.size(), to);
    return text;
}

// "25" -> "2 5 "
std::string spellDigitsSpaced(const std::string& digits)
{
    std::string out;
    for (char ch : digits)
    {
        out.push_back(ch);
        out.push_back(' ');
    }
    return out;
}

// "1,234,567" -> "1234567"; a country prefix is dropped so "US$1,000" reads as dollars
void removeThousandsSeparators(WordList& words)
{
    static const std::regex pattern(std::string("(\\(?[A-Z]{2,3})?((?:\\$|£|¥|€|#|\\(|\\|)*[0-9][0-9,.]+[0-9])(\\S+)?"));
    rewriteWords(words, pattern,
                 [](const std::smatch& m)
                 {
                     return removeChar(m.str(2), ',') + m.str(3);
                 });
}

// "from 1990" -> "from nineteen ninety", only after a preposition introducing a date
void expandYears(WordList& words)
{
    static const std::regex pattern("(1[1-9]|20)([0-9]{2})([.,?!])?");
    static const std::array<const char*, 10> kPrepositions = { "From",   "from", "After", "after", "Before",
                                                               "before", "By",   "by",    "Until", "until" };

    std::smatch match;
    for (std::size_t i = 2; i < words.size(); ++i)
    {
        const std::u32string separator = utf8ToUtf32(words[i - 1].text);
        if (separator.size() != 1 || !isWhitespaceChar(separator.front()))
            continue;
        if (std::find(kPrepositions.begin(), kPrepositions.end(), words[i - 2].text) == kPrepositions.end())
            continue;
        if (!std::regex_match(words[i].text, match, pattern))
            continue;

        const std::string century = match.str(1);
        const std::string decade = match.str(2);
        std::string year;
        if (decade[0] == '0' && century == "20")
            year = century + decade;
        else if (decade == "00")
            year = number_to_words(std::stoull(century)) + " hundred";
        else if (decade[0] == '0')
            year = century + " oh " + decade.substr(1);
        else
            year = number_to_words(std::stoull(century)) + " " + number_to_words(std::stoull(decade));

        words[i].text = year + match.str(3);
    }
}

std::string currencyName(const std::string& symbol)
{
    if (symbol == "$")
        return "dollars";
    if (symbol == "£")
        return "pounds";
    if (symbol == "¥")
        return "yen";
    return "euros";
}

std::string unitName(const std::string& unit)
{
    if (unit == "B")
        return "billion";
    if (unit == "K")
        return "thousand";
    if (unit == "M")
        return "million";
    if (unit == "T")
        return "trillion";
    // " billion" spelled out in the text
    return unit.substr(unit.find_first_not_of(' '));
}

std::string abbreviatedAmount(const std::smatch& m)
{
    std::string symbol = m.str(1);
    if (!symbol.empty() && symbol.front() == '(')
        symbol.erase(0, 1);

    const std::string value = m.str(2);
    std::string amount = value;
    if (const auto point = value.find('.'); point != std::string::npos)
    {
        const std::string fraction = spellDigitsSpaced(value.substr(point + 1));
        amount = value.substr(0, point) + " point " + fraction.substr(0, fraction.size() - 1);
    }

    return amount + " " + unitName(m.str(3)) + " " + currencyName(symbol) + m.str(4);
}

// "$5B" -> "5 billion dollars", also across the three words "$5", " ", "billion"
void expandAbbreviatedCurrencyUnits(WordList& words)
{
    static const std::regex single(std::string("(\\(?") + kCurrencySymbol +
                                   ")([0-9]*\\.?[0-9]+)([BKMT])([.,?!)|]+)?");
    static const std::regex spelled(std::string("(\\(?") + kCurrencySymbol +
                                    ")([0-9]*\\.?[0-9]+)( [BMbmTtr]+illion)([.,?!)|]+)?");

    rewriteWords(words, single, abbreviatedAmount);

    std::smatch match;
    for (std::size_t i = 0; i + 2 < words.size(); ++i)
    {
        if (words[i + 1].text != " ")
            continue;
        const std::string joined = words[i].text + words[i + 1].text + words[i + 2].text;
        if (!std::regex_match(joined, match, spelled))
            continue;

        words[i].text = abbreviatedAmount(match);
        words[i].source_len += words[i + 1].source_len + words[i + 2].source_len;
        words.erase(words.begin() + static_cast<std::ptrdiff_t>(i) + 1,
                    words.begin() + static_cast<std::ptrdiff_t>(i) + 3);
    }
}

// "£3.50" -> "3 pounds 50"
void expandCurrency(WordList& words, const std::regex& pattern, const std::string& one, const std::string& many)
{
    rewriteWords(words, pattern,
                 [&](const std::smatch& m)
                 {
                     const auto parts = splitOn(m.str(2), '.');
                     const std::string whole = parts[0].empty() ? "0" : parts[0];
                     std::string out = whole + " " + (stripLeadingZeros(whole) == "1" ? one : many);
                     if (parts.size() > 1)
                         out += " " + parts[1];
                     return out + m.str(3);
                 });
}

// "1.5kg" -> "1 point 5 kilograms"
void expandUnit(WordList& words, const std::string& suffix, const std::string& one, const std::string& many)
{
    const std::regex pattern("([0-9.]*[0-9]+)(" + suffix + ")([.,?!])?");
    rewriteWords(words, pattern,
                 [&](const std::smatch& m)
                 {
                     const auto parts = splitOn(m.str(1), '.');
                     std::string out;
                     if (parts.size() > 1)
                         out = parts[0] + " point " + spellDigitsSpaced(parts[1]) + many;
                     else
                         out = parts[0] + " " + (parts[0] == "1" ? one : many);
                     return out + m.str(3);
                 });
}

void expandUnits(WordList& words)
{
    static const std::array<std::array<const char*, 3>, 13> kUnits = { {
        { "ml", "milliliter", "milliliters" },
        { "cl", "centiliter", "centiliters" },
        { "g", "gram", "grams" },
        { "kg", "kilogram", "kilograms" },
        { "mm", "millimeter", "millimeters" },
        { "cm", "centimeter", "centimeters" },
        { "km", "kilometer", "kilometers" },
        { "in", "inch", "inches" },
        { "ft", "foot", "feet" },
        { "l", "liter", "liters" },
        { "m", "meter", "meters" },
        { "yds?", "yard", "yards" },
        { "s[ecs]*", "second", "seconds" },
    } };

    for (const auto& [suffix, one, many] : kUnits)
        expandUnit(words, suffix, one, many);
}

// "$1.50" -> "1 dollar, 50 cents"
void expandDollars(WordList& words)
{
    static const std::regex pattern("(\\(?\\$)([0-9,]*\\.?[0-9]+)([.,?!)|]+)?");
    rewriteWords(words, pattern,
                 [](const std::smatch& m)
                 {
                     const auto parts = splitOn(removeChar(m.str(2), ','), '.');
                     const std::string dollars = stripLeadingZeros(parts[0]);
                     const std::string cents = parts.size() > 1 ? stripLeadingZeros(parts[1]) : "0";

                     const std::string dollar_text = dollars + (dollars == "1" ? " dollar" : " dollars");
                     const std::string cent_text = cents + (cents == "1" ? " cent" : " cents");

                     std::string out;
                     if (dollars != "0" && cents != "0")
                         out = dollar_text + ", " + cent_text;
                     else if (dollars != "0")
                         out = dollar_text;
                     else if (cents != "0")
                         out = cent_text;
                     else
                         out = "zero dollars";
                     return out + m.str(3);
                 });
}

// "#5" -> "number 5"
void expandHashNumbers(WordList& words)
{
    static const std::regex pattern("#([0-9]+(?:\\.[0-9]+)?)([.,?!])?");
    rewriteWords(words, pattern,
                 [](const std::smatch& m)
                 {
                     return "number " + m.str(1) + m.str(2);
                 });
}

// "3.14" -> "3 point 14"
void expandDecimalPoints(WordList& words)
{
    static const std::regex pattern("(number\\s)?([0-9]+\\.[0-9]+)([.,?!])?");
    rewriteWords(words, pattern,
                 [](const std::smatch& m)
                 {
                     return m.str(1) + replaceAll(m.str(2), ".", " point ") + m.str(3);
                 });
}

// "9:05pm" -> "9 oh 5 p m"
void expandTimes(WordList& words)
{
    static const std::regex pattern("([0-2]?[0-9]):([0-9]{2})(am|pm)?([.,?!])?");
    rewriteWords(words, pattern,
                 [](const std::smatch& m)
                 {
                     std::vector<std::string> parts{ stripLeadingZeros(m.str(1)) };
                     const std::string minute = m.str(2);
                     if (minute != "00")
                         parts.push_back(minute[0] == '0' ? "oh " + minute.substr(1) : minute);
                     if (m[3].matched)
                         parts.push_back(std::string(1, m.str(3)[0]) + " m");

                     std::string out;
                     for (const auto& part : parts)
                         out += (out.empty() ? "" : " ") + part;
                     return out + m.str(4);
                 });
}

// "21st" -> "twenty first"
void expandOrdinals(WordList& words)
{
    static const std::regex pattern("([0-9]+)(st|nd|rd|th)([.,?!])?");
    rewriteWords(words, pattern,
                 [](const std::smatch& m)
                 {
                     return ordinal_from_cardinal(digits_to_words(m.str(1))) + m.str(3);
                 });
}

// Any digit run left
void expandCardinals(WordList& words)
{
    static const std::regex digits("[0-9]+");
    for (auto& word : words)
    {
        if (word.text.find_first_of("0123456789") == std::string::npos)
            continue;

        std::string out;
        auto last = word.text.cbegin();
        for (auto it = std::sregex_iterator(word.text.begin(), word.text.end(), digits); it != std::sregex_iterator();
             ++it)
        {
            out.append(last, word.text.cbegin() + it->position(0));
            out += digits_to_words(it->str(0));
            last = word.text.cbegin() + it->position(0) + it->length(0);
        }
        out.append(last, word.text.cend());
        word.text = std::move(out);
    }
}

} // anonymous namespace

std::vector<NumberExpander::Word> NumberExpander::expandWords(const std::string& text)
{
    WordList words;
    for (const auto& part : splitKeepWhitespace(utf8ToUtf32(text)))
        words.push_back({ utf32ToUtf8(part), part.size() });

    static const std::regex pounds("(\\(?£)([0-9.]*[0-9]+)([.,?!])?");
    static const std::regex yen("(\\(?¥)([0-9]+)([.,?!])?");
    static const std::regex euros("(\\(?€)([0-9.]*[0-9]+)([.,?!])?");

    removeThousandsSeparators(words);
    expandYears(words);
    expandAbbreviatedCurrencyUnits(words);
    expandCurrency(words, pounds, "pound", "pounds");
    expandCurrency(words, yen, "yen", "yen");
    expandCurrency(words, euros, "euro", "euros");
    expandUnits(words);
    expandDollars(words);
    expandHashNumbers(words);
    expandDecimalPoints(words);
    expandTimes(words);
    expandOrdinals(words);
    expandCardinals(words);

    return words;
}

void NumberExpander::run(const std::string& text, const ChunkSink& emit) const
{
    for (auto& word : expandWords(text))
    {
        const std::size_t new_len = codepointLength(word.text);
        emit(std::move(word.text), mapping::PositionMap::lerp(word.source_len, new_len));
    }
}

} // namespace processing
