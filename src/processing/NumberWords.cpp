#include "NumberWords.hpp"

#include <array>
#include <utility>
#include <vector>

namespace processing
{

namespace
{

constexpr std::array<const char*, 20> kUnits = { "",        "one",     "two",       "three",    "four",
                                                 "five",    "six",     "seven",     "eight",    "nine",
                                                 "ten",     "eleven",  "twelve",    "thirteen", "fourteen",
                                                 "fifteen", "sixteen", "seventeen", "eighteen", "nineteen" };

constexpr std::array<const char*, 10> kTens = { "",      "ten",   "twenty",  "thirty", "forty",
                                                "fifty", "sixty", "seventy", "eighty", "ninety" };

constexpr std::array<const char*, 6> kDigitGroups = { "", "thousand", "million", "billion", "trillion", "quadrillion" };

// First matching suffix wins
constexpr std::array<std::pair<const char*, const char*>, 8> kOrdinalSuffixes = { {
    { "one", "first" },
    { "two", "second" },
    { "three", "third" },
    { "five", "fifth" },
    { "eight", "eighth" },
    { "nine", "ninth" },
    { "twelve", "twelfth" },
    { "ty", "tieth" },
} };

bool endsWith(const std::string& text, const std::string& suffix)
{
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string joinWords(const std::vector<std::string>& words)
{
    std::string out;
    for (const auto& word : words)
    {
        if (word.empty())
            continue;
        if (!out.empty())
            out.push_back(' ');
        out += word;
    }
    return out;
}

std::string standardNumberToWords(std::uint64_t n, std::size_t digit_group)
{
    std::vector<std::string> parts;
    if (n >= 1000)
    {
        parts.push_back(standardNumberToWords(n / 1000, digit_group + 1));
        n %= 1000;
    }

    if (n >= 100)
        parts.push_back(std::string(kUnits[n / 100]) + " hundred");
    if (n % 100 >= kUnits.size())
    {
        parts.emplace_back(kTens[(n % 100) / 10]);
        parts.emplace_back(kUnits[(n % 100) % 10]);
    }
    else
    {
        parts.emplace_back(kUnits[n % 100]);
    }
    if (n > 0)
        parts.emplace_back(kDigitGroups[digit_group]);

    return joinWords(parts);
}

} // anonymous namespace

std::string number_to_words(std::uint64_t n)
{
    if (n > kMaxSpelledNumber)
        return std::to_string(n);
    if (n == 0)
        return "zero";
    if (n % 100 == 0 && n % 1000 != 0 && n < 3000)
        return standardNumberToWords(n / 100, 0) + " hundred";
    return standardNumberToWords(n, 0);
}

std::string ordinal_from_cardinal(const std::string& cardinal)
{
    for (const auto& [suffix, replacement] : kOrdinalSuffixes)
    {
        const std::string suffix_str(suffix);
        if (endsWith(cardinal, suffix_str))
            return cardinal.substr(0, cardinal.size() - suffix_str.size()) + replacement;
    }
    return cardinal + "th";
}

std::string digits_to_words(const std::string& digits)
{
    const auto first_significant = digits.find_first_not_of('0');
    if (first_significant == std::string::npos)
        return number_to_words(0);

    // 18 significant digits always fit below kMaxSpelledNumber + 1
    if (digits.size() - first_significant > 18)
        return digits;

    return number_to_words(std::stoull(digits.substr(first_significant)));
}

} // namespace processing
