#pragma once

#include <cstdint>
#include <string>

namespace processing
{

// Largest value spelled out; anything above is read digit by digit by the caller
inline constexpr std::uint64_t kMaxSpelledNumber = 999'999'999'999'999'999ULL;

/**
 * @brief English cardinal reading of n, e.g. 1234 -> "one thousand two hundred thirty four"
 *
 * Round hundreds below 3000 read as hundreds (1900 -> "nineteen hundred"). Values above
 * kMaxSpelledNumber come back as their decimal digits.
 */
[[nodiscard]] std::string number_to_words(std::uint64_t n);

// Ordinal form of a cardinal reading: "twenty one" -> "twenty first", "twelve" -> "twelfth"
[[nodiscard]] std::string ordinal_from_cardinal(const std::string& cardinal);

/**
 * @brief Spells out a run of decimal digits
 *
 * Leading zeros are ignored. Runs too long for number_to_words() are returned unchanged.
 */
[[nodiscard]] std::string digits_to_words(const std::string& digits);

} // namespace processing
