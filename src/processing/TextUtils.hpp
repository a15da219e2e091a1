#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace processing
{

/// UTF-8 to UTF-32 conversion. Each undecodable byte becomes U+FFFD.
std::u32string utf8ToUtf32(const std::string& utf8_str);

/// UTF-32 to UTF-8 conversion
std::string utf32ToUtf8(const std::u32string& utf32_str);

/// Number of code points in a UTF-8 string. Position maps count in code points.
std::size_t codepointLength(const std::string& utf8_str);

/// Code point offset of every byte offset 0..utf8_str.size() (inclusive)
std::vector<std::size_t> byteToCodepointOffsets(const std::string& utf8_str);

/// Byte offset of every code point offset 0..codepointLength(utf8_str) (inclusive)
std::vector<std::size_t> codepointToByteOffsets(const std::string& utf8_str);

/// Code point range [begin, end) of utf8_str, clamped, using offsets from codepointToByteOffsets()
std::string utf8Substr(const std::string& utf8_str, const std::vector<std::size_t>& cp_to_byte, std::size_t begin,
                       std::size_t end);

/// Whitespace as understood by str.isspace()/\s: ASCII controls, NEL and the Z* categories
bool isWhitespaceChar(char32_t cp);

/// Letters (L*) and numbers (N*)
bool isAlphanumericChar(char32_t cp);

/// Simple one-to-one lower-case mapping
char32_t toLowerChar(char32_t cp);

/// Splits text into alternating runs of non-whitespace and whitespace, keeping every character.
/// Concatenating the parts reproduces the input. No part is empty.
std::vector<std::u32string> splitKeepWhitespace(const std::u32string& text);

/// Splits on every occurrence of @p sep; "" gives {""} and adjacent separators give empty parts.
std::vector<std::string> splitOn(const std::string& text, char sep);

} // namespace processing
