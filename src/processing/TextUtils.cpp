#include "TextUtils.hpp"
#include <utf8proc.h>

#include <algorithm>

namespace processing
{

std::u32string utf8ToUtf32(const std::string& utf8_str)
{
    std::u32string result;
    if (utf8_str.empty())
        return result;

    const utf8proc_uint8_t* str = reinterpret_cast<const utf8proc_uint8_t*>(utf8_str.c_str());
    utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(utf8_str.size());

    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
        {
            // One replacement character per undecodable byte keeps code point counts in step with
            // byteToCodepointOffsets()
            result.push_back(U'\uFFFD');
            ++pos;
            continue;
        }
        result.push_back(static_cast<char32_t>(codepoint));
        pos += bytes;
    }
    return result;
}

std::string utf32ToUtf8(const std::u32string& utf32_str)
{
    std::string result;
    result.reserve(utf32_str.size());
    for (char32_t cp : utf32_str)
    {
        utf8proc_uint8_t buffer[4];
        utf8proc_ssize_t bytes = utf8proc_encode_char(static_cast<utf8proc_int32_t>(cp), buffer);
        if (bytes > 0)
        {
            result.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(bytes));
        }
    }
    return result;
}

std::size_t codepointLength(const std::string& utf8_str)
{
    return utf8ToUtf32(utf8_str).size();
}

std::vector<std::size_t> byteToCodepointOffsets(const std::string& utf8_str)
{
    std::vector<std::size_t> offsets(utf8_str.size() + 1, 0);

    const utf8proc_uint8_t* str = reinterpret_cast<const utf8proc_uint8_t*>(utf8_str.c_str());
    utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(utf8_str.size());

    utf8proc_ssize_t pos = 0;
    std::size_t cp_index = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
            bytes = 1;
        // Bytes inside a sequence belong to the code point they start
        for (utf8proc_ssize_t b = 0; b < bytes && pos + b < len; ++b)
            offsets[static_cast<std::size_t>(pos + b)] = cp_index;
        pos += bytes;
        ++cp_index;
    }
    offsets[utf8_str.size()] = cp_index;
    return offsets;
}

std::vector<std::size_t> codepointToByteOffsets(const std::string& utf8_str)
{
    const auto byte_to_cp = byteToCodepointOffsets(utf8_str);
    std::vector<std::size_t> offsets(byte_to_cp.back() + 1, utf8_str.size());
    for (std::size_t b = utf8_str.size(); b-- > 0;)
        offsets[byte_to_cp[b]] = b;
    return offsets;
}

std::string utf8Substr(const std::string& utf8_str, const std::vector<std::size_t>& cp_to_byte, std::size_t begin,
                       std::size_t end)
{
    const std::size_t last = cp_to_byte.size() - 1;
    begin = std::min(begin, last);
    end = std::max(begin, std::min(end, last));
    return utf8_str.substr(cp_to_byte[begin], cp_to_byte[end] - cp_to_byte[begin]);
}

bool isWhitespaceChar(char32_t cp)
{
    switch (cp)
    {
    case U'\t':
    case U'\n':
    case U'\v':
    case U'\f':
    case U'\r':
    case U'\x1c':
    case U'\x1d':
    case U'\x1e':
    case U'\x1f':
    case U'\x85':
        return true;
    default:
        break;
    }

    const auto category = utf8proc_category(static_cast<utf8proc_int32_t>(cp));
    return category == UTF8PROC_CATEGORY_ZS || category == UTF8PROC_CATEGORY_ZL || category == UTF8PROC_CATEGORY_ZP;
}

bool isAlphanumericChar(char32_t cp)
{
    switch (utf8proc_category(static_cast<utf8proc_int32_t>(cp)))
    {
    case UTF8PROC_CATEGORY_LU:
    case UTF8PROC_CATEGORY_LL:
    case UTF8PROC_CATEGORY_LT:
    case UTF8PROC_CATEGORY_LM:
    case UTF8PROC_CATEGORY_LO:
    case UTF8PROC_CATEGORY_ND:
    case UTF8PROC_CATEGORY_NL:
    case UTF8PROC_CATEGORY_NO:
        return true;
    default:
        return false;
    }
}

char32_t toLowerChar(char32_t cp)
{
    return static_cast<char32_t>(utf8proc_tolower(static_cast<utf8proc_int32_t>(cp)));
}

std::vector<std::u32string> splitKeepWhitespace(const std::u32string& text)
{
    std::vector<std::u32string> parts;
    std::size_t part_start = 0;
    for (std::size_t i = 1; i <= text.size(); ++i)
    {
        if (i == text.size() || isWhitespaceChar(text[i]) != isWhitespaceChar(text[i - 1]))
        {
            parts.push_back(text.substr(part_start, i - part_start));
            part_start = i;
        }
    }
    return parts;
}

std::vector<std::string> splitOn(const std::string& text, char sep)
{
    std::vector<std::string> parts;
    std::size_t part_start = 0;
    while (true)
    {
        const auto pos = text.find(sep, part_start);
        if (pos == std::string::npos)
        {
            parts.push_back(text.substr(part_start));
            return parts;
        }
        parts.push_back(text.substr(part_start, pos - part_start));
        part_start = pos + 1;
    }
}

} // namespace processing
