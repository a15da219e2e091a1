#include <catch2/catch_test_macros.hpp>
#include "processing/TextUtils.hpp"

#include <string>
#include <vector>

using namespace processing;

TEST_CASE("TextUtils - code point length counts characters, not bytes", "[text_utils]")
{
    REQUIRE(codepointLength("") == 0);
    REQUIRE(codepointLength("hello") == 5);
    REQUIRE(codepointLength("h\xC3\xA9llo") == 5);
    REQUIRE(codepointLength("\xE3\x81\x93\xE3\x82\x93") == 2);
}

TEST_CASE("TextUtils - UTF-8 and UTF-32 convert both ways", "[text_utils]")
{
    const std::string text = "caf\xC3\xA9 \xE2\x84\x8D";
    const std::u32string wide = utf8ToUtf32(text);
    REQUIRE(wide == U"caf\u00E9 \u210D");
    REQUIRE(utf32ToUtf8(wide) == text);
}

TEST_CASE("TextUtils - undecodable bytes count as one character each", "[text_utils]")
{
    const std::string text = "a\xFF" "b";
    REQUIRE(utf8ToUtf32(text) == U"a\uFFFDb");
    REQUIRE(byteToCodepointOffsets(text) == std::vector<std::size_t>{ 0, 1, 2, 3 });
}

TEST_CASE("TextUtils - offset tables between bytes and code points", "[text_utils]")
{
    const std::string text = "a\xC3\xA9 b";
    REQUIRE(byteToCodepointOffsets(text) == std::vector<std::size_t>{ 0, 1, 1, 2, 3, 4 });

    const auto cp_to_byte = codepointToByteOffsets(text);
    REQUIRE(cp_to_byte == std::vector<std::size_t>{ 0, 1, 3, 4, 5 });

    REQUIRE(utf8Substr(text, cp_to_byte, 1, 3) == "\xC3\xA9 ");
    REQUIRE(utf8Substr(text, cp_to_byte, 3, 99) == "b");
    REQUIRE(utf8Substr(text, cp_to_byte, 3, 1) == "");
}

TEST_CASE("TextUtils - whitespace follows the Unicode space separators", "[text_utils]")
{
    REQUIRE(isWhitespaceChar(U' '));
    REQUIRE(isWhitespaceChar(U'\t'));
    REQUIRE(isWhitespaceChar(U'\u00A0'));
    REQUIRE(isWhitespaceChar(U'\u3000'));
    REQUIRE(isWhitespaceChar(U'\u2028'));
    REQUIRE_FALSE(isWhitespaceChar(U'a'));
    REQUIRE_FALSE(isWhitespaceChar(U'-'));
}

TEST_CASE("TextUtils - alphanumerics and lower-casing", "[text_utils]")
{
    REQUIRE(isAlphanumericChar(U'x'));
    REQUIRE(isAlphanumericChar(U'7'));
    REQUIRE(isAlphanumericChar(U'\u00C4'));
    REQUIRE(isAlphanumericChar(U'\u3053'));
    REQUIRE_FALSE(isAlphanumericChar(U'.'));
    REQUIRE_FALSE(isAlphanumericChar(U' '));

    REQUIRE(toLowerChar(U'A') == U'a');
    REQUIRE(toLowerChar(U'\u00C4') == U'\u00E4');
    REQUIRE(toLowerChar(U'1') == U'1');
}

TEST_CASE("TextUtils - splitKeepWhitespace keeps every character", "[text_utils]")
{
    REQUIRE(splitKeepWhitespace(U"").empty());
    REQUIRE(splitKeepWhitespace(U"a  b") == std::vector<std::u32string>{ U"a", U"  ", U"b" });
    REQUIRE(splitKeepWhitespace(U" x\t") == std::vector<std::u32string>{ U" ", U"x", U"\t" });
}

TEST_CASE("TextUtils - splitOn keeps empty parts", "[text_utils]")
{
    REQUIRE(splitOn("", ' ') == std::vector<std::string>{ "" });
    REQUIRE(splitOn("a  b", ' ') == std::vector<std::string>{ "a", "", "b" });
    REQUIRE(splitOn("the cat", ' ') == std::vector<std::string>{ "the", "cat" });
}
