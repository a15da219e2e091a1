#include "PronunciationFilter.hpp"
#include "TextUtils.hpp"

#include <vector>

namespace processing
{

namespace
{

bool isPronounced(char32_t cp) { return isAlphanumericChar(cp) || cp == U'-' || cp == U'\'' || cp == U' '; }

} // anonymous namespace

void PronunciationFilter::run(const std::string& text, const ChunkSink& emit) const
{
    const std::u32string chars = utf8ToUtf32(text);

    std::vector<std::size_t> kept;
    std::u32string filtered;
    for (std::size_t i = 0; i < chars.size(); ++i)
    {
        if (isPronounced(chars[i]))
        {
            kept.push_back(i);
            filtered.push_back(toLowerChar(chars[i]));
        }
    }

    auto new_to_orig = mapping::PositionMap::fromOneToOne(kept, chars.size());
    emit(utf32ToUtf8(filtered), new_to_orig.inverse());
}

} // namespace processing
