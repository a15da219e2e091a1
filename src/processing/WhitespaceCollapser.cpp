#include "WhitespaceCollapser.hpp"
#include "TextUtils.hpp"

namespace processing
{

void WhitespaceCollapser::run(const std::string& text, const ChunkSink& emit) const
{
    for (const auto& part : splitKeepWhitespace(utf8ToUtf32(text)))
    {
        if (isWhitespaceChar(part.front()))
            emit(" ", mapping::PositionMap::lerp(part.size(), 1));
        else
            emit(utf32ToUtf8(part), mapping::PositionMap::identity(part.size()));
    }
}

} // namespace processing
