#include "UnicodeStandardizer.hpp"
#include "Diagnostics.hpp"
#include "TextUtils.hpp"

#include <cstdlib>
#include <plog/Log.h>
#include <utf8proc.h>

namespace processing
{

std::string nfkc_normalize(const std::string& text)
{
    if (text.empty())
        return text;

    utf8proc_uint8_t* normalized = utf8proc_NFKC(reinterpret_cast<const utf8proc_uint8_t*>(text.c_str()));
    if (!normalized)
    {
        PLOG_WARNING_(Diagnostics::kLogInstance) << "NFKC normalization failed, keeping " << Diagnostics::Preview(text);
        return text;
    }

    std::string out(reinterpret_cast<char*>(normalized));
    std::free(normalized);
    return out;
}

void UnicodeStandardizer::run(const std::string& text, const ChunkSink& emit) const
{
    for (const auto& part : splitKeepWhitespace(utf8ToUtf32(text)))
    {
        std::string normalized = nfkc_normalize(utf32ToUtf8(part));
        const std::size_t new_len = codepointLength(normalized);
        emit(std::move(normalized), mapping::PositionMap::lerp(part.size(), new_len));
    }
}

} // namespace processing
