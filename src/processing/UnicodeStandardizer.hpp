#pragma once

#include "ITextStage.hpp"

namespace processing
{

// NFKC-normalizes every whitespace-delimited part on its own, spreading each part evenly over its
// normalized form. Whitespace parts go through NFKC as well (U+3000 becomes a plain space).
class UnicodeStandardizer : public ITextStage
{
public:
    [[nodiscard]] const char* name() const override { return "standardize_characters"; }

    void run(const std::string& text, const ChunkSink& emit) const override;
};

// NFKC of a UTF-8 string; returns the input unchanged if utf8proc rejects it
[[nodiscard]] std::string nfkc_normalize(const std::string& text);

} // namespace processing
