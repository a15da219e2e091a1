#pragma once

#include "ITextStage.hpp"

namespace processing
{

// Replaces every whitespace run with a single space
class WhitespaceCollapser : public ITextStage
{
public:
    [[nodiscard]] const char* name() const override { return "collapse_whitespace"; }

    void run(const std::string& text, const ChunkSink& emit) const override;
};

} // namespace processing
