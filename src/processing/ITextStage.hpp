#pragma once

#include "TextProcessingTypes.hpp"

#include <functional>
#include <string>

namespace processing
{

/**
 * @brief One rewrite step of the normalization pipeline
 *
 * A stage emits its output as an ordered sequence of (chunk, map) pairs. Each map goes from the
 * slice of the input that produced the chunk to the chunk itself, so that concatenating all chunks
 * and all maps yields the stage output and an input-to-output map. A stage that rewrites the text
 * in one go emits a single pair. Stages are stateless; run() can be repeated on the same input.
 */
class ITextStage
{
public:
    using ChunkSink = std::function<void(std::string chunk, mapping::PositionMap map)>;

    virtual ~ITextStage() = default;

    [[nodiscard]] virtual const char* name() const = 0;

    virtual void run(const std::string& text, const ChunkSink& emit) const = 0;
};

// Runs a stage to completion and joins its chunks
text_processing::MappedText collect_stage(const ITextStage& stage, const std::string& text);

} // namespace processing
