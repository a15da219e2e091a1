#pragma once

#include "mapping/PositionMap.hpp"

#include <chrono>
#include <exception>
#include <optional>
#include <string>

namespace text_processing {

// Core data contracts for the normalization pipeline.
// All stages use these types as input/output to ensure clean interfaces.

// Text together with the position map that produced it.
// For a stage output the map goes from the stage input to `text`;
// for a pipeline result it goes from the raw text to `text`.
struct MappedText {
    std::string text;                         // UTF-8, lengths counted in code points
    mapping::PositionMap map;                 // source_len = input length, target_len = length of `text`
};

// Pipeline execution result wrapper (common for all stages)
template<typename T>
struct StageResult {
    T result;                                 // The actual result payload
    bool succeeded = true;                    // Whether the stage completed successfully
    std::optional<std::string> error;         // Error message if stage failed
    std::exception_ptr exception;             // Original exception, kept so strict callers can rethrow it
    std::chrono::microseconds duration{ 0 };  // How long the stage took to execute
    std::string stage_name;                   // Name of the stage (for logging/metrics)

    // Factory methods for cleaner usage
    static StageResult success(T r, std::chrono::microseconds time, const std::string& name) {
        StageResult res;
        res.result = std::move(r);
        res.succeeded = true;
        res.duration = time;
        res.stage_name = name;
        return res;
    }

    static StageResult failure(const std::string& err, std::exception_ptr ex, std::chrono::microseconds time,
                               const std::string& name) {
        StageResult res;
        res.succeeded = false;
        res.error = err;
        res.exception = std::move(ex);
        res.duration = time;
        res.stage_name = name;
        return res;
    }
};

} // namespace text_processing
