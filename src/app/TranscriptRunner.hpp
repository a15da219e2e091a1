#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace processing
{
class NormalizationPipeline;
}

namespace diff
{
class DiffProjector;
}

namespace app
{

// Process exit status of transcript-diff
constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

// Reads a UTF-8 file line by line, dropping a trailing '\r'. Reports an Io error and returns false when the file
// cannot be read.
bool readLines(const std::string& path, std::vector<std::string>& lines);

/**
 * Diffs line i of references against line i of hypotheses and writes one rendered line per pair to out.
 *
 * A pair that fails is reported through ErrorReporter and leaves an empty output line, so the remaining lines keep
 * their position. Inputs with different line counts are a usage error and produce no output.
 *
 * @return kExitOk, kExitFailure when any pair failed, kExitUsage on a line count mismatch
 */
int diffLines(const std::vector<std::string>& references, const std::vector<std::string>& hypotheses,
              const processing::NormalizationPipeline& pipeline, const diff::DiffProjector& projector,
              bool with_colors, std::ostream& out);

// Writes the normalized form of every line to out; failed lines are reported and left empty
int normalizeLines(const std::vector<std::string>& lines, const processing::NormalizationPipeline& pipeline,
                   std::ostream& out);

} // namespace app
