#include "TranscriptRunner.hpp"
#include "diff/TextDiff.hpp"
#include "processing/Diagnostics.hpp"
#include "processing/NormalizationPipeline.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/Profile.hpp"

#include <plog/Log.h>

#include <fstream>
#include <ostream>

namespace app
{

bool readLines(const std::string& path, std::vector<std::string>& lines)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Io, "Cannot open input file", path);
        return false;
    }

    std::string line;
    while (std::getline(ifs, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        lines.push_back(std::move(line));
    }

    if (ifs.bad())
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Io, "Error while reading input file", path);
        return false;
    }
    return true;
}

int diffLines(const std::vector<std::string>& references, const std::vector<std::string>& hypotheses,
              const processing::NormalizationPipeline& pipeline, const diff::DiffProjector& projector,
              bool with_colors, std::ostream& out)
{
    PROFILE_SCOPE_FUNCTION();

    if (references.size() != hypotheses.size())
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Initialization,
                                          "Reference and hypothesis files must have the same number of lines",
                                          std::to_string(references.size()) + " reference line(s), " +
                                              std::to_string(hypotheses.size()) + " hypothesis line(s)");
        return kExitUsage;
    }

    int status = kExitOk;
    for (std::size_t i = 0; i < references.size(); ++i)
    {
        try
        {
            const auto reference = pipeline.process(references[i]);
            const auto hypothesis = pipeline.process(hypotheses[i]);
            const auto regions = projector.diff(references[i], reference, hypotheses[i], hypothesis);
            out << diff::render_text_diff(regions, with_colors) << '\n';
        }
        catch (const std::exception& ex)
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Alignment,
                                              "Failed to diff line " + std::to_string(i + 1), ex.what());
            out << '\n';
            status = kExitFailure;
        }
    }

    PLOG_INFO << "Diffed " << references.size() << " line pair(s)";
    return status;
}

int normalizeLines(const std::vector<std::string>& lines, const processing::NormalizationPipeline& pipeline,
                   std::ostream& out)
{
    PROFILE_SCOPE_FUNCTION();

    int status = kExitOk;
    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        try
        {
            const auto normalized = pipeline.process(lines[i]);
            out << normalized.text << '\n';
            if (processing::Diagnostics::IsVerbose())
            {
                PLOG_DEBUG_(processing::Diagnostics::kLogInstance) << "line " << i + 1 << " " << normalized.map;
            }
        }
        catch (const std::exception& ex)
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Normalization,
                                              "Failed to normalize line " + std::to_string(i + 1), ex.what());
            out << '\n';
            status = kExitFailure;
        }
    }
    return status;
}

} // namespace app
