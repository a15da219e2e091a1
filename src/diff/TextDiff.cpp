#include "TextDiff.hpp"
#include "NeedlemanWunschAligner.hpp"
#include "processing/Diagnostics.hpp"
#include "processing/NormalizationPipeline.hpp"
#include "processing/TextUtils.hpp"
#include "utils/Profile.hpp"

#include <algorithm>
#include <ostream>
#include <stdexcept>
#include <plog/Log.h>

namespace diff
{

namespace
{

constexpr const char* kRed = "\x1b[31m";
constexpr const char* kGreen = "\x1b[32m";
constexpr const char* kReset = "\x1b[39m";

DiffRegions compress(const DiffRegions& regions)
{
    DiffRegions merged;
    for (const auto& region : regions)
    {
        if (!merged.empty() && merged.back().pronunciation_match == region.pronunciation_match)
        {
            DiffRegion joined = merged.back();
            joined.reference_text += region.reference_text;
            joined.compared_text += region.compared_text;
            merged.back() = std::move(joined);
        }
        else
        {
            merged.push_back(region);
        }
    }
    return merged;
}

void checkFits(const mapping::PositionMap& clean_to_raw, std::size_t raw_len, const char* side)
{
    if (clean_to_raw.targetLength() != raw_len)
    {
        throw mapping::DimensionMismatchError(std::string("Clean-to-raw map of the ") + side + " text targets " +
                                              std::to_string(clean_to_raw.targetLength()) +
                                              " positions but the raw text has " + std::to_string(raw_len));
    }
}

// Walks one side of the regions, slicing the raw text region by region
class RawCursor
{
public:
    RawCursor(const std::string& raw, const mapping::PositionMap& clean_to_raw)
        : raw_(raw)
        , cp_to_byte_(processing::codepointToByteOffsets(raw))
        , clean_to_raw_(clean_to_raw)
    {
    }

    std::size_t rawLength() const { return cp_to_byte_.size() - 1; }

    std::string advance(const std::string& clean_text, bool last)
    {
        const std::size_t clean_stop = clean_pos_ + processing::codepointLength(clean_text);
        std::size_t raw_stop = rawLength();
        if (!last)
        {
            // Clamped: the map need not cover every raw position
            raw_stop = std::clamp(clean_to_raw_.lookup(clean_pos_, clean_stop).stop, raw_pos_, rawLength());
        }

        std::string slice = processing::utf8Substr(raw_, cp_to_byte_, raw_pos_, raw_stop);
        clean_pos_ = clean_stop;
        raw_pos_ = raw_stop;
        return slice;
    }

private:
    const std::string& raw_;
    std::vector<std::size_t> cp_to_byte_;
    const mapping::PositionMap& clean_to_raw_;
    std::size_t clean_pos_ = 0;
    std::size_t raw_pos_ = 0;
};

} // anonymous namespace

DiffProjector::DiffProjector(const IAligner& aligner)
    : aligner_(aligner)
{
}

DiffRegions DiffProjector::alignClean(const std::string& clean_reference, const std::string& clean_compared) const
{
    const Alignment alignment =
        aligner_.align(processing::splitOn(clean_reference, ' '), processing::splitOn(clean_compared, ' '));
    if (alignment.first.size() != alignment.second.size())
        throw std::logic_error("Aligner returned sequences of different lengths");

    DiffRegions regions;
    bool seen_reference = false;
    bool seen_compared = false;
    for (std::size_t k = 0; k < alignment.first.size(); ++k)
    {
        const auto& ref_word = alignment.first[k];
        const auto& cmp_word = alignment.second[k];

        const std::string ref_separator = ref_word && seen_reference ? " " : "";
        const std::string cmp_separator = cmp_word && seen_compared ? " " : "";
        if (!ref_separator.empty() || !cmp_separator.empty())
            regions.push_back({ ref_separator, cmp_separator, true });

        const std::string ref_text = ref_word.value_or("");
        const std::string cmp_text = cmp_word.value_or("");
        regions.push_back({ ref_text, cmp_text, ref_text == cmp_text });

        seen_reference = seen_reference || ref_word.has_value();
        seen_compared = seen_compared || cmp_word.has_value();
    }

    return compress(regions);
}

DiffRegions DiffProjector::project(const DiffRegions& clean_regions, const std::string& raw_reference,
                                   const mapping::PositionMap& clean_to_raw_reference,
                                   const std::string& raw_compared,
                                   const mapping::PositionMap& clean_to_raw_compared) const
{
    RawCursor reference(raw_reference, clean_to_raw_reference);
    RawCursor compared(raw_compared, clean_to_raw_compared);
    checkFits(clean_to_raw_reference, reference.rawLength(), "reference");
    checkFits(clean_to_raw_compared, compared.rawLength(), "compared");

    DiffRegions raw_regions;
    raw_regions.reserve(clean_regions.size());
    for (std::size_t i = 0; i < clean_regions.size(); ++i)
    {
        const bool last = i + 1 == clean_regions.size();
        const auto& region = clean_regions[i];
        raw_regions.push_back({ reference.advance(region.reference_text, last),
                                compared.advance(region.compared_text, last), region.pronunciation_match });
    }
    return raw_regions;
}

DiffRegions DiffProjector::diff(const std::string& raw_reference, const text_processing::MappedText& reference,
                                const std::string& raw_compared, const text_processing::MappedText& compared) const
{
    const DiffRegions clean_regions = alignClean(reference.text, compared.text);
    if (processing::Diagnostics::IsVerbose())
    {
        PLOG_INFO_(processing::Diagnostics::kLogInstance)
            << "[DiffProjector] clean_regions=" << clean_regions.size()
            << " reference=" << processing::Diagnostics::Preview(reference.text)
            << " compared=" << processing::Diagnostics::Preview(compared.text);
    }
    return project(clean_regions, raw_reference, reference.map.inverse(), raw_compared, compared.map.inverse());
}

std::vector<DiffRegions> text_diff(const std::vector<std::string>& reference_texts,
                                   const std::vector<std::string>& compared_texts, const std::string& lang_tag,
                                   const TextDiffOptions& options)
{
    PROFILE_SCOPE_CUSTOM("text_diff");

    if (reference_texts.size() != compared_texts.size())
    {
        throw std::invalid_argument("Got " + std::to_string(reference_texts.size()) + " reference texts but " +
                                    std::to_string(compared_texts.size()) + " compared texts");
    }

    const auto pipeline = processing::NormalizationPipeline::forLanguage(lang_tag, options.fault_tolerant);
    const NeedlemanWunschAligner default_aligner;
    const DiffProjector projector(options.aligner ? *options.aligner : default_aligner);

    std::vector<DiffRegions> diffs;
    diffs.reserve(reference_texts.size());
    for (std::size_t i = 0; i < reference_texts.size(); ++i)
    {
        const auto reference = pipeline.process(reference_texts[i]);
        const auto compared = pipeline.process(compared_texts[i]);
        diffs.push_back(projector.diff(reference_texts[i], reference, compared_texts[i], compared));
    }
    return diffs;
}

DiffRegions text_diff(const std::string& reference_text, const std::string& compared_text,
                      const std::string& lang_tag, const TextDiffOptions& options)
{
    return text_diff(std::vector<std::string>{ reference_text }, std::vector<std::string>{ compared_text }, lang_tag,
                     options)
        .front();
}

std::string render_text_diff(const DiffRegions& regions, bool with_colors)
{
    std::string out;
    for (const auto& region : regions)
    {
        if (region.pronunciation_match)
        {
            out += region.reference_text;
            continue;
        }

        out += "(";
        if (with_colors)
            out += kRed;
        out += region.compared_text;
        if (with_colors)
            out += kReset;
        out += "|";
        if (with_colors)
            out += kGreen;
        out += region.reference_text;
        if (with_colors)
            out += kReset;
        out += ")";
    }
    return out;
}

std::ostream& operator<<(std::ostream& os, const DiffRegion& region)
{
    return os << "{" << (region.pronunciation_match ? "match" : "mismatch") << ", ref=\"" << region.reference_text
              << "\", cmp=\"" << region.compared_text << "\"}";
}

} // namespace diff
