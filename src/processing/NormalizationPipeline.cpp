#include "NormalizationPipeline.hpp"
#include "AbbreviationExpander.hpp"
#include "Diagnostics.hpp"
#include "LanguageTag.hpp"
#include "NumberExpander.hpp"
#include "ProcessingErrors.hpp"
#include "PronunciationFilter.hpp"
#include "StageRunner.hpp"
#include "TextUtils.hpp"
#include "UnicodeStandardizer.hpp"
#include "WhitespaceCollapser.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/Profile.hpp"

#include <exception>
#include <sstream>
#include <plog/Log.h>

namespace processing
{

namespace
{

void logInput(const std::string& input)
{
    if (Diagnostics::IsVerbose())
        PLOG_INFO_(Diagnostics::kLogInstance) << "[NormalizationPipeline] stage=input raw=" << Diagnostics::Preview(input);
}

void logStageResult(const text_processing::StageResult<text_processing::MappedText>& stage,
                    const std::string& input)
{
    if (!Diagnostics::IsVerbose())
        return;

    std::ostringstream oss;
    oss << "[NormalizationPipeline] stage=" << stage.stage_name;
    if (stage.succeeded)
    {
        oss << " status=ok duration=" << stage.duration.count() << "us input=" << Diagnostics::Preview(input)
            << " output=" << Diagnostics::Preview(stage.result.text)
            << " map=" << stage.result.map.sourceLength() << "x" << stage.result.map.targetLength();
        PLOG_INFO_(Diagnostics::kLogInstance) << oss.str();
    }
    else
    {
        oss << " status=error duration=" << stage.duration.count() << "us input=" << Diagnostics::Preview(input)
            << " reason=" << (stage.error ? *stage.error : "unknown");
        PLOG_ERROR_(Diagnostics::kLogInstance) << oss.str();
    }
}

void logCompletion(const text_processing::MappedText& output)
{
    if (Diagnostics::IsVerbose())
        PLOG_INFO_(Diagnostics::kLogInstance)
            << "[NormalizationPipeline] stage=complete output=" << Diagnostics::Preview(output.text);
}

} // anonymous namespace

text_processing::MappedText collect_stage(const ITextStage& stage, const std::string& text)
{
    text_processing::MappedText out;
    std::vector<mapping::PositionMap> maps;
    stage.run(text,
              [&](std::string chunk, mapping::PositionMap map)
              {
                  out.text += chunk;
                  maps.push_back(std::move(map));
              });
    out.map = mapping::PositionMap::concatAll(maps);
    return out;
}

struct NormalizationPipeline::Impl
{
    std::vector<std::unique_ptr<ITextStage>> stages;
    bool fault_tolerant = false;
};

NormalizationPipeline::NormalizationPipeline(std::vector<std::unique_ptr<ITextStage>> stages, bool fault_tolerant)
    : impl_(std::make_unique<Impl>())
{
    impl_->stages = std::move(stages);
    impl_->fault_tolerant = fault_tolerant;
}

NormalizationPipeline::~NormalizationPipeline() = default;

NormalizationPipeline::NormalizationPipeline(NormalizationPipeline&&) noexcept = default;
NormalizationPipeline& NormalizationPipeline::operator=(NormalizationPipeline&&) noexcept = default;

NormalizationPipeline NormalizationPipeline::forLanguage(const std::string& lang_tag, bool fault_tolerant)
{
    const LanguageTag tag = resolveLanguageTag(lang_tag);

    std::vector<std::unique_ptr<ITextStage>> stages;
    stages.push_back(std::make_unique<UnicodeStandardizer>());
    stages.push_back(std::make_unique<WhitespaceCollapser>());
    if (isEnglish(tag))
    {
        stages.push_back(std::make_unique<AbbreviationExpander>());
        stages.push_back(std::make_unique<NumberExpander>());
    }
    stages.push_back(std::make_unique<PronunciationFilter>());
    // Punctuation removed between two spaces leaves them adjacent
    stages.push_back(std::make_unique<WhitespaceCollapser>());

    return NormalizationPipeline(std::move(stages), fault_tolerant);
}

text_processing::MappedText NormalizationPipeline::process(const std::string& raw_text) const
{
    PROFILE_SCOPE_CUSTOM("NormalizationPipeline::process");

    logInput(raw_text);

    std::string text = raw_text;
    std::size_t text_len = codepointLength(text);
    auto raw_to_clean = mapping::PositionMap::identity(text_len);

    for (const auto& stage : impl_->stages)
    {
        auto result = run_stage<text_processing::MappedText>(stage->name(),
                                                             [&]()
                                                             {
                                                                 return collect_stage(*stage, text);
                                                             });
        logStageResult(result, text);

        if (!result.succeeded)
        {
            if (!impl_->fault_tolerant)
                std::rethrow_exception(result.exception);

            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Normalization,
                                                std::string("Skipped normalization stage ") + stage->name(),
                                                result.error.value_or("unknown error"));
            continue;
        }

        const std::size_t new_len = codepointLength(result.result.text);
        mapping::PositionMap stage_map = std::move(result.result.map);
        if (stage_map.sourceLength() != text_len || stage_map.targetLength() != new_len)
        {
            std::ostringstream oss;
            oss << "Stage " << stage->name() << " gave a " << stage_map.sourceLength() << "x"
                << stage_map.targetLength() << " map for a " << text_len << " -> " << new_len << " rewrite";
            if (!impl_->fault_tolerant)
                throw ConsistencyError(oss.str());

            PLOG_ERROR_(Diagnostics::kLogInstance) << "[NormalizationPipeline] " << oss.str() << ", using an even spread";
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Normalization,
                                                "Normalization stage produced an incorrect mapping", oss.str());
            stage_map = mapping::PositionMap::lerp(text_len, new_len);
        }

        raw_to_clean = raw_to_clean * stage_map;
        text = std::move(result.result.text);
        text_len = new_len;
    }

    text_processing::MappedText out{ std::move(text), std::move(raw_to_clean) };
    logCompletion(out);
    return out;
}

std::vector<std::string> NormalizationPipeline::stageNames() const
{
    std::vector<std::string> names;
    names.reserve(impl_->stages.size());
    for (const auto& stage : impl_->stages)
        names.emplace_back(stage->name());
    return names;
}

bool NormalizationPipeline::faultTolerant() const noexcept { return impl_->fault_tolerant; }

text_processing::MappedText normalize_text(const std::string& raw_text, const std::string& lang_tag,
                                           bool fault_tolerant)
{
    return NormalizationPipeline::forLanguage(lang_tag, fault_tolerant).process(raw_text);
}

} // namespace processing
