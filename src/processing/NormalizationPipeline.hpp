#pragma once

#include "ITextStage.hpp"
#include "TextProcessingTypes.hpp"

#include <memory>
#include <string>
#include <vector>

namespace processing
{

/**
 * @brief Runs text through an ordered list of stages, tracking raw-to-clean positions
 *
 * process() returns the final text together with a map whose source space is the raw text and
 * whose target space is the result, both measured in code points.
 *
 * After every stage the reported map is checked against the stage's input and output lengths.
 * In strict mode a mismatch throws ConsistencyError and a throwing stage propagates its exception.
 * In fault-tolerant mode a mismatched map is replaced by an even spread and a throwing stage is
 * skipped; both are logged and reported as warnings.
 */
class NormalizationPipeline
{
public:
    explicit NormalizationPipeline(std::vector<std::unique_ptr<ITextStage>> stages, bool fault_tolerant = false);
    ~NormalizationPipeline();

    NormalizationPipeline(NormalizationPipeline&&) noexcept;
    NormalizationPipeline& operator=(NormalizationPipeline&&) noexcept;

    /**
     * @brief Standard stage list for a language
     *
     * Character standardization and whitespace collapsing, then abbreviation and number expansion
     * for English only, then the pronunciation filter and a last whitespace collapse.
     *
     * @throws InvalidLanguageTagError
     */
    [[nodiscard]] static NormalizationPipeline forLanguage(const std::string& lang_tag, bool fault_tolerant = false);

    [[nodiscard]] text_processing::MappedText process(const std::string& raw_text) const;

    [[nodiscard]] std::vector<std::string> stageNames() const;
    [[nodiscard]] bool faultTolerant() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Convenience wrapper: NormalizationPipeline::forLanguage(lang_tag, fault_tolerant).process(raw_text)
[[nodiscard]] text_processing::MappedText normalize_text(const std::string& raw_text, const std::string& lang_tag,
                                                         bool fault_tolerant = false);

} // namespace processing
