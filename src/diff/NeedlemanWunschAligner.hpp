#pragma once

#include "IAligner.hpp"

namespace diff
{

/**
 * @brief Needleman-Wunsch global alignment on whole tokens
 *
 * Scores +match for identical tokens, +mismatch otherwise and +gap per unpaired token. On equal
 * scores the traceback prefers pairing tokens, then skipping a token of the first sequence.
 */
class NeedlemanWunschAligner : public IAligner
{
public:
    struct Scores
    {
        int match = 1;
        int mismatch = -1;
        int gap = -1;
    };

    NeedlemanWunschAligner() = default;
    explicit NeedlemanWunschAligner(Scores scores)
        : scores_(scores)
    {
    }

    [[nodiscard]] Alignment align(const std::vector<std::string>& first,
                                  const std::vector<std::string>& second) const override;

private:
    Scores scores_;
};

} // namespace diff
