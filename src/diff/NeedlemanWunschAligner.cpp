#include "NeedlemanWunschAligner.hpp"

#include <algorithm>
#include <cstdint>

namespace diff
{

namespace
{

enum class Step : std::uint8_t
{
    Both,
    First,
    Second
};

} // anonymous namespace

Alignment NeedlemanWunschAligner::align(const std::vector<std::string>& first,
                                        const std::vector<std::string>& second) const
{
    const std::size_t rows = first.size() + 1;
    const std::size_t stride = second.size() + 1;
    auto idx = [stride](std::size_t i, std::size_t j) { return i * stride + j; };

    std::vector<int> score(rows * stride, 0);
    std::vector<Step> back(rows * stride, Step::Both);

    for (std::size_t i = 1; i < rows; ++i)
    {
        score[idx(i, 0)] = score[idx(i - 1, 0)] + scores_.gap;
        back[idx(i, 0)] = Step::First;
    }
    for (std::size_t j = 1; j < stride; ++j)
    {
        score[idx(0, j)] = score[idx(0, j - 1)] + scores_.gap;
        back[idx(0, j)] = Step::Second;
    }

    for (std::size_t i = 1; i < rows; ++i)
    {
        for (std::size_t j = 1; j < stride; ++j)
        {
            const int pair_score = first[i - 1] == second[j - 1] ? scores_.match : scores_.mismatch;
            const int both = score[idx(i - 1, j - 1)] + pair_score;
            const int skip_first = score[idx(i - 1, j)] + scores_.gap;
            const int skip_second = score[idx(i, j - 1)] + scores_.gap;

            if (both >= skip_first && both >= skip_second)
            {
                score[idx(i, j)] = both;
                back[idx(i, j)] = Step::Both;
            }
            else if (skip_first >= skip_second)
            {
                score[idx(i, j)] = skip_first;
                back[idx(i, j)] = Step::First;
            }
            else
            {
                score[idx(i, j)] = skip_second;
                back[idx(i, j)] = Step::Second;
            }
        }
    }

    // Traceback from the bottom-right corner, built in reverse
    Alignment alignment;
    std::size_t i = first.size();
    std::size_t j = second.size();
    while (i > 0 || j > 0)
    {
        switch (back[idx(i, j)])
        {
        case Step::Both:
            --i;
            --j;
            alignment.first.emplace_back(first[i]);
            alignment.second.emplace_back(second[j]);
            break;
        case Step::First:
            --i;
            alignment.first.emplace_back(first[i]);
            alignment.second.emplace_back(std::nullopt);
            break;
        case Step::Second:
            --j;
            alignment.first.emplace_back(std::nullopt);
            alignment.second.emplace_back(second[j]);
            break;
        }
    }

    std::reverse(alignment.first.begin(), alignment.first.end());
    std::reverse(alignment.second.begin(), alignment.second.end());
    return alignment;
}

} // namespace diff
