#pragma once

#include <optional>
#include <string>
#include <vector>

namespace diff
{

// A token, or std::nullopt where the other sequence has a token with no counterpart
using AlignedToken = std::optional<std::string>;

// Two equal-length sequences; slot k of each is aligned with slot k of the other
struct Alignment
{
    std::vector<AlignedToken> first;
    std::vector<AlignedToken> second;
};

class IAligner
{
public:
    virtual ~IAligner() = default;

    // Global alignment of two token sequences. Dropping the nullopt slots of a side gives back its input.
    [[nodiscard]] virtual Alignment align(const std::vector<std::string>& first,
                                          const std::vector<std::string>& second) const = 0;
};

} // namespace diff
