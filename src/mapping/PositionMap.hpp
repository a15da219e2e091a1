#pragma once

#include "PositionMapErrors.hpp"

#include <cstddef>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace mapping
{

/**
 * @brief Target-space span associated with one source index.
 *
 * A span with stop <= start is empty. Its start still anchors a position in the target
 * space, which inverse() and concat() rely on, so it must not be normalized away.
 */
struct Span
{
    std::size_t start = 0;
    std::size_t stop = 0;

    [[nodiscard]] bool empty() const noexcept { return stop <= start; }

    [[nodiscard]] std::size_t size() const noexcept { return stop > start ? stop - start : 0; }

    bool operator==(const Span& other) const = default;
};

/**
 * @brief Monotone many-to-many mapping from a source index space to a target index space.
 *
 * Source index i maps to target positions [spans[i].start, spans[i].stop). A source range
 * [i, j) maps to [spans[i].start, spans[j - 1].stop). Both the start and the stop columns are
 * non-decreasing, and overlapping consecutive spans are allowed.
 *
 * Instances are immutable: every operation returns a new map.
 */
class PositionMap
{
public:
    using const_iterator = std::vector<Span>::const_iterator;

    // Empty 0x0 map
    PositionMap() = default;

    /**
     * @brief Builds a map from explicit spans
     * @param spans One span per source index
     * @param target_len Size of the target space
     * @throws InvalidMapError if a bound exceeds target_len or a column decreases
     */
    PositionMap(std::vector<Span> spans, std::size_t target_len);

    /**
     * @brief Same as above, additionally checking spans.size() == source_len
     */
    PositionMap(std::vector<Span> spans, std::size_t source_len, std::size_t target_len);

    [[nodiscard]] std::size_t sourceLength() const noexcept { return spans_.size(); }
    [[nodiscard]] std::size_t targetLength() const noexcept { return target_len_; }
    [[nodiscard]] const std::vector<Span>& spans() const noexcept { return spans_; }

    const_iterator begin() const noexcept { return spans_.begin(); }
    const_iterator end() const noexcept { return spans_.end(); }

    // Span of the unit source range [index, index + 1)
    [[nodiscard]] Span operator[](std::size_t index) const;

    /**
     * @brief Maps the source range [begin, end) to a target span
     *
     * Indices are clamped to the source length. An empty range yields a degenerate span anchored
     * between the neighbouring entries instead of failing.
     *
     * @throws UnsupportedStepError if step != 1
     */
    [[nodiscard]] Span lookup(std::size_t begin, std::size_t end, std::size_t step = 1) const;

    /**
     * @brief Projects per-source values into the target space
     *
     * Each value is written to every target position of its span. Later source indices win on
     * overlap, and target positions nothing maps to receive @p fill.
     *
     * @throws LengthMismatchError if data.size() != sourceLength()
     */
    template <typename T>
    [[nodiscard]] std::vector<T> project(const std::vector<T>& data, const T& fill = T{}) const;

    // Target-to-source map. Bijective: inverse().inverse() == *this, gaps and overlaps included.
    [[nodiscard]] PositionMap inverse() const;

    // With *this mapping X to Y and other mapping Y to Z, returns the X to Z map
    [[nodiscard]] PositionMap compose(const PositionMap& other) const;

    // With *this mapping Xi to Yi and other mapping Xj to Yj, returns cat(Xi, Xj) to cat(Yi, Yj)
    [[nodiscard]] PositionMap concat(const PositionMap& other) const;

    [[nodiscard]] static PositionMap concatAll(const std::vector<PositionMap>& maps);

    bool operator==(const PositionMap& other) const = default;

    // "<3x4 map: [(0, 1), (1, 3), (3, 4)]>"
    [[nodiscard]] std::string toString() const;

    // Canonical constructors

    [[nodiscard]] static PositionMap empty();
    [[nodiscard]] static PositionMap identity(std::size_t length);

    /**
     * @brief Spreads the smaller space evenly over the larger one
     *
     * For lerp(6, 12), source range [2, 3) maps to [4, 6). Target multiplicities differ by at most one.
     */
    [[nodiscard]] static PositionMap lerp(std::size_t source_len, std::size_t target_len);

    // Every source index maps to the whole target space
    [[nodiscard]] static PositionMap full(std::size_t source_len, std::size_t target_len);

    // Identity onto the sub-range [start, end) of a target space of size target_len. Inverse of eye().
    [[nodiscard]] static PositionMap slice(std::size_t start, std::size_t end, std::size_t target_len);

    // Elements outside [start, end) of a space of size length map to nothing. Inverse of slice().
    [[nodiscard]] static PositionMap eye(std::size_t start, std::size_t end, std::size_t length);

    // Index i maps to [positions[i], positions[i] + 1)
    [[nodiscard]] static PositionMap fromOneToOne(const std::vector<std::size_t>& positions, std::size_t target_len);

    // Index i maps to a run of ranges[i] target positions, runs laid end to end
    [[nodiscard]] static PositionMap fromRanges(const std::vector<std::size_t>& ranges);

    /**
     * @brief Composes maps named "<source>2<target>" into the map called @p mapping_name
     *
     * composeByName("a2c", {{"a2b", a2b}, {"b2c", b2c}}) returns a2b.compose(b2c). Unused maps are ignored.
     *
     * @throws InvalidMapNameError, NoPathFoundError, CycleDetectedError
     */
    [[nodiscard]] static PositionMap composeByName(const std::string& mapping_name,
                                                   const std::vector<std::pair<std::string, PositionMap>>& mappings);

private:
    void validate() const;

    std::vector<Span> spans_;
    std::size_t target_len_ = 0;
};

inline PositionMap operator*(const PositionMap& lhs, const PositionMap& rhs) { return lhs.compose(rhs); }

inline PositionMap operator+(const PositionMap& lhs, const PositionMap& rhs) { return lhs.concat(rhs); }

std::ostream& operator<<(std::ostream& os, const PositionMap& map);
std::ostream& operator<<(std::ostream& os, const Span& span);

template <typename T>
std::vector<T> PositionMap::project(const std::vector<T>& data, const T& fill) const
{
    if (data.size() != spans_.size())
    {
        throw LengthMismatchError("Cannot project " + std::to_string(data.size()) + " items through a map with " +
                                  std::to_string(spans_.size()) + " source positions");
    }

    std::vector<T> projected(target_len_, fill);
    for (std::size_t i = 0; i < spans_.size(); ++i)
    {
        for (std::size_t pos = spans_[i].start; pos < spans_[i].stop; ++pos)
            projected[pos] = data[i];
    }
    return projected;
}

} // namespace mapping
