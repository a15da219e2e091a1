#include "PositionMap.hpp"

#include <algorithm>
#include <ostream>
#include <set>
#include <sstream>

namespace mapping
{

namespace
{

std::string shapeOf(const PositionMap& map)
{
    return std::to_string(map.sourceLength()) + "x" + std::to_string(map.targetLength());
}

// Splits "a2b" into ("a", "b")
std::pair<std::string, std::string> splitMapName(const std::string& name)
{
    const auto sep = name.find('2');
    if (sep == std::string::npos || name.find('2', sep + 1) != std::string::npos)
    {
        throw InvalidMapNameError("Map name '" + name + "' does not follow the <source>2<target> convention");
    }
    return { name.substr(0, sep), name.substr(sep + 1) };
}

} // anonymous namespace

PositionMap::PositionMap(std::vector<Span> spans, std::size_t target_len)
    : spans_(std::move(spans))
    , target_len_(target_len)
{
    validate();
}

PositionMap::PositionMap(std::vector<Span> spans, std::size_t source_len, std::size_t target_len)
    : spans_(std::move(spans))
    , target_len_(target_len)
{
    if (spans_.size() != source_len)
    {
        throw InvalidMapError("Expected " + std::to_string(source_len) + " spans, got " +
                              std::to_string(spans_.size()));
    }
    validate();
}

void PositionMap::validate() const
{
    for (std::size_t i = 0; i < spans_.size(); ++i)
    {
        const Span& span = spans_[i];
        if (span.start > target_len_ || span.stop > target_len_)
        {
            std::ostringstream oss;
            oss << "Span " << span << " at index " << i << " is out of bounds for a target of size " << target_len_;
            throw InvalidMapError(oss.str());
        }
        if (i > 0 && (span.start < spans_[i - 1].start || span.stop < spans_[i - 1].stop))
        {
            std::ostringstream oss;
            oss << "Span starts/stops must be non-decreasing: " << spans_[i - 1] << " followed by " << span
                << " at index " << i;
            throw InvalidMapError(oss.str());
        }
    }
}

Span PositionMap::operator[](std::size_t index) const
{
    return lookup(index, index + 1);
}

Span PositionMap::lookup(std::size_t begin, std::size_t end, std::size_t step) const
{
    if (step != 1)
        throw UnsupportedStepError("Only steps of 1 are supported, got " + std::to_string(step));

    const std::size_t source_len = spans_.size();
    const std::size_t lo = std::min(begin, source_len);
    const std::size_t hi = std::min(end, source_len);

    if (lo < hi)
        return { spans_[lo].start, spans_[hi - 1].stop };

    // Empty range: anchor on the neighbours so that composition stays consistent
    const std::size_t start = lo < source_len ? spans_[lo].start : target_len_;
    const std::size_t stop = lo > 0 ? spans_[lo - 1].stop : 0;
    return { start, std::max(start, stop) };
}

PositionMap PositionMap::inverse() const
{
    // Target position y maps back to [#{i : stop_i <= y}, #{i : start_i <= y}). Both counts only
    // change at the points of interest where a start or stop value steps up, so one sweep suffices.
    const std::size_t source_len = spans_.size();
    std::vector<Span> inverted(target_len_);

    std::size_t stops_passed = 0;
    std::size_t starts_passed = 0;
    for (std::size_t y = 0; y < target_len_; ++y)
    {
        while (stops_passed < source_len && spans_[stops_passed].stop <= y)
            ++stops_passed;
        while (starts_passed < source_len && spans_[starts_passed].start <= y)
            ++starts_passed;
        inverted[y] = { stops_passed, starts_passed };
    }

    return PositionMap(std::move(inverted), source_len);
}

PositionMap PositionMap::compose(const PositionMap& other) const
{
    if (target_len_ != other.sourceLength())
    {
        throw DimensionMismatchError("Cannot compose " + shapeOf(*this) + " map with " + shapeOf(other) + " map");
    }

    std::vector<Span> composed;
    composed.reserve(spans_.size());
    for (const Span& span : spans_)
        composed.push_back(other.lookup(span.start, span.stop));

    return PositionMap(std::move(composed), other.target_len_);
}

PositionMap PositionMap::concat(const PositionMap& other) const
{
    return concatAll({ *this, other });
}

PositionMap PositionMap::concatAll(const std::vector<PositionMap>& maps)
{
    std::size_t total_source = 0;
    for (const auto& map : maps)
        total_source += map.sourceLength();

    std::vector<Span> spans;
    spans.reserve(total_source);
    std::size_t offset = 0;
    for (const auto& map : maps)
    {
        for (const Span& span : map.spans_)
            spans.push_back({ span.start + offset, span.stop + offset });
        offset += map.target_len_;
    }

    return PositionMap(std::move(spans), offset);
}

std::string PositionMap::toString() const
{
    std::ostringstream oss;
    oss << "<" << shapeOf(*this) << " map: [";
    for (std::size_t i = 0; i < spans_.size(); ++i)
    {
        if (i > 0)
            oss << ", ";
        oss << spans_[i];
    }
    oss << "]>";
    return oss.str();
}

PositionMap PositionMap::empty()
{
    return PositionMap({}, 0);
}

PositionMap PositionMap::identity(std::size_t length)
{
    return slice(0, length, length);
}

PositionMap PositionMap::lerp(std::size_t source_len, std::size_t target_len)
{
    const std::size_t low = std::min(source_len, target_len);
    const std::size_t high = std::max(source_len, target_len);

    // Evenly spaced breakpoints over the smaller space, one per element of the larger one
    std::vector<Span> spans;
    spans.reserve(high);
    for (std::size_t k = 0; k < high; ++k)
    {
        const std::size_t idx = k * low / high;
        spans.push_back({ idx, std::min(idx + 1, low) });
    }

    PositionMap high_to_low(std::move(spans), low);
    return target_len == low ? high_to_low : high_to_low.inverse();
}

PositionMap PositionMap::full(std::size_t source_len, std::size_t target_len)
{
    return PositionMap(std::vector<Span>(source_len, Span{ 0, target_len }), target_len);
}

PositionMap PositionMap::slice(std::size_t start, std::size_t end, std::size_t target_len)
{
    if (start > end || end > target_len)
    {
        throw InvalidMapError("Invalid slice " + std::to_string(start) + ":" + std::to_string(end) + " in " +
                              std::to_string(target_len));
    }

    std::vector<Span> spans;
    spans.reserve(end - start);
    for (std::size_t pos = start; pos < end; ++pos)
        spans.push_back({ pos, pos + 1 });
    return PositionMap(std::move(spans), target_len);
}

PositionMap PositionMap::eye(std::size_t start, std::size_t end, std::size_t length)
{
    if (start > end || end > length)
    {
        throw InvalidMapError("Invalid eye " + std::to_string(start) + ":" + std::to_string(end) + " in " +
                              std::to_string(length));
    }
    return concatAll({ full(start, 0), identity(end - start), full(length - end, 0) });
}

PositionMap PositionMap::fromOneToOne(const std::vector<std::size_t>& positions, std::size_t target_len)
{
    std::vector<Span> spans;
    spans.reserve(positions.size());
    for (std::size_t pos : positions)
        spans.push_back({ pos, pos + 1 });
    return PositionMap(std::move(spans), target_len);
}

PositionMap PositionMap::fromRanges(const std::vector<std::size_t>& ranges)
{
    std::vector<Span> spans;
    spans.reserve(ranges.size());
    std::size_t target_pos = 0;
    for (std::size_t run : ranges)
    {
        spans.push_back({ target_pos, target_pos + run });
        target_pos += run;
    }
    return PositionMap(std::move(spans), target_pos);
}

PositionMap PositionMap::composeByName(const std::string& mapping_name,
                                       const std::vector<std::pair<std::string, PositionMap>>& mappings)
{
    const auto [source_name, target_name] = splitMapName(mapping_name);

    std::vector<std::string> source_names;
    std::vector<std::string> target_names;
    for (const auto& [name, map] : mappings)
    {
        auto [src, dst] = splitMapName(name);
        source_names.push_back(std::move(src));
        target_names.push_back(std::move(dst));
    }

    auto indexOf = [](const std::vector<std::string>& names, const std::string& name)
    {
        return static_cast<std::size_t>(std::find(names.begin(), names.end(), name) - names.begin());
    };

    if (indexOf(source_names, source_name) == source_names.size())
        throw NoPathFoundError("Source name '" + source_name + "' not found among the given maps");
    if (indexOf(target_names, target_name) == target_names.size())
        throw NoPathFoundError("Target name '" + target_name + "' not found among the given maps");

    std::string dim_name = source_name;
    if (dim_name == target_name)
        return identity(mappings[indexOf(source_names, dim_name)].second.sourceLength());

    std::set<std::size_t> seen;
    PositionMap composed;
    bool has_composed = false;
    while (dim_name != target_name)
    {
        const std::size_t map_idx = indexOf(source_names, dim_name);
        if (map_idx == source_names.size())
            throw NoPathFoundError("No map leaves '" + dim_name + "' on the way to '" + target_name + "'");
        if (!seen.insert(map_idx).second)
            throw CycleDetectedError("Cycle detected at '" + mappings[map_idx].first + "' while resolving '" +
                                     mapping_name + "'");

        const PositionMap& next = mappings[map_idx].second;
        composed = has_composed ? composed.compose(next) : next;
        has_composed = true;
        dim_name = target_names[map_idx];
    }

    return composed;
}

std::ostream& operator<<(std::ostream& os, const Span& span)
{
    return os << "(" << span.start << ", " << span.stop << ")";
}

std::ostream& operator<<(std::ostream& os, const PositionMap& map)
{
    return os << map.toString();
}

} // namespace mapping
