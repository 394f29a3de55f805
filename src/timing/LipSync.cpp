// SPDX-License-Identifier: Apache-2.0
#include "LipSync.hpp"

#include <algorithm>
#include <iterator>

namespace manzai::lipsync
{

auto findSegment(std::span<const TimingSegment> timing, double tMs) noexcept -> const TimingSegment*
{
    // Segments are ordered by startMs: locate the last one starting at or before tMs.
    auto const it = std::ranges::upper_bound(timing, tMs, std::ranges::less {}, &TimingSegment::startMs);
    if (it == timing.begin())
        return nullptr;

    auto const& candidate = *std::prev(it);
    if (tMs >= candidate.startMs && tMs < candidate.endMs)
        return &candidate;

    return nullptr;
}

auto openness(std::span<const TimingSegment> timing, double tMs) noexcept -> float
{
    auto const* segment = findSegment(timing, tMs);
    if (!segment)
        return 0.0f;

    return amplitude(segment->vowelClass);
}

} // namespace manzai::lipsync
