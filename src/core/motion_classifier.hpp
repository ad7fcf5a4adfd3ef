#pragma once

#include <span>

#include <wiggle/motion_stats.hpp>
#include <wiggle/sample.hpp>
#include <wiggle/thresholds.hpp>

namespace wiggle
{

// Displacement floor for the wiggle ratio, in position units. Below it a path
// doubling back onto its start still yields a finite, very large ratio.
inline constexpr double kMinDisplacement = 0.1;

// Sum of distances between consecutive samples.
[[nodiscard]] double path_length(std::span<const Sample> samples);

// Distance from the first to the last sample. 0 for fewer than two samples.
[[nodiscard]] double net_displacement(std::span<const Sample> samples);

// path / max(displacement, kMinDisplacement), or 0 when there is no meaningful motion.
[[nodiscard]] double wiggle_ratio(double path, double displacement);

// Number of consecutive step pairs pointing in opposite directions (negative dot
// product) where both steps are longer than `min_movement`.
[[nodiscard]] int count_reversals(std::span<const Sample> samples, double min_movement);

// True when every threshold is met: distance floor, reversal count and ratio.
[[nodiscard]] bool is_wiggling(const MotionStats& stats, const Thresholds& t);

// Computes all measurements and the verdict. Fewer than two samples is never wiggling.
[[nodiscard]] MotionStats classify(std::span<const Sample> samples, const Thresholds& t);

}  // namespace wiggle
