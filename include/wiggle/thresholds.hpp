#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace wiggle
{

// Resolved detection thresholds. The engine only reads these; hosts build them
// directly or through thresholds_for().
struct Thresholds
{
    double time_window            = 0.5;    // seconds of history considered
    int    min_direction_changes  = 3;      // reversals required
    double wiggle_ratio_threshold = 3.0;    // path length / net displacement
    double min_movement_px        = 5.0;    // per-step length a reversal must exceed
    double min_total_distance_px  = 100.0;  // path length floor

    // Throws std::invalid_argument naming the first offending field.
    void validate() const;

    bool operator==(const Thresholds&) const = default;
};

// Inclusive ranges of the "advanced" settings a host exposes to users.
struct ThresholdLimits
{
    double min_time_window = 0.1;
    double max_time_window = 2.0;
    int    min_direction_changes = 1;
    int    max_direction_changes = 10;
    double min_wiggle_ratio = 1.5;
    double max_wiggle_ratio = 10.0;
    double min_movement_px = 1.0;
    double max_movement_px = 50.0;
    double min_total_distance_px = 20.0;
    double max_total_distance_px = 500.0;
};

// Clamps every field of `t` into `limits`. Finite input always passes validate() afterwards.
Thresholds clamp_to_limits(const Thresholds& t, const ThresholdLimits& limits = {});

enum class Sensitivity
{
    Low,     // requires aggressive wiggling
    Medium,
    High,    // detects gentle wiggling
};

// Applies the preset's reversal, ratio and distance values on top of `base`.
// time_window and min_movement_px are taken from `base` unchanged.
Thresholds thresholds_for(Sensitivity s, const Thresholds& base = {});

std::optional<Sensitivity> sensitivity_from_string(std::string_view name);
std::string                to_string(Sensitivity s);

struct DetectorOptions
{
    // Track every started entity independently instead of one at a time.
    bool multi_entity = false;
};

}  // namespace wiggle
