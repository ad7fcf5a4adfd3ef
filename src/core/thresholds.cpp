#include <wiggle/thresholds.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace wiggle
{

// ─── Validation ─────────────────────────────────────────────────────────────

static void require(bool ok, const std::string& message)
{
    if (!ok)
        throw std::invalid_argument("invalid thresholds: " + message);
}

void Thresholds::validate() const
{
    require(std::isfinite(time_window) && time_window > 0.0,
            "time_window must be a positive number of seconds (got " + std::to_string(time_window)
                + ")");
    require(min_direction_changes >= 1,
            "min_direction_changes must be at least 1 (got "
                + std::to_string(min_direction_changes) + ")");
    require(std::isfinite(wiggle_ratio_threshold) && wiggle_ratio_threshold > 1.0,
            "wiggle_ratio_threshold must be greater than 1.0 (got "
                + std::to_string(wiggle_ratio_threshold) + ")");
    require(std::isfinite(min_movement_px) && min_movement_px >= 0.0,
            "min_movement_px must be non-negative (got " + std::to_string(min_movement_px) + ")");
    require(std::isfinite(min_total_distance_px) && min_total_distance_px >= 0.0,
            "min_total_distance_px must be non-negative (got "
                + std::to_string(min_total_distance_px) + ")");
}

Thresholds clamp_to_limits(const Thresholds& t, const ThresholdLimits& limits)
{
    Thresholds out;
    out.time_window = std::clamp(t.time_window, limits.min_time_window, limits.max_time_window);
    out.min_direction_changes = std::clamp(
        t.min_direction_changes, limits.min_direction_changes, limits.max_direction_changes);
    out.wiggle_ratio_threshold =
        std::clamp(t.wiggle_ratio_threshold, limits.min_wiggle_ratio, limits.max_wiggle_ratio);
    out.min_movement_px =
        std::clamp(t.min_movement_px, limits.min_movement_px, limits.max_movement_px);
    out.min_total_distance_px = std::clamp(
        t.min_total_distance_px, limits.min_total_distance_px, limits.max_total_distance_px);
    return out;
}

// ─── Presets ────────────────────────────────────────────────────────────────

Thresholds thresholds_for(Sensitivity s, const Thresholds& base)
{
    Thresholds t = base;
    switch (s)
    {
        case Sensitivity::Low:
            t.min_direction_changes  = 5;
            t.wiggle_ratio_threshold = 4.0;
            t.min_total_distance_px  = 150.0;
            break;
        case Sensitivity::Medium:
            t.min_direction_changes  = 3;
            t.wiggle_ratio_threshold = 3.0;
            t.min_total_distance_px  = 100.0;
            break;
        case Sensitivity::High:
            t.min_direction_changes  = 2;
            t.wiggle_ratio_threshold = 2.0;
            t.min_total_distance_px  = 50.0;
            break;
    }
    return t;
}

std::optional<Sensitivity> sensitivity_from_string(std::string_view name)
{
    std::string lower(name);
    std::transform(lower.begin(),
                   lower.end(),
                   lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "low")
        return Sensitivity::Low;
    if (lower == "medium")
        return Sensitivity::Medium;
    if (lower == "high")
        return Sensitivity::High;
    return std::nullopt;
}

std::string to_string(Sensitivity s)
{
    switch (s)
    {
        case Sensitivity::Low:
            return "low";
        case Sensitivity::Medium:
            return "medium";
        case Sensitivity::High:
            return "high";
    }
    return "unknown";
}

}  // namespace wiggle
