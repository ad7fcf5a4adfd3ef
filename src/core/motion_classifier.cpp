#include "core/motion_classifier.hpp"

#include <algorithm>
#include <cmath>

namespace wiggle
{

static double step_dx(const Sample& a, const Sample& b)
{
    return static_cast<double>(b.position.x) - static_cast<double>(a.position.x);
}

static double step_dy(const Sample& a, const Sample& b)
{
    return static_cast<double>(b.position.y) - static_cast<double>(a.position.y);
}

static double distance(const Sample& a, const Sample& b)
{
    return std::hypot(step_dx(a, b), step_dy(a, b));
}

double path_length(std::span<const Sample> samples)
{
    double total = 0.0;
    for (std::size_t i = 1; i < samples.size(); ++i)
        total += distance(samples[i - 1], samples[i]);
    return total;
}

double net_displacement(std::span<const Sample> samples)
{
    if (samples.size() < 2)
        return 0.0;
    return distance(samples.front(), samples.back());
}

double wiggle_ratio(double path, double displacement)
{
    // No motion at all is not a wiggle, whatever the displacement floor says.
    if (path < kMinDisplacement)
        return 0.0;
    return path / std::max(displacement, kMinDisplacement);
}

int count_reversals(std::span<const Sample> samples, double min_movement)
{
    if (samples.size() < 3)
        return 0;

    int reversals = 0;
    for (std::size_t i = 2; i < samples.size(); ++i)
    {
        const Sample& a = samples[i - 2];
        const Sample& b = samples[i - 1];
        const Sample& c = samples[i];

        const double ax = step_dx(a, b);
        const double ay = step_dy(a, b);
        const double bx = step_dx(b, c);
        const double by = step_dy(b, c);

        if (std::hypot(ax, ay) <= min_movement || std::hypot(bx, by) <= min_movement)
            continue;

        if (ax * bx + ay * by < 0.0)
            ++reversals;
    }
    return reversals;
}

bool is_wiggling(const MotionStats& stats, const Thresholds& t)
{
    return stats.path_length >= t.min_total_distance_px
           && stats.reversals >= t.min_direction_changes
           && stats.wiggle_ratio >= t.wiggle_ratio_threshold;
}

MotionStats classify(std::span<const Sample> samples, const Thresholds& t)
{
    MotionStats stats;
    if (samples.size() < 2)
        return stats;

    stats.path_length      = path_length(samples);
    stats.net_displacement = net_displacement(samples);
    stats.wiggle_ratio     = wiggle_ratio(stats.path_length, stats.net_displacement);
    stats.reversals        = count_reversals(samples, t.min_movement_px);
    stats.wiggling         = is_wiggling(stats, t);
    return stats;
}

}  // namespace wiggle
