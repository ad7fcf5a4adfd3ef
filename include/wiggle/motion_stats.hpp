#pragma once

namespace wiggle
{

// Measurements over one buffer snapshot, plus the verdict derived from them.
struct MotionStats
{
    double path_length      = 0.0;
    double net_displacement = 0.0;
    double wiggle_ratio     = 0.0;
    int    reversals        = 0;
    bool   wiggling         = false;
};

}  // namespace wiggle
