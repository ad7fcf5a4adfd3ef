#pragma once

// Umbrella header: include this to get the whole public API.

#include <wiggle/connection_target.hpp>
#include <wiggle/detector.hpp>
#include <wiggle/fwd.hpp>
#include <wiggle/logger.hpp>
#include <wiggle/motion_stats.hpp>
#include <wiggle/sample.hpp>
#include <wiggle/selection_monitor.hpp>
#include <wiggle/thresholds.hpp>
#include <wiggle/trace.hpp>
