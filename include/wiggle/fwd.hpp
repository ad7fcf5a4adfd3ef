#pragma once

#include <cstdint>

namespace wiggle
{

// Opaque handle of a tracked entity. The host owns the mapping to its own objects.
using EntityId = std::uint64_t;

struct Vec2;
struct Sample;
struct Thresholds;
struct ThresholdLimits;
struct DetectorOptions;
struct MotionStats;

class SampleBuffer;
class GestureSession;
class WiggleDetector;
class SelectionMonitor;
class ConnectionTarget;
class Logger;

struct TraceRecord;
struct TraceTrigger;

}  // namespace wiggle
