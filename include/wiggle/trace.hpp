#pragma once

#include <iosfwd>
#include <span>
#include <string>
#include <vector>

#include <wiggle/fwd.hpp>
#include <wiggle/sample.hpp>

namespace wiggle
{

// One recorded tick: `timestamp,entity_id,x,y` in CSV form.
struct TraceRecord
{
    double   timestamp = 0.0;
    EntityId entity    = 0;
    Vec2     position;
};

struct TraceTrigger
{
    EntityId entity    = 0;
    double   timestamp = 0.0;

    bool operator==(const TraceTrigger&) const = default;
};

// Parses a CSV trace. Blank lines and lines starting with '#' are skipped.
// Throws std::runtime_error naming the line number of the first malformed record.
std::vector<TraceRecord> read_trace(std::istream& in);

// Throws std::runtime_error if the file cannot be opened or parsed.
std::vector<TraceRecord> load_trace(const std::string& path);

// Feeds every record through `detector` in order, starting tracking for entities
// it has not seen yet. Returns the triggers raised by classification.
std::vector<TraceTrigger> replay_trace(std::span<const TraceRecord> trace, WiggleDetector& detector);

}  // namespace wiggle
