#pragma once

#include <cstddef>

#include <wiggle/detector.hpp>
#include <wiggle/fwd.hpp>

namespace wiggle
{

// The host's editable graph, seen from the detector: the only operation a
// trigger needs is "remove every link touching this entity".
class ConnectionTarget
{
   public:
    virtual ~ConnectionTarget() = default;

    // Removes all connections to and from `id`. Returns how many were removed.
    virtual std::size_t disconnect_all(EntityId id) = 0;
};

// Trigger callback that disconnects the entity on `target` and logs the result.
// `target` must outlive the returned callback.
WiggleDetector::TriggerCallback make_disconnect_handler(ConnectionTarget& target);

}  // namespace wiggle
