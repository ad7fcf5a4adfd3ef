#pragma once

#include "core/motion_classifier.hpp"
#include "core/sample_buffer.hpp"

#include <wiggle/fwd.hpp>
#include <wiggle/thresholds.hpp>

namespace wiggle
{

// Per-entity wiggle state machine: Idle -> Tracking, firing on the rising edge of
// the classifier verdict. Firing clears the history, so a sustained wiggle has
// to refill the time window before it can fire again.
class GestureSession
{
   public:
    enum class State
    {
        Idle,
        Tracking,
    };

    explicit GestureSession(double window_seconds = 0.5) : buffer_(window_seconds) {}

    // Binds to `id`. History of a different, previously tracked entity is
    // discarded without firing. Re-binding the current entity keeps its history.
    void start_tracking(EntityId id);

    // Back to Idle; history discarded, nothing fired.
    void stop_tracking();

    // Feeds one sample. Ignored while Idle or when the timestamp does not advance.
    // Returns true if this tick is the rising edge of a wiggle; the history is
    // cleared before returning and the caller raises the trigger.
    bool on_tick(Vec2 position, double timestamp, const Thresholds& t);

    // Drops the buffered samples and the edge state. Used after a forced trigger.
    void clear_history();

    State              state() const { return state_; }
    bool               armed() const { return state_ == State::Tracking; }
    EntityId           entity_id() const { return entity_id_; }
    // Edge state. Firing clears the history, which resets it, so it reads false
    // between ticks; a sustained wiggle fires again only after the window refills.
    bool               last_verdict() const { return last_verdict_; }
    const SampleBuffer& buffer() const { return buffer_; }
    const MotionStats& last_stats() const { return last_stats_; }

   private:
    State           state_        = State::Idle;
    EntityId        entity_id_    = 0;
    SampleBuffer    buffer_;
    bool            last_verdict_ = false;
    MotionStats     last_stats_;
};

}  // namespace wiggle
