#include "core/gesture_session.hpp"

#include <wiggle/logger.hpp>

namespace wiggle
{

void GestureSession::start_tracking(EntityId id)
{
    if (state_ == State::Tracking && entity_id_ == id)
        return;

    if (state_ == State::Tracking)
        WIGGLE_LOG_DEBUG("session", "switching from entity {} to {}", entity_id_, id);

    clear_history();
    last_stats_ = {};
    entity_id_  = id;
    state_      = State::Tracking;
}

void GestureSession::stop_tracking()
{
    clear_history();
    last_stats_ = {};
    state_      = State::Idle;
}

bool GestureSession::on_tick(Vec2 position, double timestamp, const Thresholds& t)
{
    if (state_ != State::Tracking)
        return false;

    buffer_.set_window_seconds(t.time_window);
    if (!buffer_.append(Sample{position, timestamp}))
    {
        WIGGLE_LOG_TRACE("session",
                         "entity {}: ignoring sample ({}, {}) at {}",
                         entity_id_,
                         position.x,
                         position.y,
                         timestamp);
        return false;
    }
    buffer_.evict(timestamp);

    last_stats_ = classify(buffer_.samples(), t);
    if (!last_stats_.wiggling)
    {
        last_verdict_ = false;
        return false;
    }

    WIGGLE_LOG_INFO("session",
                    "entity {} wiggled: {} reversals, path {}, ratio {}",
                    entity_id_,
                    last_stats_.reversals,
                    last_stats_.path_length,
                    last_stats_.wiggle_ratio);
    clear_history();
    return true;
}

void GestureSession::clear_history()
{
    buffer_.clear();
    last_verdict_ = false;
}

}  // namespace wiggle
