#include <wiggle/detector.hpp>

#include <algorithm>

#include "core/gesture_session.hpp"

#include <wiggle/logger.hpp>

namespace wiggle
{

WiggleDetector::WiggleDetector(const Thresholds& thresholds, DetectorOptions options)
    : thresholds_(thresholds), options_(options)
{
    thresholds_.validate();
}

WiggleDetector::~WiggleDetector() = default;

// ─── Arm / disarm ───────────────────────────────────────────────────────────

void WiggleDetector::enable()
{
    if (enabled_)
        return;
    enabled_ = true;
    WIGGLE_LOG_INFO("detector", "wiggle detection enabled");
}

void WiggleDetector::disable()
{
    if (!enabled_)
        return;
    stop_all();
    enabled_ = false;
    WIGGLE_LOG_INFO("detector", "wiggle detection disabled");
}

void WiggleDetector::set_thresholds(const Thresholds& thresholds)
{
    thresholds.validate();
    thresholds_ = thresholds;
}

// ─── Tracking ───────────────────────────────────────────────────────────────

bool WiggleDetector::start_tracking(EntityId id)
{
    if (!enabled_)
        return false;

    if (sessions_.count(id))
        return true;

    std::unique_ptr<GestureSession> session;
    if (!options_.multi_entity && !sessions_.empty())
    {
        // Reuse the single session; binding it to the new entity drops the old history.
        auto it = sessions_.begin();
        session = std::move(it->second);
        sessions_.erase(it);
    }
    else
    {
        session = std::make_unique<GestureSession>(thresholds_.time_window);
        WIGGLE_LOG_DEBUG("detector", "tracking entity {}", id);
    }

    session->start_tracking(id);
    sessions_.emplace(id, std::move(session));
    return true;
}

void WiggleDetector::stop_tracking(EntityId id)
{
    auto it = sessions_.find(id);
    if (it == sessions_.end())
        return;

    it->second->stop_tracking();
    sessions_.erase(it);
    WIGGLE_LOG_DEBUG("detector", "stopped tracking entity {}", id);
}

void WiggleDetector::stop_all()
{
    for (auto& [id, session] : sessions_)
        session->stop_tracking();
    sessions_.clear();
}

bool WiggleDetector::is_tracking(EntityId id) const
{
    return sessions_.count(id) != 0;
}

std::vector<EntityId> WiggleDetector::tracked_entities() const
{
    std::vector<EntityId> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_)
        ids.push_back(id);
    std::sort(ids.begin(), ids.end());
    return ids;
}

const GestureSession* WiggleDetector::session(EntityId id) const
{
    auto it = sessions_.find(id);
    return it != sessions_.end() ? it->second.get() : nullptr;
}

// ─── Per-frame input ────────────────────────────────────────────────────────

bool WiggleDetector::on_tick(EntityId id, float x, float y, double timestamp)
{
    if (!enabled_)
        return false;

    auto it = sessions_.find(id);
    if (it == sessions_.end())
    {
        WIGGLE_LOG_TRACE("detector", "tick for untracked entity {} ignored", id);
        return false;
    }

    if (!it->second->on_tick(Vec2{x, y}, timestamp, thresholds_))
        return false;

    raise(id);
    return true;
}

// ─── Output ─────────────────────────────────────────────────────────────────

void WiggleDetector::force_trigger(EntityId id)
{
    auto it = sessions_.find(id);
    if (it != sessions_.end())
        it->second->clear_history();

    WIGGLE_LOG_INFO("detector", "forced trigger for entity {}", id);
    raise(id);
}

std::optional<MotionStats> WiggleDetector::last_stats(EntityId id) const
{
    auto it = sessions_.find(id);
    if (it == sessions_.end())
        return std::nullopt;
    return it->second->last_stats();
}

void WiggleDetector::raise(EntityId id)
{
    ++trigger_count_;
    if (on_trigger_)
        on_trigger_(id);
}

}  // namespace wiggle
