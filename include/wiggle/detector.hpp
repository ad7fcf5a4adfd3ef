#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include <wiggle/fwd.hpp>
#include <wiggle/motion_stats.hpp>
#include <wiggle/thresholds.hpp>

namespace wiggle
{

// Top-level wiggle detection controller.
//
// Owns the global enable flag, the active thresholds and one GestureSession per
// tracked entity. The host drives it synchronously: start_tracking() when an
// entity becomes the drag target, on_tick() once per frame with its position,
// stop_tracking() when it is released. The trigger callback runs on the rising
// edge of a wiggle and is where the host severs the entity's connections.
//
// Not thread-safe. Hosts ticking from several threads must serialise calls.
class WiggleDetector
{
   public:
    using TriggerCallback = std::function<void(EntityId)>;

    // Throws std::invalid_argument if `thresholds` fails validation.
    explicit WiggleDetector(const Thresholds& thresholds = {}, DetectorOptions options = {});
    ~WiggleDetector();

    WiggleDetector(const WiggleDetector&)            = delete;
    WiggleDetector& operator=(const WiggleDetector&) = delete;

    // --- Global arm / disarm ---

    void enable();
    // Stops every session; on_tick() and start_tracking() are ignored until enable().
    void disable();
    bool enabled() const { return enabled_; }

    // --- Configuration ---

    // Validated like the constructor. Applies from the next tick; buffered history is kept.
    void              set_thresholds(const Thresholds& thresholds);
    const Thresholds& thresholds() const { return thresholds_; }

    const DetectorOptions& options() const { return options_; }

    // --- Tracking ---

    // In single-entity mode a different tracked entity is dropped first.
    // Returns false if detection is disabled.
    bool start_tracking(EntityId id);
    void stop_tracking(EntityId id);
    void stop_all();

    bool                  is_tracking(EntityId id) const;
    std::vector<EntityId> tracked_entities() const;
    std::size_t           session_count() const { return sessions_.size(); }

    // Session for `id`, or nullptr if it is not tracked.
    const GestureSession* session(EntityId id) const;

    // --- Per-frame input ---

    // No-op for untracked entities and while disabled. Returns true if the trigger fired.
    bool on_tick(EntityId id, float x, float y, double timestamp);

    // --- Output ---

    // Raises the trigger for `id` without classification, enabled or not.
    // A tracked entity's history is cleared.
    void force_trigger(EntityId id);

    void set_on_trigger(TriggerCallback cb) { on_trigger_ = std::move(cb); }

    // Number of triggers raised since construction, forced ones included.
    std::size_t trigger_count() const { return trigger_count_; }

    // Measurements of the most recent classified tick for `id`.
    std::optional<MotionStats> last_stats(EntityId id) const;

   private:
    void raise(EntityId id);

    Thresholds      thresholds_;
    DetectorOptions options_;
    bool            enabled_       = true;
    std::size_t     trigger_count_ = 0;
    TriggerCallback on_trigger_;

    std::unordered_map<EntityId, std::unique_ptr<GestureSession>> sessions_;
};

}  // namespace wiggle
