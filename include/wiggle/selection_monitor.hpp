#pragma once

#include <cstddef>
#include <span>
#include <unordered_map>
#include <vector>

#include <wiggle/fwd.hpp>
#include <wiggle/sample.hpp>

namespace wiggle
{

// One selected entity as the host sees it this frame.
struct SelectedEntity
{
    EntityId id = 0;
    Vec2     position;
};

// Per-frame host adapter. Turns "these entities are selected and here is where
// they are" into the detector's start/stop/tick calls:
//  - newly selected entities start tracking, deselected ones stop;
//    without multi-entity mode only the first selected entity is tracked;
//  - a sample is only fed when the entity moved since the previous frame.
class SelectionMonitor
{
   public:
    // `detector` must outlive the monitor.
    explicit SelectionMonitor(WiggleDetector& detector) : detector_(detector) {}

    // Returns the number of triggers fired during this frame.
    std::size_t update(std::span<const SelectedEntity> selection, double timestamp);

    // Forces the trigger for every entity of the last selection. Returns how many.
    std::size_t disconnect_selected();

    // Forgets the selection and positions and stops all tracking.
    void reset();

    const std::vector<EntityId>& selection() const { return selection_; }

   private:
    WiggleDetector&                  detector_;
    std::vector<EntityId>            selection_;
    std::unordered_map<EntityId, Vec2> last_positions_;
};

}  // namespace wiggle
