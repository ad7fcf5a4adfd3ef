#include <wiggle/selection_monitor.hpp>

#include <algorithm>

#include <wiggle/detector.hpp>

namespace wiggle
{

std::size_t SelectionMonitor::update(std::span<const SelectedEntity> selection, double timestamp)
{
    selection_.clear();
    for (const auto& e : selection)
        selection_.push_back(e.id);

    if (!detector_.enabled())
    {
        last_positions_.clear();
        return 0;
    }

    std::span<const SelectedEntity> watched = selection;
    if (!detector_.options().multi_entity && watched.size() > 1)
        watched = watched.first(1);

    auto is_watched = [&](EntityId id)
    {
        return std::any_of(
            watched.begin(), watched.end(), [id](const SelectedEntity& e) { return e.id == id; });
    };

    for (EntityId id : detector_.tracked_entities())
    {
        if (!is_watched(id))
            detector_.stop_tracking(id);
    }
    std::erase_if(last_positions_, [&](const auto& kv) { return !is_watched(kv.first); });

    std::size_t fired = 0;
    for (const auto& e : watched)
    {
        if (!detector_.start_tracking(e.id))
            continue;

        auto it = last_positions_.find(e.id);
        if (it != last_positions_.end() && it->second == e.position)
            continue;
        last_positions_[e.id] = e.position;

        if (detector_.on_tick(e.id, e.position.x, e.position.y, timestamp))
            ++fired;
    }
    return fired;
}

std::size_t SelectionMonitor::disconnect_selected()
{
    for (EntityId id : selection_)
        detector_.force_trigger(id);
    return selection_.size();
}

void SelectionMonitor::reset()
{
    selection_.clear();
    last_positions_.clear();
    detector_.stop_all();
}

}  // namespace wiggle
