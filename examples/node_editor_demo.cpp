// Simulated node editor: a user drags node 2 smoothly, then grabs node 1 and
// shakes it until its links come off.

#include <iostream>
#include <map>
#include <set>
#include <utility>
#include <wiggle/wiggle.hpp>

using namespace wiggle;

// Links stored as (from, to) pairs.
class NodeGraph : public ConnectionTarget
{
   public:
    void link(EntityId from, EntityId to) { links_.insert({from, to}); }

    std::size_t disconnect_all(EntityId id) override
    {
        return std::erase_if(links_,
                             [id](const auto& l) { return l.first == id || l.second == id; });
    }

    std::size_t link_count() const { return links_.size(); }

   private:
    std::set<std::pair<EntityId, EntityId>> links_;
};

int main()
{
    Logger::instance().set_level(LogLevel::Debug);
    Logger::instance().add_sink(sinks::console_sink());

    NodeGraph graph;
    graph.link(1, 2);
    graph.link(1, 3);
    graph.link(2, 3);

    WiggleDetector   detector(thresholds_for(Sensitivity::Medium));
    SelectionMonitor monitor(detector);
    detector.set_on_trigger(make_disconnect_handler(graph));

    double t = 0.0;
    const double frame = 1.0 / 60.0;

    // Smooth drag of node 2 to the right: never a wiggle.
    for (int i = 0; i < 60; ++i, t += frame)
    {
        SelectedEntity sel[] = {{2, {100.0f + 4.0f * i, 50.0f}}};
        monitor.update(sel, t);
    }

    // Shake node 1 left and right by 40 px every frame.
    for (int i = 0; i < 30; ++i, t += frame)
    {
        SelectedEntity sel[] = {{1, {(i % 2 == 0) ? 0.0f : 40.0f, 0.0f}}};
        monitor.update(sel, t);
    }

    std::cout << "links left: " << graph.link_count() << ", triggers: " << detector.trigger_count()
              << "\n";
    return 0;
}
