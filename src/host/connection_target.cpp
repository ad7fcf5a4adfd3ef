#include <wiggle/connection_target.hpp>
#include <wiggle/logger.hpp>

namespace wiggle
{

WiggleDetector::TriggerCallback make_disconnect_handler(ConnectionTarget& target)
{
    return [&target](EntityId id)
    {
        std::size_t removed = target.disconnect_all(id);
        if (removed > 0)
            WIGGLE_LOG_INFO("host", "disconnected entity {} ({} links)", id, removed);
        else
            WIGGLE_LOG_DEBUG("host", "entity {} had no links to remove", id);
    };
}

}  // namespace wiggle
