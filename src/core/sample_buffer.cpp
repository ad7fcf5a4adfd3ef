#include "core/sample_buffer.hpp"

#include <algorithm>
#include <cmath>

namespace wiggle
{

bool SampleBuffer::append(const Sample& s)
{
    if (!std::isfinite(s.timestamp) || !std::isfinite(s.position.x)
        || !std::isfinite(s.position.y))
        return false;
    if (!samples_.empty() && !(s.timestamp > samples_.back().timestamp))
        return false;
    samples_.push_back(s);
    return true;
}

std::size_t SampleBuffer::evict(double now)
{
    const double cutoff = now - window_seconds_;
    auto first_kept = std::find_if(samples_.begin(),
                                   samples_.end(),
                                   [cutoff](const Sample& s) { return s.timestamp >= cutoff; });
    const auto removed = static_cast<std::size_t>(first_kept - samples_.begin());
    samples_.erase(samples_.begin(), first_kept);
    return removed;
}

}  // namespace wiggle
