#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include <wiggle/sample.hpp>

namespace wiggle
{

// Chronological, time-windowed sample history of one entity.
// Samples are kept strictly ascending by timestamp; the window bounds duration, not count.
class SampleBuffer
{
   public:
    explicit SampleBuffer(double window_seconds = 0.5) : window_seconds_(window_seconds) {}

    // Appends `s` unless its timestamp is not strictly after the newest sample
    // or any of its fields is NaN or infinite. Returns false when rejected.
    bool append(const Sample& s);

    // Drops every sample older than now - window_seconds. Returns the number removed.
    std::size_t evict(double now);

    void clear() { samples_.clear(); }

    double window_seconds() const { return window_seconds_; }
    void   set_window_seconds(double seconds) { window_seconds_ = seconds; }

    std::span<const Sample> samples() const { return samples_; }
    std::size_t             size() const { return samples_.size(); }
    bool                    empty() const { return samples_.empty(); }
    const Sample&           back() const { return samples_.back(); }

   private:
    double              window_seconds_;
    std::vector<Sample> samples_;
};

}  // namespace wiggle
