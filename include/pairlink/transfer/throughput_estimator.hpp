#pragma once

#include "transfer_session.hpp"
#include <chrono>
#include <cstdint>

namespace pairlink::transfer {

// Rate-limited exponential moving average of a session's throughput.
// Byte counters move on every report; speed and ETA only move once the
// sampling interval has elapsed since the previous recomputation.
class ThroughputEstimator {
public:
    static constexpr double DEFAULT_ALPHA = 0.4;
    static constexpr std::chrono::milliseconds DEFAULT_INTERVAL{1000};
    
    explicit ThroughputEstimator(double alpha = DEFAULT_ALPHA,
                                 std::chrono::milliseconds interval = DEFAULT_INTERVAL);
    
    // Applies a "bytes so far" report. Returns true when speed/ETA were recomputed.
    bool on_progress(TransferSession& session, std::uint64_t reported_bytes,
                     SteadyClock::time_point now) const;
    
    double get_alpha() const { return alpha_; }
    std::chrono::milliseconds get_interval() const { return interval_; }
    
private:
    double alpha_;
    std::chrono::milliseconds interval_;
    
    void recompute(TransferSession& session, Seconds elapsed) const;
};

} // namespace pairlink::transfer
