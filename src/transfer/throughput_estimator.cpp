#include "pairlink/transfer/throughput_estimator.hpp"
#include "pairlink/core/logger.hpp"
#include <algorithm>

namespace pairlink::transfer {

ThroughputEstimator::ThroughputEstimator(double alpha, std::chrono::milliseconds interval)
    : alpha_(alpha)
    , interval_(interval)
{
}

bool ThroughputEstimator::on_progress(TransferSession& session, std::uint64_t reported_bytes,
                                      SteadyClock::time_point now) const {
    auto bytes_diff = static_cast<std::int64_t>(reported_bytes) -
                      static_cast<std::int64_t>(session.bytes_transferred);
    
    if (bytes_diff < 0) {
        // Tolerated: late or retransmitted reports from the transport
        LOG_DEBUG("Progress regression on transfer {}: {} -> {} bytes",
                  session.id, session.bytes_transferred, reported_bytes);
    }
    
    session.bytes_transferred = std::min(reported_bytes, session.size);
    session.bytes_since_last_update += bytes_diff;
    
    auto elapsed = now - session.last_update_time;
    if (elapsed < interval_) {
        return false;
    }
    
    recompute(session, std::chrono::duration_cast<Seconds>(elapsed));
    
    session.last_update_time = now;
    session.bytes_since_last_update = 0;
    return true;
}

void ThroughputEstimator::recompute(TransferSession& session, Seconds elapsed) const {
    if (elapsed.count() <= 0.0) {
        return;
    }
    
    double interval_speed = static_cast<double>(session.bytes_since_last_update) / elapsed.count();
    
    if (session.smoothed_speed) {
        session.smoothed_speed = alpha_ * interval_speed + (1.0 - alpha_) * *session.smoothed_speed;
    } else {
        session.smoothed_speed = interval_speed;
    }
    
    if (*session.smoothed_speed > 0.0) {
        session.estimated_time_remaining =
            Seconds(static_cast<double>(session.remaining_bytes()) / *session.smoothed_speed);
    } else {
        session.estimated_time_remaining.reset();
    }
    
    LOG_TRACE("Transfer {} speed {:.1f} B/s (interval {:.1f} B/s over {:.3f}s)",
              session.id, *session.smoothed_speed, interval_speed, elapsed.count());
}

} // namespace pairlink::transfer
