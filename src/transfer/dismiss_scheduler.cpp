#include "pairlink/transfer/dismiss_scheduler.hpp"
#include "pairlink/core/logger.hpp"
#include <utility>

namespace pairlink::transfer {

DismissScheduler::DismissScheduler(OwnerExecutor executor, std::chrono::milliseconds delay)
    : timer_(std::move(executor))
    , delay_(delay)
    , generation_(0)
    , pending_(false)
{
}

void DismissScheduler::arm(std::function<void()> action) {
    auto generation = ++generation_;
    
    // expires_after cancels any wait still outstanding on the timer
    timer_.expires_after(delay_);
    pending_ = true;
    
    timer_.async_wait([this, generation, action = std::move(action)](boost::system::error_code ec) {
        if (ec == boost::asio::error::operation_aborted || generation != generation_) {
            return;
        }
        if (ec) {
            LOG_WARN("Dismiss timer error: {}", ec.message());
            return;
        }
        
        pending_ = false;
        action();
    });
    
    LOG_DEBUG("Dismiss armed for {}ms (generation {})", delay_.count(), generation);
}

void DismissScheduler::cancel() {
    if (!pending_) {
        return;
    }
    
    ++generation_;
    pending_ = false;
    timer_.cancel();
    
    LOG_DEBUG("Pending dismiss cancelled");
}

} // namespace pairlink::transfer
