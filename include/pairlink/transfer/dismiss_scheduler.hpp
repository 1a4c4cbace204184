#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <cstdint>
#include <functional>

namespace pairlink::transfer {

using OwnerExecutor = boost::asio::strand<boost::asio::io_context::executor_type>;

// Single-slot deferred action. Arming replaces whatever was scheduled before,
// so at most one action is ever pending. Every member must be called on the
// strand the scheduler was built with; the action runs on that strand too.
class DismissScheduler {
public:
    DismissScheduler(OwnerExecutor executor, std::chrono::milliseconds delay);
    
    DismissScheduler(const DismissScheduler&) = delete;
    DismissScheduler& operator=(const DismissScheduler&) = delete;
    
    void arm(std::function<void()> action);
    void cancel();
    
    bool is_pending() const { return pending_; }
    std::chrono::milliseconds get_delay() const { return delay_; }
    
private:
    boost::asio::steady_timer timer_;
    std::chrono::milliseconds delay_;
    
    // Bumped on every arm/cancel; a handler whose generation is stale never fires
    std::uint64_t generation_;
    bool pending_;
};

} // namespace pairlink::transfer
