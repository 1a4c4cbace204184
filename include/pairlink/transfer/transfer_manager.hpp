#pragma once

#include "transfer_session.hpp"
#include "transfer_options.hpp"
#include "transfer_notifier.hpp"
#include "throughput_estimator.hpp"
#include "dismiss_scheduler.hpp"
#include "pairlink/core/logger.hpp"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace pairlink::transfer {

inline constexpr const char* CANCELLED_BY_USER = "Cancelled by user";
inline constexpr const char* CANCELLED_BY_RECEIVER = "Cancelled by receiver";

// Owns the session store and the highlighted-transfer pointer.
//
// All state lives on one strand served by a worker thread the manager owns.
// Mutating calls post to that strand and return immediately, so they are safe
// from any thread (transport callbacks included). Queries post and wait for
// the answer, or run inline when already on the strand.
class TransferManager {
public:
    // Sampled on the calling thread when an event is posted, so it must be
    // safe to call concurrently
    using Clock = std::function<SteadyClock::time_point()>;
    using SessionCallback = std::function<void(const TransferSession&)>;
    using ActiveCallback = std::function<void(const std::optional<std::string>&)>;
    using RemovedCallback = std::function<void(const std::vector<std::string>&)>;

    TransferManager(TransferOptions options, std::shared_ptr<TransferNotifier> notifier,
                    Clock clock = {});
    ~TransferManager();

    TransferManager(const TransferManager&) = delete;
    TransferManager& operator=(const TransferManager&) = delete;

    // Session lifecycle
    void start_outgoing(const std::string& id, const std::string& name, std::uint64_t size,
                        const std::string& mime, std::uint64_t chunk_size);
    void start_incoming(const std::string& id, const std::string& name, std::uint64_t size,
                        const std::string& mime);

    void update_outgoing_progress(const std::string& id, std::uint64_t bytes_transferred);
    void update_incoming_progress(const std::string& id, std::uint64_t bytes_received);
    void update_progress(const std::string& id, std::uint64_t byte_count);

    void complete_incoming(const std::string& id, std::optional<bool> verified);
    void complete_outgoing_verified(const std::string& id, std::optional<bool> verified);
    void complete_transfer(const std::string& id, std::optional<bool> verified);

    void fail_transfer(const std::string& id, const std::string& reason);
    void cancel_transfer(const std::string& id);
    void stop_transfer_remote(const std::string& id);
    void stop_all_transfers(const std::string& reason);

    void remove_completed_transfers();
    void clear_active_transfer();

    // Read side
    std::vector<TransferSession> sessions() const;
    std::optional<TransferSession> session(const std::string& id) const;
    std::optional<std::string> active_transfer_id() const;
    std::optional<TransferSession> active_session() const;
    std::size_t in_progress_count() const;
    bool is_dismiss_pending() const;

    // Observers run on the owner strand after each change
    void set_session_callback(SessionCallback callback);
    void set_active_callback(ActiveCallback callback);
    // Ids erased by one remove_completed_transfers() call, never empty
    void set_removed_callback(RemovedCallback callback);

    // Blocks until everything posted before this call has been applied
    void flush();

    // Drains queued work, drops any pending dismissal and joins the worker.
    // Called by the owner only, never concurrently with other calls.
    void stop();
    bool is_running() const { return running_; }

    const TransferOptions& get_options() const { return options_; }

private:
    TransferOptions options_;
    std::shared_ptr<TransferNotifier> notifier_;
    Clock clock_;
    ThroughputEstimator estimator_;

    boost::asio::io_context io_context_;
    OwnerExecutor strand_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;

    // Owner-strand state
    std::unordered_map<std::string, TransferSession> sessions_;
    std::optional<std::string> active_transfer_id_;
    DismissScheduler dismiss_scheduler_;
    SessionCallback session_callback_;
    ActiveCallback active_callback_;
    RemovedCallback removed_callback_;

    std::atomic<bool> running_;
    std::thread worker_thread_;

    template<typename F>
    void post(F&& task) {
        if (!running_) {
            LOG_DEBUG("Transfer manager stopped, dropping operation");
            return;
        }
        boost::asio::post(strand_, std::forward<F>(task));
    }

    template<typename F>
    auto query(F&& fn) const -> std::invoke_result_t<F> {
        using Result = std::invoke_result_t<F>;

        if (!running_ || strand_.running_in_this_thread()) {
            return fn();
        }

        std::promise<Result> promise;
        auto future = promise.get_future();
        boost::asio::post(strand_, [&promise, &fn]() {
            try {
                if constexpr (std::is_void_v<Result>) {
                    fn();
                    promise.set_value();
                } else {
                    promise.set_value(fn());
                }
            } catch (const std::exception&) {
                promise.set_exception(std::current_exception());
            }
        });
        return future.get();
    }

    TransferSession* find_session(const std::string& id);

    void do_start(TransferSession session);
    void do_update_progress(const std::string& id, std::uint64_t byte_count,
                            SteadyClock::time_point now);
    void do_complete(const std::string& id, std::optional<bool> verified, bool fill_size);
    void do_complete_by_direction(const std::string& id, std::optional<bool> verified);
    void do_fail(const std::string& id, const std::string& reason);
    void do_stop_all(const std::string& reason);
    void do_remove_completed();

    void set_active(std::optional<std::string> id);
    void schedule_dismiss();
    void publish(const TransferSession& session);
};

} // namespace pairlink::transfer
