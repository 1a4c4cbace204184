#include "pairlink/transfer/transfer_manager.hpp"
#include "pairlink/core/logger.hpp"
#include <algorithm>
#include <utility>

namespace pairlink::transfer {

TransferManager::TransferManager(TransferOptions options, std::shared_ptr<TransferNotifier> notifier,
                                 Clock clock)
    : options_(options)
    , notifier_(std::move(notifier))
    , clock_(clock ? std::move(clock) : Clock([] { return SteadyClock::now(); }))
    , estimator_(options.smoothing_alpha, options.estimator_interval)
    , io_context_()
    , strand_(boost::asio::make_strand(io_context_))
    , work_guard_(boost::asio::make_work_guard(io_context_))
    , dismiss_scheduler_(strand_, options.dismiss_delay)
    , running_(true)
{
    worker_thread_ = std::thread([this]() {
        LOG_DEBUG("Transfer manager worker started");

        while (true) {
            try {
                io_context_.run();
                break;
            } catch (const std::exception& e) {
                LOG_ERROR("Transfer manager task error: {}", e.what());
            }
        }

        LOG_DEBUG("Transfer manager worker stopped");
    });

    LOG_INFO("Transfer manager ready (auto_show={}, dismiss={}ms, interval={}ms, alpha={})",
             options_.auto_show_active, options_.dismiss_delay.count(),
             options_.estimator_interval.count(), options_.smoothing_alpha);
}

TransferManager::~TransferManager() {
    stop();
}

void TransferManager::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    // Queued work still drains; the dismiss timer is the only thing that
    // would otherwise keep the context alive.
    boost::asio::post(strand_, [this]() {
        dismiss_scheduler_.cancel();
    });
    work_guard_.reset();

    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }

    LOG_INFO("Transfer manager stopped with {} session(s)", sessions_.size());
}

void TransferManager::start_outgoing(const std::string& id, const std::string& name, std::uint64_t size,
                                     const std::string& mime, std::uint64_t chunk_size) {
    post([this, id, name, size, mime, chunk_size, now = clock_()]() {
        do_start(TransferSession::create(id, name, size, mime, TransferDirection::OUTGOING,
                                         chunk_size, now));
    });
}

void TransferManager::start_incoming(const std::string& id, const std::string& name, std::uint64_t size,
                                     const std::string& mime) {
    post([this, id, name, size, mime, now = clock_()]() {
        do_start(TransferSession::create(id, name, size, mime, TransferDirection::INCOMING,
                                         0, now));
    });
}

void TransferManager::update_outgoing_progress(const std::string& id, std::uint64_t bytes_transferred) {
    update_progress(id, bytes_transferred);
}

void TransferManager::update_incoming_progress(const std::string& id, std::uint64_t bytes_received) {
    update_progress(id, bytes_received);
}

void TransferManager::update_progress(const std::string& id, std::uint64_t byte_count) {
    post([this, id, byte_count, now = clock_()]() {
        do_update_progress(id, byte_count, now);
    });
}

void TransferManager::complete_incoming(const std::string& id, std::optional<bool> verified) {
    post([this, id, verified]() {
        do_complete(id, verified, true);
    });
}

void TransferManager::complete_outgoing_verified(const std::string& id, std::optional<bool> verified) {
    post([this, id, verified]() {
        do_complete(id, verified, false);
    });
}

void TransferManager::complete_transfer(const std::string& id, std::optional<bool> verified) {
    post([this, id, verified]() {
        do_complete_by_direction(id, verified);
    });
}

void TransferManager::fail_transfer(const std::string& id, const std::string& reason) {
    post([this, id, reason]() {
        do_fail(id, reason);
    });
}

void TransferManager::cancel_transfer(const std::string& id) {
    post([this, id]() {
        if (notifier_) {
            try {
                notifier_->notify_cancel(id);
            } catch (const std::exception& e) {
                LOG_WARN("Failed to notify peer about cancelled transfer {}: {}", id, e.what());
            }
        }
        do_fail(id, CANCELLED_BY_USER);
    });
}

void TransferManager::stop_transfer_remote(const std::string& id) {
    post([this, id]() {
        do_fail(id, CANCELLED_BY_RECEIVER);
    });
}

void TransferManager::stop_all_transfers(const std::string& reason) {
    post([this, reason]() {
        do_stop_all(reason);
    });
}

void TransferManager::remove_completed_transfers() {
    post([this]() {
        do_remove_completed();
    });
}

void TransferManager::clear_active_transfer() {
    post([this]() {
        dismiss_scheduler_.cancel();
        set_active(std::nullopt);
    });
}

std::vector<TransferSession> TransferManager::sessions() const {
    return query([this]() {
        std::vector<TransferSession> result;
        result.reserve(sessions_.size());
        for (const auto& [id, session] : sessions_) {
            result.push_back(session);
        }
        return result;
    });
}

std::optional<TransferSession> TransferManager::session(const std::string& id) const {
    return query([this, &id]() -> std::optional<TransferSession> {
        auto it = sessions_.find(id);
        if (it == sessions_.end()) {
            return std::nullopt;
        }
        return it->second;
    });
}

std::optional<std::string> TransferManager::active_transfer_id() const {
    return query([this]() {
        return active_transfer_id_;
    });
}

std::optional<TransferSession> TransferManager::active_session() const {
    return query([this]() -> std::optional<TransferSession> {
        if (!active_transfer_id_) {
            return std::nullopt;
        }
        auto it = sessions_.find(*active_transfer_id_);
        if (it == sessions_.end()) {
            return std::nullopt;
        }
        return it->second;
    });
}

std::size_t TransferManager::in_progress_count() const {
    return query([this]() {
        return static_cast<std::size_t>(std::count_if(sessions_.begin(), sessions_.end(),
            [](const auto& entry) { return entry.second.in_progress(); }));
    });
}

bool TransferManager::is_dismiss_pending() const {
    return query([this]() {
        return dismiss_scheduler_.is_pending();
    });
}

void TransferManager::set_session_callback(SessionCallback callback) {
    query([this, &callback]() {
        session_callback_ = std::move(callback);
    });
}

void TransferManager::set_active_callback(ActiveCallback callback) {
    query([this, &callback]() {
        active_callback_ = std::move(callback);
    });
}

void TransferManager::set_removed_callback(RemovedCallback callback) {
    query([this, &callback]() {
        removed_callback_ = std::move(callback);
    });
}

void TransferManager::flush() {
    query([]() {});
}

TransferSession* TransferManager::find_session(const std::string& id) {
    auto it = sessions_.find(id);
    return it != sessions_.end() ? &it->second : nullptr;
}

void TransferManager::do_start(TransferSession session) {
    auto id = session.id;

    if (sessions_.count(id)) {
        LOG_DEBUG("Replacing existing transfer {}", id);
    }

    LOG_INFO("Started {} transfer {} '{}' ({} bytes, {})",
             to_string(session.direction), id, session.name, session.size, session.mime);

    auto& stored = sessions_.insert_or_assign(id, std::move(session)).first->second;

    if (options_.auto_show_active) {
        dismiss_scheduler_.cancel();
        set_active(id);
    }

    publish(stored);
}

void TransferManager::do_update_progress(const std::string& id, std::uint64_t byte_count,
                                         SteadyClock::time_point now) {
    auto* session = find_session(id);
    if (!session) {
        LOG_TRACE("Progress for unknown transfer {} ignored", id);
        return;
    }

    if (!session->in_progress()) {
        LOG_TRACE("Progress for {} transfer {} ignored", to_string(session->status), id);
        return;
    }

    if (estimator_.on_progress(*session, byte_count, now)) {
        LOG_DEBUG("Transfer {} at {}/{} bytes", id, session->bytes_transferred, session->size);
    }

    publish(*session);
}

void TransferManager::do_complete(const std::string& id, std::optional<bool> verified, bool fill_size) {
    auto* session = find_session(id);
    if (!session) {
        LOG_DEBUG("Completion for unknown transfer {} ignored", id);
        return;
    }

    if (!session->in_progress()) {
        LOG_DEBUG("Completion for {} transfer {} ignored", to_string(session->status), id);
        return;
    }

    if (fill_size) {
        session->bytes_transferred = session->size;
    }
    session->status = Completed{verified};

    LOG_INFO("Transfer {} {}", id, to_string(session->status));

    if (active_transfer_id_ == id) {
        schedule_dismiss();
    }

    publish(*session);
}

void TransferManager::do_complete_by_direction(const std::string& id, std::optional<bool> verified) {
    auto* session = find_session(id);
    if (!session) {
        LOG_DEBUG("Completion for unknown transfer {} ignored", id);
        return;
    }

    do_complete(id, verified, session->direction == TransferDirection::INCOMING);
}

void TransferManager::do_fail(const std::string& id, const std::string& reason) {
    auto* session = find_session(id);
    if (!session) {
        LOG_DEBUG("Failure for unknown transfer {} ignored", id);
        return;
    }

    if (session->is_completed()) {
        LOG_DEBUG("Failure '{}' for completed transfer {} ignored", reason, id);
        return;
    }

    session->status = Failed{reason};

    LOG_WARN("Transfer {} failed: {}", id, reason);

    if (active_transfer_id_ == id) {
        schedule_dismiss();
    }

    publish(*session);
}

void TransferManager::do_stop_all(const std::string& reason) {
    bool active_affected = false;
    std::size_t stopped = 0;

    for (auto& [id, session] : sessions_) {
        if (!session.in_progress()) {
            continue;
        }

        session.status = Failed{reason};
        ++stopped;

        if (active_transfer_id_ == id) {
            active_affected = true;
        }
        publish(session);
    }

    if (stopped > 0) {
        LOG_WARN("Stopped {} transfer(s): {}", stopped, reason);
    }

    if (active_affected) {
        schedule_dismiss();
    }
}

void TransferManager::do_remove_completed() {
    std::vector<std::string> removed;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (it->second.is_completed()) {
            removed.push_back(it->first);
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }

    LOG_DEBUG("Removed {} completed transfer(s), {} remaining", removed.size(), sessions_.size());

    if (removed.empty() || !removed_callback_) {
        return;
    }

    try {
        removed_callback_(removed);
    } catch (const std::exception& e) {
        LOG_WARN("Removal observer failed: {}", e.what());
    }
}

void TransferManager::set_active(std::optional<std::string> id) {
    if (active_transfer_id_ == id) {
        return;
    }

    active_transfer_id_ = std::move(id);

    if (active_callback_) {
        try {
            active_callback_(active_transfer_id_);
        } catch (const std::exception& e) {
            LOG_WARN("Active transfer observer failed: {}", e.what());
        }
    }
}

void TransferManager::schedule_dismiss() {
    dismiss_scheduler_.arm([this]() {
        LOG_DEBUG("Dismissing highlighted transfer {}", active_transfer_id_.value_or("<none>"));
        set_active(std::nullopt);
    });
}

void TransferManager::publish(const TransferSession& session) {
    if (!session_callback_) {
        return;
    }

    try {
        session_callback_(session);
    } catch (const std::exception& e) {
        LOG_WARN("Session observer failed for transfer {}: {}", session.id, e.what());
    }
}

} // namespace pairlink::transfer
