#include "pairlink/transfer/transfer_session.hpp"
#include <algorithm>
#include <utility>

namespace pairlink::transfer {

bool is_in_progress(const TransferStatus& status) {
    return std::holds_alternative<InProgress>(status);
}

bool is_terminal(const TransferStatus& status) {
    return std::visit(overloaded{
        [](const InProgress&) { return false; },
        [](const Completed&) { return true; },
        [](const Failed&) { return true; }
    }, status);
}

std::string to_string(const TransferStatus& status) {
    return std::visit(overloaded{
        [](const InProgress&) -> std::string { return "in progress"; },
        [](const Completed& completed) -> std::string {
            if (!completed.verified) {
                return "completed";
            }
            return *completed.verified ? "completed (verified)" : "completed (checksum mismatch)";
        },
        [](const Failed& failed) -> std::string { return "failed: " + failed.reason; }
    }, status);
}

std::string to_string(TransferDirection direction) {
    switch (direction) {
        case TransferDirection::OUTGOING: return "outgoing";
        case TransferDirection::INCOMING: return "incoming";
    }
    return "unknown";
}

TransferSession TransferSession::create(std::string id, std::string name, std::uint64_t size,
                                        std::string mime, TransferDirection direction,
                                        std::uint64_t chunk_size, SteadyClock::time_point now) {
    TransferSession session;
    session.id = std::move(id);
    session.name = std::move(name);
    session.size = size;
    session.mime = std::move(mime);
    session.direction = direction;
    session.chunk_size = direction == TransferDirection::OUTGOING ? chunk_size : 0;
    session.started_at = now;
    session.last_update_time = now;
    session.status = InProgress{};
    return session;
}

double TransferSession::progress() const {
    if (size == 0) return 0.0;
    
    auto fraction = static_cast<double>(bytes_transferred) / static_cast<double>(size);
    return std::clamp(fraction, 0.0, 1.0);
}

std::uint64_t TransferSession::remaining_bytes() const {
    return bytes_transferred >= size ? 0 : size - bytes_transferred;
}

} // namespace pairlink::transfer
