#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace pairlink::transfer {

using SteadyClock = std::chrono::steady_clock;
using Seconds = std::chrono::duration<double>;

enum class TransferDirection {
    OUTGOING,
    INCOMING
};

struct InProgress {
    bool operator==(const InProgress&) const = default;
};

struct Completed {
    std::optional<bool> verified;  // nullopt when no checksum was compared
    bool operator==(const Completed&) const = default;
};

struct Failed {
    std::string reason;
    bool operator==(const Failed&) const = default;
};

using TransferStatus = std::variant<InProgress, Completed, Failed>;

template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

bool is_in_progress(const TransferStatus& status);
bool is_terminal(const TransferStatus& status);
std::string to_string(const TransferStatus& status);
std::string to_string(TransferDirection direction);

struct TransferSession {
    std::string id;
    std::string name;
    std::uint64_t size = 0;
    std::string mime;
    TransferDirection direction = TransferDirection::INCOMING;
    
    std::uint64_t bytes_transferred = 0;
    std::uint64_t chunk_size = 0;
    
    SteadyClock::time_point started_at;
    SteadyClock::time_point last_update_time;
    
    // Signed: out-of-order reports can push the accumulator below zero
    std::int64_t bytes_since_last_update = 0;
    
    std::optional<double> smoothed_speed;
    std::optional<Seconds> estimated_time_remaining;
    
    TransferStatus status = InProgress{};
    
    static TransferSession create(std::string id, std::string name, std::uint64_t size,
                                  std::string mime, TransferDirection direction,
                                  std::uint64_t chunk_size, SteadyClock::time_point now);
    
    // Fraction in [0, 1]; 0 when the size is unknown
    double progress() const;
    
    std::uint64_t remaining_bytes() const;
    bool in_progress() const { return is_in_progress(status); }
    bool is_completed() const { return std::holds_alternative<Completed>(status); }
    bool is_failed() const { return std::holds_alternative<Failed>(status); }
};

} // namespace pairlink::transfer
