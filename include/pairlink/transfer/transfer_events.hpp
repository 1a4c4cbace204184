#pragma once

#include "transfer_session.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace pairlink::transfer {

class TransferManager;

// Inbound events reported by the transport, keyed by transfer id
struct StartEvent {
    TransferDirection direction = TransferDirection::INCOMING;
    std::string id;
    std::string name;
    std::uint64_t size = 0;
    std::string mime;
    std::uint64_t chunk_size = 0;
};

struct ProgressEvent {
    std::string id;
    std::uint64_t byte_count = 0;  // bytes sent (outgoing) or received (incoming) so far
};

struct CompleteEvent {
    std::string id;
    std::optional<bool> verified;
};

struct FailEvent {
    std::string id;
    std::string reason;
};

struct RemoteCancelEvent {
    std::string id;
};

using TransferEvent = std::variant<StartEvent, ProgressEvent, CompleteEvent, FailEvent, RemoteCancelEvent>;

const std::string& event_transfer_id(const TransferEvent& event);

// Textual form used by replay scripts:
//   start incoming <id> <size> <mime> <name...>
//   start outgoing <id> <size> <mime> <chunk_size> <name...>
//   progress <id> <bytes>
//   complete <id> [verified|unverified|unknown]
//   fail <id> <reason...>
//   remote-cancel <id>
// Throws std::invalid_argument on malformed input.
TransferEvent parse_transfer_event(const std::string& line);

bool is_transfer_event_keyword(const std::string& keyword);

class TransferEventDispatcher {
public:
    explicit TransferEventDispatcher(TransferManager& manager);
    
    void dispatch(const TransferEvent& event);
    
    std::uint64_t get_dispatched_count() const { return dispatched_count_; }
    
private:
    TransferManager& manager_;
    std::uint64_t dispatched_count_;
};

} // namespace pairlink::transfer
