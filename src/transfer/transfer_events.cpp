#include "pairlink/transfer/transfer_events.hpp"
#include "pairlink/transfer/transfer_manager.hpp"
#include "pairlink/core/logger.hpp"
#include "pairlink/core/utils.hpp"
#include <stdexcept>

namespace pairlink::transfer {

using pairlink::core::utils::StringUtils;

namespace {

std::uint64_t parse_count(const std::string& value, const char* field) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument(std::string("Invalid ") + field + ": '" + value + "'");
    }
    
    try {
        return std::stoull(value);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(std::string(field) + " out of range: '" + value + "'");
    }
}

std::optional<bool> parse_verified(const std::string& value) {
    auto lower = StringUtils::to_lower(value);
    if (lower == "verified" || lower == "true") return true;
    if (lower == "unverified" || lower == "mismatch" || lower == "false") return false;
    if (lower == "unknown" || lower == "none") return std::nullopt;
    
    throw std::invalid_argument("Invalid verification state: '" + value + "'");
}

std::string rest_of_line(const std::vector<std::string>& tokens, std::size_t from) {
    if (from >= tokens.size()) {
        return "";
    }
    return StringUtils::join(std::vector<std::string>(tokens.begin() + from, tokens.end()), " ");
}

void require_tokens(const std::vector<std::string>& tokens, std::size_t count, const char* usage) {
    if (tokens.size() < count) {
        throw std::invalid_argument(std::string("Expected: ") + usage);
    }
}

} // namespace

const std::string& event_transfer_id(const TransferEvent& event) {
    return std::visit([](const auto& e) -> const std::string& { return e.id; }, event);
}

bool is_transfer_event_keyword(const std::string& keyword) {
    return keyword == "start" || keyword == "progress" || keyword == "complete" ||
           keyword == "fail" || keyword == "remote-cancel";
}

TransferEvent parse_transfer_event(const std::string& line) {
    auto tokens = StringUtils::split_whitespace(line);
    if (tokens.empty()) {
        throw std::invalid_argument("Empty event");
    }
    
    const auto& keyword = tokens[0];
    
    if (keyword == "start") {
        require_tokens(tokens, 2, "start <incoming|outgoing> ...");
        
        StartEvent event;
        if (tokens[1] == "incoming") {
            require_tokens(tokens, 6, "start incoming <id> <size> <mime> <name>");
            event.direction = TransferDirection::INCOMING;
            event.id = tokens[2];
            event.size = parse_count(tokens[3], "size");
            event.mime = tokens[4];
            event.name = rest_of_line(tokens, 5);
        } else if (tokens[1] == "outgoing") {
            require_tokens(tokens, 7, "start outgoing <id> <size> <mime> <chunk_size> <name>");
            event.direction = TransferDirection::OUTGOING;
            event.id = tokens[2];
            event.size = parse_count(tokens[3], "size");
            event.mime = tokens[4];
            event.chunk_size = parse_count(tokens[5], "chunk size");
            event.name = rest_of_line(tokens, 6);
        } else {
            throw std::invalid_argument("Unknown direction: '" + tokens[1] + "'");
        }
        return event;
    }
    
    if (keyword == "progress") {
        require_tokens(tokens, 3, "progress <id> <bytes>");
        return ProgressEvent{tokens[1], parse_count(tokens[2], "byte count")};
    }
    
    if (keyword == "complete") {
        require_tokens(tokens, 2, "complete <id> [verified|unverified|unknown]");
        CompleteEvent event{tokens[1], std::nullopt};
        if (tokens.size() > 2) {
            event.verified = parse_verified(tokens[2]);
        }
        return event;
    }
    
    if (keyword == "fail") {
        require_tokens(tokens, 3, "fail <id> <reason>");
        return FailEvent{tokens[1], rest_of_line(tokens, 2)};
    }
    
    if (keyword == "remote-cancel") {
        require_tokens(tokens, 2, "remote-cancel <id>");
        return RemoteCancelEvent{tokens[1]};
    }
    
    throw std::invalid_argument("Unknown event: '" + keyword + "'");
}

TransferEventDispatcher::TransferEventDispatcher(TransferManager& manager)
    : manager_(manager)
    , dispatched_count_(0)
{
}

void TransferEventDispatcher::dispatch(const TransferEvent& event) {
    LOG_TRACE("Dispatching event #{} for transfer {}", dispatched_count_, event_transfer_id(event));
    
    std::visit(overloaded{
        [this](const StartEvent& e) {
            if (e.direction == TransferDirection::OUTGOING) {
                manager_.start_outgoing(e.id, e.name, e.size, e.mime, e.chunk_size);
            } else {
                manager_.start_incoming(e.id, e.name, e.size, e.mime);
            }
        },
        [this](const ProgressEvent& e) {
            manager_.update_progress(e.id, e.byte_count);
        },
        [this](const CompleteEvent& e) {
            manager_.complete_transfer(e.id, e.verified);
        },
        [this](const FailEvent& e) {
            manager_.fail_transfer(e.id, e.reason);
        },
        [this](const RemoteCancelEvent& e) {
            manager_.stop_transfer_remote(e.id);
        }
    }, event);
    
    ++dispatched_count_;
}

} // namespace pairlink::transfer
