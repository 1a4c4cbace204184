#include "pairlink/core/command_handler.hpp"
#include "pairlink/core/config.hpp"
#include "pairlink/core/logger.hpp"
#include "pairlink/core/utils.hpp"
#include "pairlink/transfer/transfer_events.hpp"
#include "pairlink/transfer/transfer_manager.hpp"
#include "pairlink/transfer/transfer_options.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <thread>

namespace pairlink::core {

using pairlink::transfer::TransferManager;
using pairlink::transfer::TransferOptions;
using pairlink::transfer::TransferSession;
using utils::StringUtils;

namespace {

// Stands in for the transport when running from the command line
class ConsoleTransferNotifier : public pairlink::transfer::TransferNotifier {
public:
    void notify_cancel(const std::string& transfer_id) override {
        LOG_INFO("Sending fileTransferCancel for {}", transfer_id);
        std::cout << "-> fileTransferCancel " << transfer_id << "\n";
    }
};

std::string format_eta(const TransferSession& session) {
    if (!session.estimated_time_remaining) {
        return "-";
    }
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(*session.estimated_time_remaining);
    return StringUtils::format_duration(ms);
}

std::string format_speed(const TransferSession& session) {
    return session.smoothed_speed ? StringUtils::format_rate(*session.smoothed_speed) : "-";
}

constexpr std::uint64_t MAX_TICK_MS = 60 * 60 * 1000;

std::uint64_t parse_positive(const std::string& value, const std::string& field) {
    std::uint64_t parsed = 0;
    try {
        parsed = std::stoull(value);
    } catch (const std::invalid_argument&) {
        throw std::invalid_argument("Invalid " + field + ": " + value);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(field + " out of range: " + value);
    }
    if (parsed == 0) {
        throw std::invalid_argument(field + " must be positive");
    }
    return parsed;
}

} // namespace

void print_sessions(const TransferManager& manager, std::ostream& out) {
    auto sessions = manager.sessions();
    auto active = manager.active_transfer_id();

    std::sort(sessions.begin(), sessions.end(), [](const auto& a, const auto& b) {
        return a.started_at < b.started_at || (a.started_at == b.started_at && a.id < b.id);
    });

    out << "\nTransfers (" << sessions.size() << "):\n";
    if (sessions.empty()) {
        out << "  none\n";
        return;
    }

    for (const auto& session : sessions) {
        out << (active == session.id ? "* " : "  ")
            << std::left << std::setw(12) << session.id
            << std::setw(10) << pairlink::transfer::to_string(session.direction)
            << std::right << std::setw(7) << std::fixed << std::setprecision(1)
            << session.progress() * 100.0 << "%  "
            << std::left << std::setw(14) << format_speed(session)
            << std::setw(10) << format_eta(session)
            << session.name << " [" << pairlink::transfer::to_string(session.status) << "]\n";
    }
}

CommandResult ReplayCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    auto lines = utils::FileUtils::read_lines(args[1]);
    if (!lines) {
        return CommandResult::error("Cannot read script: " + args[1]);
    }

    LOG_INFO("Replaying {} line(s) from {}", lines->size(), args[1]);

    try {
        auto options = TransferOptions::from_config(Config::instance());
        TransferManager manager(options, std::make_shared<ConsoleTransferNotifier>());
        pairlink::transfer::TransferEventDispatcher dispatcher(manager);

        for (std::size_t i = 0; i < lines->size(); ++i) {
            auto line = StringUtils::trim((*lines)[i]);
            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto tokens = StringUtils::split_whitespace(line);
            const auto& keyword = tokens[0];
            auto argument = [&](std::size_t index) -> const std::string& {
                if (index >= tokens.size()) {
                    throw std::invalid_argument("Missing argument for '" + keyword + "'");
                }
                return tokens[index];
            };

            try {
                if (pairlink::transfer::is_transfer_event_keyword(keyword)) {
                    dispatcher.dispatch(pairlink::transfer::parse_transfer_event(line));
                } else if (keyword == "cancel") {
                    manager.cancel_transfer(argument(1));
                } else if (keyword == "stop-all") {
                    argument(1);
                    std::vector<std::string> reason(tokens.begin() + 1, tokens.end());
                    manager.stop_all_transfers(StringUtils::join(reason, " "));
                } else if (keyword == "cleanup") {
                    manager.remove_completed_transfers();
                } else if (keyword == "dismiss") {
                    manager.clear_active_transfer();
                } else if (keyword == "wait") {
                    auto ms = parse_positive(argument(1), "wait duration");
                    manager.flush();
                    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
                } else if (keyword == "show") {
                    print_sessions(manager, std::cout);
                } else {
                    throw std::invalid_argument("Unknown directive '" + keyword + "'");
                }
            } catch (const std::invalid_argument& e) {
                return CommandResult::error("Line " + std::to_string(i + 1) + ": " + e.what());
            }
        }

        manager.flush();
        print_sessions(manager, std::cout);

        return CommandResult::ok("Replayed " + std::to_string(dispatcher.get_dispatched_count()) + " event(s)");

    } catch (const std::exception& e) {
        return CommandResult::error("Replay failed: " + std::string(e.what()));
    }
}

CommandResult SimulateCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return CommandResult::error("Usage: " + get_usage());
    }

    try {
        auto size = parse_positive(args[1], "size");
        auto rate = parse_positive(args[2], "rate");
        auto tick_ms = args.size() > 3 ? parse_positive(args[3], "tick") : 250;
        if (tick_ms > MAX_TICK_MS) {
            throw std::invalid_argument("tick out of range: " + args[3]);
        }
        auto tick = std::chrono::milliseconds(tick_ms);

        auto options = TransferOptions::from_config(Config::instance());
        TransferManager manager(options, std::make_shared<ConsoleTransferNotifier>());

        const std::string id = "sim-1";
        manager.start_incoming(id, "simulated.bin", size, "application/octet-stream");

        std::cout << "Simulating " << StringUtils::format_bytes(size) << " at "
                  << StringUtils::format_rate(static_cast<double>(rate)) << "\n";

        std::uint64_t per_tick = size;
        if (rate <= std::numeric_limits<std::uint64_t>::max() / tick_ms) {
            per_tick = std::clamp<std::uint64_t>(rate * tick_ms / 1000, 1, size);
        }
        std::uint64_t received = 0;
        std::optional<double> last_speed;

        while (received < size) {
            std::this_thread::sleep_for(tick);
            received += std::min(per_tick, size - received);
            manager.update_incoming_progress(id, received);

            auto session = manager.session(id);
            if (session && session->smoothed_speed != last_speed) {
                last_speed = session->smoothed_speed;
                std::cout << "  " << std::fixed << std::setprecision(1) << std::setw(5)
                          << session->progress() * 100.0 << "%  "
                          << format_speed(*session) << "  eta " << format_eta(*session) << "\n";
            }
        }

        manager.complete_incoming(id, true);
        manager.flush();
        print_sessions(manager, std::cout);

        return CommandResult::ok("Simulation finished");

    } catch (const std::exception& e) {
        return CommandResult::error("Simulation failed: " + std::string(e.what()));
    }
}

}
