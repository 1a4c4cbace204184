#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace pairlink::transfer {
    class TransferManager;
}

namespace pairlink::core {

struct CommandResult {
    bool success = true;
    std::string message;
    int exit_code = 0;
    
    static CommandResult ok(const std::string& msg = "") {
        return CommandResult{true, msg, 0};
    }
    
    static CommandResult error(const std::string& msg, int code = 1) {
        return CommandResult{false, msg, code};
    }
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;
    
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

// Runs a script of transport events and local actions through a manager
class ReplayCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Replay a transfer event script"; }
    std::string get_usage() const override { return "pairlink replay <script>"; }
};

// Feeds one incoming transfer at a steady rate and prints the estimates
class SimulateCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Simulate a transfer at a fixed rate"; }
    std::string get_usage() const override { return "pairlink simulate <size_bytes> <bytes_per_second> [tick_ms]"; }
};

void print_sessions(const pairlink::transfer::TransferManager& manager, std::ostream& out);

}
