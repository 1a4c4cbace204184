#include "pairlink/core/command_registry.hpp"
#include "pairlink/core/logger.hpp"
#include <chrono>
#include <iomanip>

namespace pairlink::core {

CommandRegistry::CommandRegistry() {
    register_command("replay", std::make_unique<ReplayCommandHandler>());
    register_command("simulate", std::make_unique<SimulateCommandHandler>());
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    if (handlers_.count(name)) {
        LOG_DEBUG("Replacing handler for command '{}'", name);
    }
    handlers_[name] = std::move(handler);
}

CommandResult CommandRegistry::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        LOG_WARN("Unknown command '{}'", command);
        return CommandResult::error("Unknown command: " + command);
    }
    
    LOG_DEBUG("Running '{}' with {} argument(s)", command, args.size() > 0 ? args.size() - 1 : 0);
    auto started = std::chrono::steady_clock::now();
    
    auto result = it->second->execute(args);
    
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (result.success) {
        LOG_DEBUG("Command '{}' finished in {}ms", command, elapsed.count());
    } else {
        LOG_WARN("Command '{}' failed after {}ms: {}", command, elapsed.count(), result.message);
    }
    
    return result;
}

bool CommandRegistry::has_command(const std::string& command) const {
    return handlers_.find(command) != handlers_.end();
}

std::vector<std::string> CommandRegistry::get_command_names() const {
    std::vector<std::string> names;
    names.reserve(handlers_.size());
    for (const auto& [name, handler] : handlers_) {
        names.push_back(name);
    }
    return names;
}

void CommandRegistry::print_help(std::ostream& out) const {
    out << "\nCommands:\n";
    
    for (const auto& [name, handler] : handlers_) {
        out << "  " << std::left << std::setw(12) << name << handler->get_description() << "\n"
            << "  " << std::setw(12) << "" << "usage: " << handler->get_usage() << "\n";
    }
}

}
