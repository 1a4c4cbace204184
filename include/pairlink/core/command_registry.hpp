#pragma once

#include "command_handler.hpp"
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace pairlink::core {

// Name -> handler table behind the `pairlink <command>` entry point
class CommandRegistry {
public:
    CommandRegistry();
    
    void register_command(const std::string& name, std::unique_ptr<CommandHandler> handler);
    
    // args[0] is the command name itself
    CommandResult execute_command(const std::string& command, const std::vector<std::string>& args);
    
    bool has_command(const std::string& command) const;
    std::vector<std::string> get_command_names() const;
    
    void print_help(std::ostream& out = std::cout) const;
    
private:
    std::map<std::string, std::unique_ptr<CommandHandler>> handlers_;
};

}
