#include <iostream>
#include <string>
#include <vector>
#include "pairlink/core/logger.hpp"
#include "pairlink/core/config.hpp"
#include "pairlink/core/cli.hpp"
#include "pairlink/core/utils.hpp"
#include "pairlink/core/command_registry.hpp"

int main(int argc, char* argv[]) {
    pairlink::core::CommandLineParser parser("pairlink");
    
    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }
    
    if (parser.has_option("help")) {
        parser.print_help();
        pairlink::core::CommandRegistry().print_help();
        return 0;
    }
    
    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }
    
    auto& config = pairlink::core::Config::instance();
    config.set_defaults();
    
    auto config_file = pairlink::core::utils::FileUtils::expand_home(parser.get_option("config"));
    bool config_loaded = false;
    if (pairlink::core::utils::FileUtils::exists(config_file)) {
        config_loaded = config.load_from_file(config_file.string());
    }
    
    auto log_level = parser.has_option("verbose") ?
        pairlink::core::LogLevel::Debug :
        pairlink::core::Logger::parse_level(config.get_string("log.level", "info"));
    auto log_file = parser.get_option("log-file", config.get_string("log.file", "pairlink.log"));
    pairlink::core::Logger::initialize(log_file, log_level);
    
    LOG_INFO("pairlink starting up");
    if (config_loaded) {
        LOG_INFO("Loaded configuration from {}", config_file.string());
    }
    
    pairlink::core::CommandRegistry command_registry;
    
    auto& args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help();
        command_registry.print_help();
        pairlink::core::Logger::shutdown();
        return 0;
    }
    
    const std::string& command = args[0];
    auto result = command_registry.execute_command(command, args);
    
    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            std::cout << "\nAvailable commands:\n";
            command_registry.print_help();
        }
    } else if (!result.message.empty()) {
        LOG_INFO("{}", result.message);
    }
    
    pairlink::core::Logger::shutdown();
    return result.exit_code;
}
