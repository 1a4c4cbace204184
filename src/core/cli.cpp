#include "pairlink/core/cli.hpp"
#include "pairlink/core/utils.hpp"
#include <iomanip>
#include <stdexcept>

namespace pairlink::core {

CommandLineParser::CommandLineParser(const std::string& program_name) 
    : program_name_(program_name) {
    
    add_option("h", "help", "Show this help message");
    add_option("v", "version", "Show version information");
    add_option("c", "config", "Configuration file path", true, "~/.pairlink.conf");
    add_option("l", "log-file", "Log file path (overrides log.file)", true);
    add_option("", "verbose", "Log at debug level");
}

void CommandLineParser::add_option(const std::string& short_name, const std::string& long_name, 
                                   const std::string& description, bool has_value, 
                                   const std::string& default_value) {
    // Short-only options are stored under their single letter
    auto key = long_name.empty() ? short_name : long_name;
    options_[key] = Option{short_name, description, has_value, default_value};
    
    if (short_name.size() == 1) {
        short_to_long_[short_name[0]] = key;
    }
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    positional_args_.clear();
    parsed_options_.clear();
    error_.clear();
    
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        
        if (arg == "--") {
            positional_args_.insert(positional_args_.end(), argv + i + 1, argv + argc);
            break;
        }
        
        bool ok = true;
        if (arg.starts_with("--")) {
            ok = parse_long(arg, i, argc, argv);
        } else if (arg.size() > 1 && arg[0] == '-') {
            ok = parse_short(arg, i, argc, argv);
        } else {
            positional_args_.push_back(arg);
        }
        
        if (!ok) {
            return false;
        }
    }
    
    return true;
}

bool CommandLineParser::parse_long(const std::string& arg, int& index, int argc, char* argv[]) {
    auto body = arg.substr(2);
    auto eq_pos = body.find('=');
    auto name = body.substr(0, eq_pos);
    
    auto it = options_.find(name);
    if (it == options_.end()) {
        return fail("Unknown option: --" + name);
    }
    
    if (!it->second.has_value) {
        parsed_options_[name] = "true";
    } else if (eq_pos != std::string::npos) {
        parsed_options_[name] = body.substr(eq_pos + 1);
    } else if (index + 1 < argc) {
        parsed_options_[name] = argv[++index];
    } else {
        return fail("Option --" + name + " requires a value");
    }
    return true;
}

bool CommandLineParser::parse_short(const std::string& arg, int& index, int argc, char* argv[]) {
    for (std::size_t j = 1; j < arg.size(); ++j) {
        auto long_it = short_to_long_.find(arg[j]);
        if (long_it == short_to_long_.end()) {
            return fail(std::string("Unknown option: -") + arg[j]);
        }
        
        const auto& name = long_it->second;
        if (!options_.at(name).has_value) {
            parsed_options_[name] = "true";
            continue;
        }
        
        // The rest of the token is the value (-cfile), else the next argument
        if (j + 1 < arg.size()) {
            parsed_options_[name] = arg.substr(j + 1);
        } else if (index + 1 < argc) {
            parsed_options_[name] = argv[++index];
        } else {
            return fail(std::string("Option -") + arg[j] + " requires a value");
        }
        break;
    }
    return true;
}

bool CommandLineParser::fail(const std::string& message) {
    error_ = message;
    return false;
}

bool CommandLineParser::has_option(const std::string& name) const {
    return parsed_options_.count(normalize_option_name(name)) > 0;
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    auto normalized = normalize_option_name(name);
    
    if (auto it = parsed_options_.find(normalized); it != parsed_options_.end()) {
        return it->second;
    }
    
    if (auto it = options_.find(normalized); it != options_.end() && !it->second.default_value.empty()) {
        return it->second.default_value;
    }
    
    return default_value;
}

int CommandLineParser::get_int_option(const std::string& name, int default_value) const {
    auto value = get_option(name);
    if (value.empty()) return default_value;
    
    try {
        std::size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        return consumed == value.size() ? parsed : default_value;
    } catch (const std::invalid_argument&) {
        return default_value;
    } catch (const std::out_of_range&) {
        return default_value;
    }
}

bool CommandLineParser::get_bool_option(const std::string& name, bool default_value) const {
    if (!has_option(name)) return default_value;
    
    auto value = utils::StringUtils::to_lower(get_option(name));
    return value.empty() || value == "true" || value == "1" || value == "yes";
}

void CommandLineParser::print_help(std::ostream& out) const {
    out << "Usage: " << program_name_ << " [options] <command> [args...]\n\n"
        << "Options:\n";
    
    for (const auto& [name, option] : options_) {
        std::string flags = option.short_name.empty() ? "    " : "-" + option.short_name + ", ";
        if (name != option.short_name) {
            flags += "--" + name;
        }
        if (option.has_value) {
            flags += " <value>";
        }
        
        out << "  " << std::left << std::setw(24) << flags << option.description;
        if (!option.default_value.empty()) {
            out << " (default: " << option.default_value << ")";
        }
        out << "\n";
    }
}

void CommandLineParser::print_version(std::ostream& out) const {
    out << program_name_ << " version 0.3.0\n"
        << "Transfer session manager, built with C++20\n";
}

std::string CommandLineParser::normalize_option_name(const std::string& name) const {
    if (name.size() == 1) {
        if (auto it = short_to_long_.find(name[0]); it != short_to_long_.end()) {
            return it->second;
        }
    }
    return name;
}

}
