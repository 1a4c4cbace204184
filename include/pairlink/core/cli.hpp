#pragma once

#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace pairlink::core {

// GNU-style option parsing: --name, --name=value, -n value, -nvalue, bundled
// short flags (-hv) and "--" to end option processing.
class CommandLineParser {
public:
    explicit CommandLineParser(const std::string& program_name);
    
    void add_option(const std::string& short_name, const std::string& long_name,
                    const std::string& description, bool has_value = false,
                    const std::string& default_value = "");
    
    bool parse(int argc, char* argv[]);
    
    bool has_option(const std::string& name) const;
    std::string get_option(const std::string& name, const std::string& default_value = "") const;
    int get_int_option(const std::string& name, int default_value = 0) const;
    bool get_bool_option(const std::string& name, bool default_value = false) const;
    
    const std::vector<std::string>& get_positional_args() const { return positional_args_; }
    const std::string& get_error() const { return error_; }
    
    void print_help(std::ostream& out = std::cout) const;
    void print_version(std::ostream& out = std::cout) const;
    
private:
    struct Option {
        std::string short_name;
        std::string description;
        bool has_value = false;
        std::string default_value;
    };
    
    std::string program_name_;
    std::map<std::string, Option> options_;
    std::map<char, std::string> short_to_long_;
    std::map<std::string, std::string> parsed_options_;
    std::vector<std::string> positional_args_;
    std::string error_;
    
    bool parse_long(const std::string& arg, int& index, int argc, char* argv[]);
    bool parse_short(const std::string& arg, int& index, int argc, char* argv[]);
    bool fail(const std::string& message);
    
    std::string normalize_option_name(const std::string& name) const;
};

}
