#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace pairlink::core::utils {

class StringUtils {
public:
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::vector<std::string> split_whitespace(const std::string& str);
    static std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static bool starts_with(const std::string& str, const std::string& prefix);
    
    static std::string format_bytes(size_t bytes);
    static std::string format_rate(double bytes_per_second);
    static std::string format_duration(std::chrono::milliseconds duration);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static std::optional<std::vector<std::string>> read_lines(const std::filesystem::path& path);
    static std::filesystem::path expand_home(const std::string& path);
    static std::filesystem::path get_home_dir();
};

}
