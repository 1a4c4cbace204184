#include "pairlink/core/utils.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

namespace pairlink::core::utils {

namespace {

constexpr const char* WHITESPACE = " \t\r\n\f\v";

}

std::vector<std::string> StringUtils::split(const std::string& str, char delimiter) {
    std::vector<std::string> result;
    std::size_t begin = 0;
    
    while (true) {
        auto end = str.find(delimiter, begin);
        if (end == std::string::npos) {
            // A trailing delimiter does not produce an empty last field
            if (begin < str.size() || result.empty()) {
                result.push_back(str.substr(begin));
            }
            return result;
        }
        result.push_back(str.substr(begin, end - begin));
        begin = end + 1;
    }
}

std::vector<std::string> StringUtils::split_whitespace(const std::string& str) {
    std::vector<std::string> result;
    std::size_t begin = str.find_first_not_of(WHITESPACE);
    
    while (begin != std::string::npos) {
        auto end = str.find_first_of(WHITESPACE, begin);
        result.push_back(str.substr(begin, end == std::string::npos ? std::string::npos : end - begin));
        begin = str.find_first_not_of(WHITESPACE, end);
    }
    
    return result;
}

std::string StringUtils::join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::string result;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += delimiter;
        result += parts[i];
    }
    return result;
}

std::string StringUtils::trim(const std::string& str) {
    auto first = str.find_first_not_of(WHITESPACE);
    if (first == std::string::npos) {
        return "";
    }
    auto last = str.find_last_not_of(WHITESPACE);
    return str.substr(first, last - first + 1);
}

std::string StringUtils::to_lower(const std::string& str) {
    std::string result(str.size(), '\0');
    std::transform(str.begin(), str.end(), result.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return result;
}

bool StringUtils::starts_with(const std::string& str, const std::string& prefix) {
    return str.starts_with(prefix);
}

std::string StringUtils::format_bytes(size_t bytes) {
    static constexpr std::array<const char*, 5> units{"B", "KB", "MB", "GB", "TB"};
    
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    for (; value >= 1024.0 && unit + 1 < units.size(); ++unit) {
        value /= 1024.0;
    }
    
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value << " " << units[unit];
    return oss.str();
}

std::string StringUtils::format_rate(double bytes_per_second) {
    // NaN and negative rates print as zero, anything past size_t saturates
    constexpr auto max_rate = std::numeric_limits<size_t>::max();
    size_t rate = 0;
    if (bytes_per_second >= static_cast<double>(max_rate)) {
        rate = max_rate;
    } else if (bytes_per_second > 0.0) {
        rate = static_cast<size_t>(bytes_per_second);
    }
    return format_bytes(rate) + "/s";
}

std::string StringUtils::format_duration(std::chrono::milliseconds duration) {
    using namespace std::chrono;
    
    if (duration < seconds(1)) {
        return std::to_string(duration.count()) + "ms";
    }
    if (duration < minutes(1)) {
        return std::to_string(duration_cast<seconds>(duration).count()) + "s";
    }
    
    auto h = duration_cast<hours>(duration);
    auto m = duration_cast<minutes>(duration - h);
    if (h.count() > 0) {
        return std::to_string(h.count()) + "h " + std::to_string(m.count()) + "m";
    }
    
    auto s = duration_cast<seconds>(duration - m);
    return std::to_string(m.count()) + "m " + std::to_string(s.count()) + "s";
}

bool FileUtils::exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

std::optional<std::vector<std::string>> FileUtils::read_lines(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    
    std::vector<std::string> lines;
    for (std::string line; std::getline(file, line);) {
        if (line.ends_with('\r')) {
            line.pop_back();
        }
        lines.push_back(std::move(line));
    }
    return lines;
}

std::filesystem::path FileUtils::expand_home(const std::string& path) {
    if (path == "~") {
        return get_home_dir();
    }
    if (path.starts_with("~/")) {
        return get_home_dir() / path.substr(2);
    }
    return std::filesystem::path(path);
}

std::filesystem::path FileUtils::get_home_dir() {
    for (const char* variable : {"HOME", "USERPROFILE"}) {
        if (const char* value = std::getenv(variable); value && *value) {
            return std::filesystem::path(value);
        }
    }
    return std::filesystem::current_path();
}

}
