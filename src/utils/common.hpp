#pragma once

#include <cctype>
#include <sstream>
#include <string>
#include <vector>

namespace pyrunner::utils {

inline std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

inline std::vector<std::string> SplitWhitespace(const std::string& value) {
    std::vector<std::string> items;
    std::istringstream stream(value);
    std::string item;
    while (stream >> item) {
        items.push_back(item);
    }
    return items;
}

inline std::string Trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

inline bool IsBlank(const std::string& value) {
    for (unsigned char c : value) {
        if (!std::isspace(c)) {
            return false;
        }
    }
    return true;
}

// Cuts at most max_chars and appends an ellipsis when something was dropped.
inline std::string Abbreviate(const std::string& value, std::size_t max_chars) {
    if (value.size() <= max_chars) {
        return value;
    }
    return value.substr(0, max_chars) + "...";
}

}  // namespace pyrunner::utils
