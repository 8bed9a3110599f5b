#pragma once

#include <sstream>
#include <string>
#include <vector>

namespace pysandbox::utils {

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

inline std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        const auto begin = item.find_first_not_of(" \t");
        if (begin == std::string::npos) {
            continue;
        }
        const auto end = item.find_last_not_of(" \t");
        items.push_back(item.substr(begin, end - begin + 1));
    }
    return items;
}

// "1" for 1.0, "2.5" for 2.5.
inline std::string FormatSeconds(double seconds) {
    if (seconds > -1e15 && seconds < 1e15) {
        const auto whole = static_cast<long long>(seconds);
        if (static_cast<double>(whole) == seconds) {
            return std::to_string(whole);
        }
    }
    std::ostringstream oss;
    oss << seconds;
    return oss.str();
}

}  // namespace pysandbox::utils
