#ifndef CLINFUSE_COMMON_HPP
#define CLINFUSE_COMMON_HPP

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>
#include <vector>

namespace clinfuse {

inline std::string ltrim(std::string value) {
    auto it = std::find_if_not(value.begin(), value.end(), [](unsigned char ch) {
        return std::isspace(ch) != 0;
    });
    value.erase(value.begin(), it);
    return value;
}

inline std::string rtrim(std::string value) {
    auto it = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char ch) {
        return std::isspace(ch) != 0;
    });
    value.erase(it.base(), value.end());
    return value;
}

inline std::string trim(std::string value) {
    return rtrim(ltrim(std::move(value)));
}

inline std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

inline std::string to_upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    return value;
}

inline std::string strip_quotes(std::string value) {
    if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                              (value.front() == '\'' && value.back() == '\''))) {
        value = value.substr(1, value.size() - 2);
    }
    return value;
}

inline std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string output;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            output += separator;
        }
        output += parts[i];
    }
    return output;
}

inline double clamp_unit(double value) {
    return std::clamp(value, 0.0, 1.0);
}

// Rounds to a fixed number of decimals so that reported scores stay stable
// across platforms that print doubles differently.
inline double round_to(double value, int decimals) {
    double scale = 1.0;
    for (int i = 0; i < decimals; ++i) {
        scale *= 10.0;
    }
    return static_cast<double>(static_cast<long long>(value * scale + (value >= 0.0 ? 0.5 : -0.5))) / scale;
}

}  // namespace clinfuse

#endif  // CLINFUSE_COMMON_HPP
