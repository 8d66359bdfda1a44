#pragma once

#include <string>
#include <algorithm>
#include <cctype>

namespace accounting::utils {

/**
 * @brief Строковые утилиты для сопоставления имён групп и счетов
 */
class Strings {
public:
    static std::string trim(const std::string& value) {
        size_t begin = 0;
        size_t end = value.size();
        while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) ++begin;
        while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) --end;
        return value.substr(begin, end - begin);
    }

    static std::string toLower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    static bool equalsIgnoreCase(const std::string& a, const std::string& b) {
        return toLower(a) == toLower(b);
    }

    static bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
        return toLower(haystack).find(toLower(needle)) != std::string::npos;
    }

    /**
     * @brief "Current Assets" → "current_assets"
     */
    static std::string toSnakeCase(const std::string& value) {
        std::string result;
        bool pendingSeparator = false;
        for (char c : trim(value)) {
            unsigned char uc = static_cast<unsigned char>(c);
            if (std::isspace(uc) || c == '-' || c == '_') {
                pendingSeparator = !result.empty();
                continue;
            }
            if (pendingSeparator) {
                result += '_';
                pendingSeparator = false;
            }
            result += static_cast<char>(std::tolower(uc));
        }
        return result;
    }
};

} // namespace accounting::utils
