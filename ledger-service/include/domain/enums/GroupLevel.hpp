#pragma once

#include <string>
#include <optional>
#include <stdexcept>

namespace accounting::domain {

/**
 * @brief Уровень группы в иерархии плана счетов
 *
 * MAIN → ELEMENT → SUB_ELEMENT → DETAILED → (счета)
 */
enum class GroupLevel {
    MAIN,
    ELEMENT,
    SUB_ELEMENT,
    DETAILED
};

inline std::string toString(GroupLevel level) {
    switch (level) {
        case GroupLevel::MAIN:        return "main_group";
        case GroupLevel::ELEMENT:     return "element_group";
        case GroupLevel::SUB_ELEMENT: return "sub_element_group";
        case GroupLevel::DETAILED:    return "detailed_group";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline GroupLevel groupLevelFromString(const std::string& str) {
    if (str == "main_group")        return GroupLevel::MAIN;
    if (str == "element_group")     return GroupLevel::ELEMENT;
    if (str == "sub_element_group") return GroupLevel::SUB_ELEMENT;
    if (str == "detailed_group")    return GroupLevel::DETAILED;
    throw std::invalid_argument("Unknown GroupLevel: " + str);
}

/**
 * @brief Уровень родителя (nullopt для MAIN)
 */
inline std::optional<GroupLevel> parentLevel(GroupLevel level) {
    switch (level) {
        case GroupLevel::MAIN:        return std::nullopt;
        case GroupLevel::ELEMENT:     return GroupLevel::MAIN;
        case GroupLevel::SUB_ELEMENT: return GroupLevel::ELEMENT;
        case GroupLevel::DETAILED:    return GroupLevel::SUB_ELEMENT;
    }
    return std::nullopt;
}

} // namespace accounting::domain
