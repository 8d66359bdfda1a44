#pragma once

#include "enums/GroupLevel.hpp"
#include "enums/GroupKind.hpp"
#include "Timestamp.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace accounting::domain {

/**
 * @brief Узел иерархии плана счетов (один тип на все четыре уровня)
 *
 * MainGroup не имеет родителя; остальные уровни ссылаются ровно на
 * одного родителя уровнем выше.
 */
struct AccountGroup {
    int64_t id = 0;
    int64_t tenantId = 0;
    GroupLevel level = GroupLevel::MAIN;
    std::optional<int64_t> parentId;    ///< nullopt только для MAIN
    GroupKind kind = GroupKind::CUSTOM;
    std::string customName;             ///< заполнено только для CUSTOM
    std::string code;                   ///< "BS-A-CA-TD"
    std::string description;
    bool isActive = true;
    Timestamp createdAt;

    /**
     * @brief Семантическое имя: customName для CUSTOM, иначе имя вида
     */
    std::string name() const {
        return kind == GroupKind::CUSTOM ? customName : toString(kind);
    }

    /**
     * @brief Имя для отображения ("Current Assets" или свободное имя)
     */
    std::string label() const {
        return kind == GroupKind::CUSTOM ? customName : displayName(kind);
    }

    /**
     * @brief Собственный сегмент кода: "TD" для "BS-A-CA-TD"
     */
    std::string segment() const {
        auto pos = code.rfind('-');
        return pos == std::string::npos ? code : code.substr(pos + 1);
    }
};

/**
 * @brief Цепочка предков DetailedGroup: от MainGroup до самой группы
 */
struct GroupPath {
    AccountGroup main;
    AccountGroup element;
    AccountGroup subElement;
    AccountGroup detailed;
};

} // namespace accounting::domain
