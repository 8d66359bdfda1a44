#pragma once

#include "Money.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace accounting::domain {

/**
 * @brief Строка массового импорта плана счетов
 */
struct ImportRow {
    std::string accountName;
    std::string mainGroupName;
    std::string elementGroupName;
    std::string subElementGroupName;
    std::string detailedGroupName;
    std::string description;
    Money openingBalance;
};

/**
 * @brief Результат импорта одной строки
 */
struct ImportRowResult {
    size_t rowNumber = 0;       ///< 1-based
    bool success = false;
    std::optional<int64_t> accountId;
    std::string accountCode;
    std::string message;        ///< текст ошибки при success == false
};

struct ImportReport {
    std::vector<ImportRowResult> rows;

    size_t succeeded() const {
        size_t count = 0;
        for (const auto& row : rows) {
            if (row.success) ++count;
        }
        return count;
    }

    size_t failed() const { return rows.size() - succeeded(); }
};

} // namespace accounting::domain
