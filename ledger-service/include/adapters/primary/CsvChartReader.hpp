#pragma once

#include "domain/ChartImport.hpp"
#include "utils/Strings.hpp"
#include <istream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace accounting::adapters::primary {

/**
 * @brief Ошибка разбора одной строки файла
 */
struct CsvLineError {
    size_t lineNumber = 0;
    std::string message;
};

/**
 * @brief Результат чтения CSV: разобранные строки и ошибки разбора
 */
struct CsvReadResult {
    std::vector<domain::ImportRow> rows;
    std::vector<size_t> lineNumbers;    ///< номер строки файла для каждого элемента rows
    std::vector<CsvLineError> errors;
};

/**
 * @brief Чтение строк импорта плана счетов из CSV
 *
 * Первая строка - заголовок. Обязательные колонки (порядок любой):
 * account_name, main_group, element_group, sub_element_group,
 * detailed_group. Необязательные: description, opening_balance.
 * Поля в двойных кавычках могут содержать запятые и "" как кавычку.
 */
class CsvChartReader {
public:
    /**
     * @throws std::invalid_argument нет заголовка или обязательной колонки
     */
    static CsvReadResult read(std::istream& input) {
        CsvReadResult result;

        std::string line;
        size_t lineNumber = 0;
        std::map<std::string, size_t> columns;

        while (std::getline(input, line)) {
            ++lineNumber;
            stripCarriageReturn(line);
            if (utils::Strings::trim(line).empty()) continue;

            columns = parseHeader(splitLine(line));
            break;
        }
        if (columns.empty()) {
            throw std::invalid_argument("CSV file has no header row");
        }

        while (std::getline(input, line)) {
            ++lineNumber;
            stripCarriageReturn(line);
            if (utils::Strings::trim(line).empty()) continue;

            try {
                auto fields = splitLine(line);
                result.rows.push_back(toRow(fields, columns));
                result.lineNumbers.push_back(lineNumber);
            } catch (const std::invalid_argument& e) {
                result.errors.push_back({lineNumber, e.what()});
            }
        }
        return result;
    }

    /**
     * @brief Разбить строку CSV на поля (RFC 4180 без многострочных полей)
     *
     * @throws std::invalid_argument незакрытая кавычка
     */
    static std::vector<std::string> splitLine(const std::string& line) {
        std::vector<std::string> fields;
        std::string current;
        bool quoted = false;

        for (size_t i = 0; i < line.size(); ++i) {
            char c = line[i];
            if (quoted) {
                if (c == '"') {
                    if (i + 1 < line.size() && line[i + 1] == '"') {
                        current += '"';
                        ++i;
                    } else {
                        quoted = false;
                    }
                } else {
                    current += c;
                }
            } else if (c == '"') {
                quoted = true;
            } else if (c == ',') {
                fields.push_back(current);
                current.clear();
            } else {
                current += c;
            }
        }

        if (quoted) {
            throw std::invalid_argument("Unterminated quoted field");
        }
        fields.push_back(current);
        return fields;
    }

private:
    static void stripCarriageReturn(std::string& line) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
    }

    static std::map<std::string, size_t> parseHeader(const std::vector<std::string>& fields) {
        std::map<std::string, size_t> columns;
        for (size_t i = 0; i < fields.size(); ++i) {
            columns[utils::Strings::toSnakeCase(fields[i])] = i;
        }

        for (const char* required : {"account_name", "main_group", "element_group",
                                     "sub_element_group", "detailed_group"}) {
            if (!columns.count(required)) {
                throw std::invalid_argument(std::string("CSV header is missing column: ") + required);
            }
        }
        return columns;
    }

    static std::string field(
        const std::vector<std::string>& fields,
        const std::map<std::string, size_t>& columns,
        const std::string& name
    ) {
        auto it = columns.find(name);
        if (it == columns.end() || it->second >= fields.size()) {
            return "";
        }
        return utils::Strings::trim(fields[it->second]);
    }

    static domain::ImportRow toRow(
        const std::vector<std::string>& fields,
        const std::map<std::string, size_t>& columns
    ) {
        domain::ImportRow row;
        row.accountName = field(fields, columns, "account_name");
        row.mainGroupName = field(fields, columns, "main_group");
        row.elementGroupName = field(fields, columns, "element_group");
        row.subElementGroupName = field(fields, columns, "sub_element_group");
        row.detailedGroupName = field(fields, columns, "detailed_group");
        row.description = field(fields, columns, "description");

        std::string balance = field(fields, columns, "opening_balance");
        if (!balance.empty()) {
            row.openingBalance = domain::Money::parse(balance);
        }
        return row;
    }
};

} // namespace accounting::adapters::primary
