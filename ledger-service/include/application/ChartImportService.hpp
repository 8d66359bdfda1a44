#pragma once

#include "ports/input/IChartImportService.hpp"
#include "ports/input/IChartOfAccountsService.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include "utils/Strings.hpp"
#include <memory>
#include <iostream>
#include <map>

namespace accounting::application {

/**
 * @brief Массовый импорт плана счетов
 *
 * Для каждой строки разрешает или создаёт группы всех четырёх уровней
 * и создаёт счёт. Имена Sub/Detailed групп сначала сопоставляются с
 * предопределёнными видами уровня, иначе используется CUSTOM-группа с
 * тем же именем (без учёта регистра), созданная при необходимости один раз.
 *
 * Строки независимы: группы, созданные строкой до её ошибки, остаются.
 */
class ChartImportService : public ports::input::IChartImportService {
public:
    explicit ChartImportService(std::shared_ptr<ports::input::IChartOfAccountsService> chartService)
        : chartService_(std::move(chartService))
    {
        std::cout << "[ChartImportService] Created" << std::endl;
    }

    domain::ImportReport importChart(int64_t tenantId, const std::vector<domain::ImportRow>& rows) override {
        domain::ImportReport report;

        for (size_t i = 0; i < rows.size(); ++i) {
            domain::ImportRowResult result;
            result.rowNumber = i + 1;

            try {
                auto account = importRow(tenantId, rows[i]);
                result.success = true;
                result.accountId = account.id;
                result.accountCode = account.accountCode;
                result.message = "Created " + account.accountCode;
            } catch (const domain::LedgerError& e) {
                std::cerr << "[ChartImportService] Row " << result.rowNumber << " failed: " << e.what() << std::endl;
                result.success = false;
                result.message = e.what();
            }

            report.rows.push_back(std::move(result));
        }

        std::cout << "[ChartImportService] Imported tenant=" << tenantId
                  << " succeeded=" << report.succeeded()
                  << " failed=" << report.failed() << std::endl;
        return report;
    }

private:
    std::shared_ptr<ports::input::IChartOfAccountsService> chartService_;

    domain::Account importRow(int64_t tenantId, const domain::ImportRow& row) {
        std::string accountName = utils::Strings::trim(row.accountName);
        if (accountName.empty()) {
            throw domain::ValidationError("Account name is required");
        }

        auto mainKind = mainGroupKind(row.mainGroupName);
        auto main = findOrCreate(tenantId, domain::GroupLevel::MAIN, std::nullopt, mainKind, "");

        auto elementKind = elementGroupKind(row.elementGroupName);
        if (domain::requiredMainGroup(elementKind) != mainKind) {
            throw domain::ValidationError("Element group '" + row.elementGroupName +
                                          "' does not belong under " + domain::displayName(mainKind));
        }
        auto element = findOrCreate(tenantId, domain::GroupLevel::ELEMENT, main.id, elementKind, "");

        auto sub = findOrCreateNamed(tenantId, domain::GroupLevel::SUB_ELEMENT, element.id, row.subElementGroupName);
        auto detailed = findOrCreateNamed(tenantId, domain::GroupLevel::DETAILED, sub.id, row.detailedGroupName);

        domain::AccountOptions options;
        options.description = utils::Strings::trim(row.description);
        return chartService_->createAccount(tenantId, detailed.id, accountName, row.openingBalance, options);
    }

    /**
     * @brief "BS", "Balance Sheet", "P&L", "Income Statement", ...
     */
    static domain::GroupKind mainGroupKind(const std::string& name) {
        static const std::map<std::string, domain::GroupKind> aliases = {
            {"bs", domain::GroupKind::BALANCE_SHEET},
            {"balance_sheet", domain::GroupKind::BALANCE_SHEET},
            {"statement_of_financial_position", domain::GroupKind::BALANCE_SHEET},
            {"pl", domain::GroupKind::PROFIT_AND_LOSS},
            {"p&l", domain::GroupKind::PROFIT_AND_LOSS},
            {"profit_and_loss", domain::GroupKind::PROFIT_AND_LOSS},
            {"profit_&_loss", domain::GroupKind::PROFIT_AND_LOSS},
            {"profit_loss", domain::GroupKind::PROFIT_AND_LOSS},
            {"income_statement", domain::GroupKind::PROFIT_AND_LOSS},
        };
        auto it = aliases.find(utils::Strings::toSnakeCase(name));
        if (it == aliases.end()) {
            throw domain::ValidationError("Unknown main group: '" + name + "'");
        }
        return it->second;
    }

    static domain::GroupKind elementGroupKind(const std::string& name) {
        static const std::map<std::string, domain::GroupKind> aliases = {
            {"asset", domain::GroupKind::ASSETS},
            {"assets", domain::GroupKind::ASSETS},
            {"liability", domain::GroupKind::LIABILITIES},
            {"liabilities", domain::GroupKind::LIABILITIES},
            {"equity", domain::GroupKind::EQUITY},
            {"owners_equity", domain::GroupKind::EQUITY},
            {"income", domain::GroupKind::INCOMES},
            {"incomes", domain::GroupKind::INCOMES},
            {"revenue", domain::GroupKind::INCOMES},
            {"revenues", domain::GroupKind::INCOMES},
            {"expense", domain::GroupKind::EXPENSES},
            {"expenses", domain::GroupKind::EXPENSES},
        };
        auto it = aliases.find(utils::Strings::toSnakeCase(name));
        if (it == aliases.end()) {
            throw domain::ValidationError("Unknown element group: '" + name + "'");
        }
        return it->second;
    }

    /**
     * @brief Предопределённый вид уровня по имени или отображаемому имени
     */
    static std::optional<domain::GroupKind> predefinedKindAt(domain::GroupLevel level, const std::string& name) {
        std::string snake = utils::Strings::toSnakeCase(name);
        for (int i = 0; i < static_cast<int>(domain::GroupKind::CUSTOM); ++i) {
            auto kind = static_cast<domain::GroupKind>(i);
            if (domain::levelOf(kind) != level) continue;
            if (domain::toString(kind) == snake ||
                utils::Strings::equalsIgnoreCase(domain::displayName(kind), utils::Strings::trim(name))) {
                return kind;
            }
        }
        return std::nullopt;
    }

    domain::AccountGroup findOrCreate(
        int64_t tenantId,
        domain::GroupLevel level,
        std::optional<int64_t> parentId,
        domain::GroupKind kind,
        const std::string& customName
    ) {
        for (auto& group : chartService_->listGroups(tenantId, level, parentId)) {
            if (group.kind != kind) continue;
            if (kind != domain::GroupKind::CUSTOM ||
                utils::Strings::equalsIgnoreCase(group.customName, customName)) {
                return group;
            }
        }

        ports::input::CreateGroupRequest request;
        request.tenantId = tenantId;
        request.level = level;
        request.parentId = parentId;
        request.kind = kind;
        request.customName = customName;
        return chartService_->createGroup(request);
    }

    domain::AccountGroup findOrCreateNamed(
        int64_t tenantId,
        domain::GroupLevel level,
        int64_t parentId,
        const std::string& name
    ) {
        std::string trimmed = utils::Strings::trim(name);
        if (trimmed.empty()) {
            throw domain::ValidationError(domain::toString(level) + " name is required");
        }

        if (auto kind = predefinedKindAt(level, trimmed)) {
            return findOrCreate(tenantId, level, parentId, *kind, "");
        }
        return findOrCreate(tenantId, level, parentId, domain::GroupKind::CUSTOM, trimmed);
    }
};

} // namespace accounting::application
