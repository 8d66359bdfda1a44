#pragma once

#include "domain/Account.hpp"
#include "domain/AccountGroup.hpp"
#include "domain/LedgerPage.hpp"
#include "domain/ChartImport.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include <nlohmann/json.hpp>

namespace accounting::adapters::primary {

/**
 * @brief Представление результатов ядра в JSON для ledger-admin
 *
 * Суммы выводятся десятичной строкой ("1150.00"), без double.
 */
class LedgerJson {
public:
    static nlohmann::json accountToJson(const domain::Account& account) {
        nlohmann::json j;
        j["id"] = account.id;
        j["code"] = account.accountCode;
        j["name"] = account.accountName;
        j["description"] = account.description;
        j["type"] = domain::toString(account.accountType);
        j["detailed_group_id"] = account.detailedGroupId;
        j["entity_id"] = account.entityId ? nlohmann::json(*account.entityId) : nlohmann::json(nullptr);
        j["is_system"] = account.isSystemAccount;
        j["is_active"] = account.isActive;
        j["opening_balance"] = account.openingBalance.toString();
        j["current_balance"] = account.currentBalance.toString();
        return j;
    }

    static nlohmann::json accountsToJson(const std::vector<domain::Account>& accounts) {
        nlohmann::json result = nlohmann::json::array();
        for (const auto& account : accounts) {
            result.push_back(accountToJson(account));
        }
        return result;
    }

    static nlohmann::json groupToJson(const domain::AccountGroup& group) {
        nlohmann::json j;
        j["id"] = group.id;
        j["level"] = domain::toString(group.level);
        j["parent_id"] = group.parentId ? nlohmann::json(*group.parentId) : nlohmann::json(nullptr);
        j["kind"] = domain::toString(group.kind);
        j["name"] = group.label();
        j["code"] = group.code;
        j["is_active"] = group.isActive;
        return j;
    }

    static nlohmann::json ledgerToJson(const domain::LedgerPage& page) {
        nlohmann::json j;
        j["account"] = accountToJson(page.account);
        j["page"] = page.page;
        j["page_size"] = page.pageSize;
        j["total_rows"] = page.totalRows;
        j["opening_balance"] = page.openingBalance.toString();
        j["page_opening_balance"] = page.pageOpeningBalance.toString();
        j["running_balance"] = page.runningBalance.toString();

        nlohmann::json rows = nlohmann::json::array();
        for (const auto& row : page.rows) {
            const auto& m = row.movement;
            nlohmann::json r;
            r["entry_id"] = m.entryId;
            r["date"] = m.entryDate.toDateString();
            r["reference"] = m.reference;
            r["entry_type"] = m.entryType;
            r["description"] = m.lineDescription.empty() ? m.entryDescription : m.lineDescription;
            r["is_posted"] = m.isPosted;
            r["debit"] = m.debitAmount.toString();
            r["credit"] = m.creditAmount.toString();
            r["balance"] = row.runningBalance.toString();
            rows.push_back(r);
        }
        j["rows"] = rows;
        return j;
    }

    static nlohmann::json trialBalanceToJson(const domain::TrialBalance& trialBalance) {
        nlohmann::json rows = nlohmann::json::array();
        for (const auto& row : trialBalance.rows) {
            nlohmann::json r;
            r["account_id"] = row.accountId;
            r["code"] = row.accountCode;
            r["name"] = row.accountName;
            r["type"] = domain::toString(row.accountType);
            r["debit"] = row.debitBalance.toString();
            r["credit"] = row.creditBalance.toString();
            rows.push_back(r);
        }

        nlohmann::json j;
        j["rows"] = rows;
        j["total_debit"] = trialBalance.totalDebit.toString();
        j["total_credit"] = trialBalance.totalCredit.toString();
        j["balanced"] = trialBalance.isBalanced();
        return j;
    }

    static nlohmann::json importReportToJson(const domain::ImportReport& report) {
        nlohmann::json rows = nlohmann::json::array();
        for (const auto& row : report.rows) {
            nlohmann::json r;
            r["row"] = row.rowNumber;
            r["success"] = row.success;
            r["account_id"] = row.accountId ? nlohmann::json(*row.accountId) : nlohmann::json(nullptr);
            r["account_code"] = row.accountCode;
            r["message"] = row.message;
            rows.push_back(r);
        }

        nlohmann::json j;
        j["succeeded"] = report.succeeded();
        j["failed"] = report.failed();
        j["rows"] = rows;
        return j;
    }

    /**
     * @brief {"error": ..., "message": ..., "missing": [...]} для вывода ошибок
     */
    static nlohmann::json errorToJson(const std::string& error, const std::exception& e) {
        nlohmann::json j;
        j["error"] = error;
        j["message"] = e.what();

        if (auto missing = dynamic_cast<const domain::MissingAccountError*>(&e)) {
            nlohmann::json gaps = nlohmann::json::array();
            for (const auto& gap : missing->missing()) {
                gaps.push_back({{"role", gap.role}, {"dependency", gap.dependency}, {"guidance", gap.guidance}});
            }
            j["missing"] = gaps;
        }
        return j;
    }
};

} // namespace accounting::adapters::primary
