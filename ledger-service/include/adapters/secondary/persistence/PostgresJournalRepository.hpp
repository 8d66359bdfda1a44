#pragma once

#include "ports/output/IJournalRepository.hpp"
#include "settings/DbSettings.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>
#include <set>

namespace accounting::adapters::secondary {

/**
 * @brief PostgreSQL repository для проводок и строк
 *
 * Каждая пишущая операция выполняется в одной pqxx::work:
 * заголовок, строки и пересчёт current_balance затронутых счетов.
 * Строки счетов блокируются SELECT ... FOR UPDATE в порядке id.
 *
 * Создание проводки с документом-источником дополнительно берёт
 * pg_advisory_xact_lock по ключу источника; уникальный индекс
 * uq_journal_entries_source гарантирует не более одной проводки.
 */
class PostgresJournalRepository : public ports::output::IJournalRepository {
public:
    explicit PostgresJournalRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresJournalRepository] Initialized" << std::endl;
    }

    domain::JournalEntry create(
        const domain::JournalEntry& entry,
        const std::vector<domain::JournalEntryLine>& lines
    ) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            if (entry.hasSource()) {
                txn.exec_params(
                    "SELECT pg_advisory_xact_lock(hashtext($1))",
                    sourceLockKey(entry.tenantId, *entry.sourceDocument, *entry.sourceDocumentId)
                );

                auto existing = txn.exec_params(
                    "SELECT id FROM journal_entries "
                    "WHERE tenant_id = $1 AND source_document = $2 AND source_document_id = $3",
                    entry.tenantId, *entry.sourceDocument, *entry.sourceDocumentId
                );
                if (!existing.empty()) {
                    throw domain::DuplicateSourceDocumentError(*entry.sourceDocument, *entry.sourceDocumentId);
                }
            }

            auto accountIds = accountIdsOf(lines);
            lockAccounts(txn, entry.tenantId, accountIds);

            auto result = txn.exec_params(
                "INSERT INTO journal_entries "
                "(tenant_id, entry_date, reference, entry_type, description, is_posted, "
                " source_document, source_document_id, total_amount, created_by, updated_by, created_at, updated_at) "
                "VALUES ($1, to_timestamp($2), $3, $4, $5, $6, $7, $8, $9, $10, $11, to_timestamp($12), to_timestamp($13)) "
                "RETURNING id",
                entry.tenantId,
                entry.entryDate.toUnixSeconds(),
                entry.reference,
                entry.entryType,
                entry.description,
                entry.isPosted,
                entry.sourceDocument,
                entry.sourceDocumentId,
                entry.totalAmount.minor(),
                entry.createdBy,
                entry.updatedBy,
                entry.createdAt.toUnixSeconds(),
                entry.updatedAt.toUnixSeconds()
            );

            domain::JournalEntry saved = entry;
            saved.id = result[0][0].as<int64_t>();

            insertLines(txn, saved.id, lines);
            recomputeBalances(txn, entry.tenantId, accountIds);

            txn.commit();
            std::cout << "[PostgresJournalRepository] Saved entry: " << saved.id << std::endl;
            return saved;
        } catch (const pqxx::unique_violation& e) {
            std::cerr << "[PostgresJournalRepository] create duplicate: " << e.what() << std::endl;
            if (entry.hasSource()) {
                throw domain::DuplicateSourceDocumentError(*entry.sourceDocument, *entry.sourceDocumentId);
            }
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresJournalRepository] create error: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<int64_t> replaceLines(
        const domain::JournalEntry& entry,
        const std::vector<domain::JournalEntryLine>& lines
    ) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto locked = txn.exec_params(
                "SELECT id FROM journal_entries WHERE tenant_id = $1 AND id = $2 FOR UPDATE",
                entry.tenantId, entry.id
            );
            if (locked.empty()) {
                throw domain::NotFoundError("JournalEntry", entry.id);
            }

            std::set<int64_t> touched;
            for (auto id : currentAccountIds(txn, entry.id)) touched.insert(id);
            for (auto id : accountIdsOf(lines)) touched.insert(id);
            std::vector<int64_t> accountIds(touched.begin(), touched.end());

            lockAccounts(txn, entry.tenantId, accountIds);

            txn.exec_params("DELETE FROM journal_entry_lines WHERE journal_entry_id = $1", entry.id);
            insertLines(txn, entry.id, lines);
            writeHeader(txn, entry);
            recomputeBalances(txn, entry.tenantId, accountIds);

            txn.commit();
            return accountIds;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresJournalRepository] replaceLines error: " << e.what() << std::endl;
            throw;
        }
    }

    void updateHeader(const domain::JournalEntry& entry) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            if (writeHeader(txn, entry) == 0) {
                throw domain::NotFoundError("JournalEntry", entry.id);
            }

            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresJournalRepository] updateHeader error: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<int64_t> remove(int64_t tenantId, int64_t entryId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto locked = txn.exec_params(
                "SELECT id FROM journal_entries WHERE tenant_id = $1 AND id = $2 FOR UPDATE",
                tenantId, entryId
            );
            if (locked.empty()) {
                return {};
            }

            auto accountIds = currentAccountIds(txn, entryId);
            lockAccounts(txn, tenantId, accountIds);

            // Строки удаляются каскадом
            txn.exec_params("DELETE FROM journal_entries WHERE tenant_id = $1 AND id = $2", tenantId, entryId);
            recomputeBalances(txn, tenantId, accountIds);

            txn.commit();
            std::cout << "[PostgresJournalRepository] Deleted entry: " << entryId << std::endl;
            return accountIds;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresJournalRepository] remove error: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::JournalEntry> findById(int64_t tenantId, int64_t entryId) override {
        auto entries = queryEntries("findById", "WHERE tenant_id = $1 AND id = $2", tenantId, entryId);
        if (entries.empty()) return std::nullopt;
        return entries.front();
    }

    std::optional<domain::JournalEntry> findBySource(
        int64_t tenantId,
        const std::string& sourceDocument,
        int64_t sourceDocumentId
    ) override {
        auto entries = queryEntries(
            "findBySource",
            "WHERE tenant_id = $1 AND source_document = $2 AND source_document_id = $3",
            tenantId, sourceDocument, sourceDocumentId
        );
        if (entries.empty()) return std::nullopt;
        return entries.front();
    }

    std::vector<domain::JournalEntryLine> findLines(int64_t tenantId, int64_t entryId) override {
        std::vector<domain::JournalEntryLine> lines;
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT l.id, l.journal_entry_id, l.account_id, l.debit_amount, l.credit_amount, "
                "       l.line_order, l.description "
                "FROM journal_entry_lines l JOIN journal_entries e ON e.id = l.journal_entry_id "
                "WHERE e.tenant_id = $1 AND e.id = $2 "
                "ORDER BY l.line_order",
                tenantId, entryId
            );

            for (const auto& row : result) {
                domain::JournalEntryLine line;
                line.id = row["id"].as<int64_t>();
                line.journalEntryId = row["journal_entry_id"].as<int64_t>();
                line.accountId = row["account_id"].as<int64_t>();
                line.debitAmount = domain::Money::fromMinor(row["debit_amount"].as<int64_t>());
                line.creditAmount = domain::Money::fromMinor(row["credit_amount"].as<int64_t>());
                line.lineOrder = row["line_order"].as<int>();
                line.description = row["description"].as<std::string>();
                lines.push_back(std::move(line));
            }

            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresJournalRepository] findLines error: " << e.what() << std::endl;
            throw;
        }
        return lines;
    }

    std::vector<domain::JournalEntry> findEntries(
        int64_t tenantId,
        const domain::JournalEntryFilter& filter
    ) override {
        std::optional<int64_t> fromDate;
        std::optional<int64_t> toDate;
        if (filter.fromDate) fromDate = filter.fromDate->toUnixSeconds();
        if (filter.toDate) toDate = filter.toDate->toUnixSeconds();

        return queryEntries(
            "findEntries",
            "WHERE tenant_id = $1 "
            "  AND ($2::BIGINT IS NULL OR entry_date >= to_timestamp($2)) "
            "  AND ($3::BIGINT IS NULL OR entry_date <= to_timestamp($3)) "
            "  AND ($4::TEXT IS NULL OR entry_type = $4) "
            "  AND ($5::BOOLEAN IS NULL OR is_posted = $5) "
            "  AND ($6::TEXT IS NULL OR source_document = $6)",
            tenantId, fromDate, toDate, filter.entryType, filter.isPosted, filter.sourceDocument
        );
    }

    std::vector<domain::AccountMovement> findMovements(int64_t tenantId, int64_t accountId) override {
        std::vector<domain::AccountMovement> movements;
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT e.id AS entry_id, EXTRACT(EPOCH FROM e.entry_date)::BIGINT AS entry_date, "
                "       e.reference, e.entry_type, e.description AS entry_description, e.is_posted, "
                "       l.id AS line_id, l.line_order, l.description AS line_description, "
                "       l.debit_amount, l.credit_amount "
                "FROM journal_entry_lines l JOIN journal_entries e ON e.id = l.journal_entry_id "
                "WHERE e.tenant_id = $1 AND l.account_id = $2 "
                "ORDER BY e.entry_date, e.id, l.line_order",
                tenantId, accountId
            );

            for (const auto& row : result) {
                domain::AccountMovement movement;
                movement.entryId = row["entry_id"].as<int64_t>();
                movement.entryDate = domain::Timestamp::fromUnixSeconds(row["entry_date"].as<int64_t>());
                movement.reference = row["reference"].as<std::string>();
                movement.entryType = row["entry_type"].as<std::string>();
                movement.entryDescription = row["entry_description"].as<std::string>();
                movement.isPosted = row["is_posted"].as<bool>();
                movement.lineId = row["line_id"].as<int64_t>();
                movement.lineOrder = row["line_order"].as<int>();
                movement.lineDescription = row["line_description"].as<std::string>();
                movement.debitAmount = domain::Money::fromMinor(row["debit_amount"].as<int64_t>());
                movement.creditAmount = domain::Money::fromMinor(row["credit_amount"].as<int64_t>());
                movements.push_back(std::move(movement));
            }

            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresJournalRepository] findMovements error: " << e.what() << std::endl;
            throw;
        }
        return movements;
    }

    size_t countLinesForAccount(int64_t tenantId, int64_t accountId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT COUNT(*) FROM journal_entry_lines l JOIN journal_entries e ON e.id = l.journal_entry_id "
                "WHERE e.tenant_id = $1 AND l.account_id = $2",
                tenantId, accountId
            );

            txn.commit();
            return result[0][0].as<size_t>();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresJournalRepository] countLinesForAccount error: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    static std::string sourceLockKey(int64_t tenantId, const std::string& document, int64_t documentId) {
        return "journal:" + std::to_string(tenantId) + ":" + document + ":" + std::to_string(documentId);
    }

    static std::vector<int64_t> accountIdsOf(const std::vector<domain::JournalEntryLine>& lines) {
        std::set<int64_t> ids;
        for (const auto& line : lines) ids.insert(line.accountId);
        return {ids.begin(), ids.end()};
    }

    std::vector<int64_t> currentAccountIds(pqxx::work& txn, int64_t entryId) {
        auto result = txn.exec_params(
            "SELECT DISTINCT account_id FROM journal_entry_lines WHERE journal_entry_id = $1 ORDER BY account_id",
            entryId
        );
        std::vector<int64_t> ids;
        for (const auto& row : result) {
            ids.push_back(row[0].as<int64_t>());
        }
        return ids;
    }

    /**
     * @brief Блокировка строк счетов; ids отсортированы, что исключает взаимоблокировки
     */
    void lockAccounts(pqxx::work& txn, int64_t tenantId, const std::vector<int64_t>& accountIds) {
        for (auto accountId : accountIds) {
            auto result = txn.exec_params(
                "SELECT id FROM accounts WHERE tenant_id = $1 AND id = $2 FOR UPDATE",
                tenantId, accountId
            );
            if (result.empty()) {
                throw domain::NotFoundError("Account", accountId);
            }
        }
    }

    void insertLines(pqxx::work& txn, int64_t entryId, const std::vector<domain::JournalEntryLine>& lines) {
        for (const auto& line : lines) {
            txn.exec_params(
                "INSERT INTO journal_entry_lines "
                "(journal_entry_id, account_id, debit_amount, credit_amount, line_order, description) "
                "VALUES ($1, $2, $3, $4, $5, $6)",
                entryId,
                line.accountId,
                line.debitAmount.minor(),
                line.creditAmount.minor(),
                line.lineOrder,
                line.description
            );
        }
    }

    pqxx::result::size_type writeHeader(pqxx::work& txn, const domain::JournalEntry& entry) {
        auto result = txn.exec_params(
            "UPDATE journal_entries SET entry_date = to_timestamp($1), reference = $2, description = $3, "
            "is_posted = $4, total_amount = $5, updated_by = $6, updated_at = to_timestamp($7) "
            "WHERE tenant_id = $8 AND id = $9",
            entry.entryDate.toUnixSeconds(),
            entry.reference,
            entry.description,
            entry.isPosted,
            entry.totalAmount.minor(),
            entry.updatedBy,
            entry.updatedAt.toUnixSeconds(),
            entry.tenantId,
            entry.id
        );
        return result.affected_rows();
    }

    /**
     * @brief current_balance = opening_balance + знаковая сумма всех строк счёта
     */
    void recomputeBalances(pqxx::work& txn, int64_t tenantId, const std::vector<int64_t>& accountIds) {
        for (auto accountId : accountIds) {
            txn.exec_params(
                "UPDATE accounts a SET current_balance = a.opening_balance + COALESCE(("
                "  SELECT SUM(CASE WHEN a.account_type IN ('asset', 'expense') "
                "                  THEN l.debit_amount - l.credit_amount "
                "                  ELSE l.credit_amount - l.debit_amount END) "
                "  FROM journal_entry_lines l JOIN journal_entries e ON e.id = l.journal_entry_id "
                "  WHERE l.account_id = a.id AND e.tenant_id = a.tenant_id"
                "), 0) "
                "WHERE a.tenant_id = $1 AND a.id = $2",
                tenantId, accountId
            );
        }
    }

    template <typename... Args>
    std::vector<domain::JournalEntry> queryEntries(const char* operation, const std::string& where, Args&&... args) {
        std::vector<domain::JournalEntry> entries;
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT id, tenant_id, EXTRACT(EPOCH FROM entry_date)::BIGINT AS entry_date, reference, "
                "       entry_type, description, is_posted, source_document, source_document_id, "
                "       total_amount, created_by, updated_by, "
                "       EXTRACT(EPOCH FROM created_at)::BIGINT AS created_at, "
                "       EXTRACT(EPOCH FROM updated_at)::BIGINT AS updated_at "
                "FROM journal_entries " + where + " ORDER BY entry_date, id",
                std::forward<Args>(args)...
            );

            for (const auto& row : result) {
                entries.push_back(rowToEntry(row));
            }

            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresJournalRepository] " << operation << " error: " << e.what() << std::endl;
            throw;
        }
        return entries;
    }

    domain::JournalEntry rowToEntry(const pqxx::row& row) const {
        domain::JournalEntry entry;
        entry.id = row["id"].as<int64_t>();
        entry.tenantId = row["tenant_id"].as<int64_t>();
        entry.entryDate = domain::Timestamp::fromUnixSeconds(row["entry_date"].as<int64_t>());
        entry.reference = row["reference"].as<std::string>();
        entry.entryType = row["entry_type"].as<std::string>();
        entry.description = row["description"].as<std::string>();
        entry.isPosted = row["is_posted"].as<bool>();
        if (!row["source_document"].is_null()) {
            entry.sourceDocument = row["source_document"].as<std::string>();
        }
        if (!row["source_document_id"].is_null()) {
            entry.sourceDocumentId = row["source_document_id"].as<int64_t>();
        }
        entry.totalAmount = domain::Money::fromMinor(row["total_amount"].as<int64_t>());
        entry.createdBy = row["created_by"].as<std::string>();
        entry.updatedBy = row["updated_by"].as<std::string>();
        entry.createdAt = domain::Timestamp::fromUnixSeconds(row["created_at"].as<int64_t>());
        entry.updatedAt = domain::Timestamp::fromUnixSeconds(row["updated_at"].as<int64_t>());
        return entry;
    }
};

} // namespace accounting::adapters::secondary
