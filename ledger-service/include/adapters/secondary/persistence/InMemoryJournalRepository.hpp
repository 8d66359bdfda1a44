#pragma once

#include "ports/output/IJournalRepository.hpp"
#include "adapters/secondary/persistence/InMemoryLedgerStore.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include <memory>
#include <algorithm>
#include <set>

namespace accounting::adapters::secondary {

/**
 * @brief In-memory реализация репозитория проводок
 *
 * Запись строк и пересчёт остатков выполняются под одним захватом
 * мьютекса хранилища.
 */
class InMemoryJournalRepository : public ports::output::IJournalRepository {
public:
    explicit InMemoryJournalRepository(std::shared_ptr<InMemoryLedgerStore> store)
        : store_(std::move(store)) {}

    domain::JournalEntry create(
        const domain::JournalEntry& entry,
        const std::vector<domain::JournalEntryLine>& lines
    ) override {
        auto guard = store_->lock();

        if (entry.hasSource() && findBySourceLocked(entry.tenantId, *entry.sourceDocument, *entry.sourceDocumentId)) {
            throw domain::DuplicateSourceDocumentError(*entry.sourceDocument, *entry.sourceDocumentId);
        }

        domain::JournalEntry saved = entry;
        saved.id = store_->nextEntryId++;
        store_->entries[saved.id] = saved;
        store_->lines[saved.id] = assignIds(saved.id, lines);

        for (auto accountId : accountIdsOf(lines)) {
            store_->recomputeBalance(saved.tenantId, accountId);
        }
        return saved;
    }

    std::vector<int64_t> replaceLines(
        const domain::JournalEntry& entry,
        const std::vector<domain::JournalEntryLine>& lines
    ) override {
        auto guard = store_->lock();

        auto it = store_->entries.find(entry.id);
        if (it == store_->entries.end() || it->second.tenantId != entry.tenantId) {
            throw domain::NotFoundError("JournalEntry", entry.id);
        }

        std::set<int64_t> touched;
        for (const auto& line : store_->lines[entry.id]) {
            touched.insert(line.accountId);
        }
        for (auto accountId : accountIdsOf(lines)) {
            touched.insert(accountId);
        }

        it->second = entry;
        store_->lines[entry.id] = assignIds(entry.id, lines);

        for (auto accountId : touched) {
            store_->recomputeBalance(entry.tenantId, accountId);
        }
        return std::vector<int64_t>(touched.begin(), touched.end());
    }

    void updateHeader(const domain::JournalEntry& entry) override {
        auto guard = store_->lock();
        auto it = store_->entries.find(entry.id);
        if (it == store_->entries.end() || it->second.tenantId != entry.tenantId) {
            throw domain::NotFoundError("JournalEntry", entry.id);
        }
        it->second = entry;
    }

    std::vector<int64_t> remove(int64_t tenantId, int64_t entryId) override {
        auto guard = store_->lock();

        auto it = store_->entries.find(entryId);
        if (it == store_->entries.end() || it->second.tenantId != tenantId) {
            return {};
        }

        auto touched = accountIdsOf(store_->lines[entryId]);
        store_->lines.erase(entryId);
        store_->entries.erase(it);

        for (auto accountId : touched) {
            store_->recomputeBalance(tenantId, accountId);
        }
        return touched;
    }

    std::optional<domain::JournalEntry> findById(int64_t tenantId, int64_t entryId) override {
        auto guard = store_->lock();
        auto it = store_->entries.find(entryId);
        if (it == store_->entries.end() || it->second.tenantId != tenantId) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<domain::JournalEntry> findBySource(
        int64_t tenantId,
        const std::string& sourceDocument,
        int64_t sourceDocumentId
    ) override {
        auto guard = store_->lock();
        return findBySourceLocked(tenantId, sourceDocument, sourceDocumentId);
    }

    std::vector<domain::JournalEntryLine> findLines(int64_t tenantId, int64_t entryId) override {
        auto guard = store_->lock();
        auto entry = store_->entries.find(entryId);
        if (entry == store_->entries.end() || entry->second.tenantId != tenantId) {
            return {};
        }
        auto result = store_->lines[entryId];
        std::sort(result.begin(), result.end(),
            [](const domain::JournalEntryLine& a, const domain::JournalEntryLine& b) {
                return a.lineOrder < b.lineOrder;
            });
        return result;
    }

    std::vector<domain::JournalEntry> findEntries(
        int64_t tenantId,
        const domain::JournalEntryFilter& filter
    ) override {
        auto guard = store_->lock();
        std::vector<domain::JournalEntry> result;
        for (const auto& [id, entry] : store_->entries) {
            if (entry.tenantId != tenantId) continue;
            if (filter.fromDate && entry.entryDate < *filter.fromDate) continue;
            if (filter.toDate && entry.entryDate > *filter.toDate) continue;
            if (filter.entryType && entry.entryType != *filter.entryType) continue;
            if (filter.isPosted && entry.isPosted != *filter.isPosted) continue;
            if (filter.sourceDocument && entry.sourceDocument != filter.sourceDocument) continue;
            result.push_back(entry);
        }
        std::sort(result.begin(), result.end(),
            [](const domain::JournalEntry& a, const domain::JournalEntry& b) {
                if (a.entryDate != b.entryDate) return a.entryDate < b.entryDate;
                return a.id < b.id;
            });
        return result;
    }

    std::vector<domain::AccountMovement> findMovements(int64_t tenantId, int64_t accountId) override {
        auto guard = store_->lock();
        std::vector<domain::AccountMovement> result;
        for (const auto& [entryId, entryLines] : store_->lines) {
            auto entry = store_->entries.find(entryId);
            if (entry == store_->entries.end() || entry->second.tenantId != tenantId) {
                continue;
            }
            for (const auto& line : entryLines) {
                if (line.accountId != accountId) continue;

                domain::AccountMovement movement;
                movement.entryId = entryId;
                movement.entryDate = entry->second.entryDate;
                movement.reference = entry->second.reference;
                movement.entryType = entry->second.entryType;
                movement.entryDescription = entry->second.description;
                movement.isPosted = entry->second.isPosted;
                movement.lineId = line.id;
                movement.lineOrder = line.lineOrder;
                movement.lineDescription = line.description;
                movement.debitAmount = line.debitAmount;
                movement.creditAmount = line.creditAmount;
                result.push_back(movement);
            }
        }
        std::sort(result.begin(), result.end(),
            [](const domain::AccountMovement& a, const domain::AccountMovement& b) {
                if (a.entryDate != b.entryDate) return a.entryDate < b.entryDate;
                if (a.entryId != b.entryId) return a.entryId < b.entryId;
                return a.lineOrder < b.lineOrder;
            });
        return result;
    }

    size_t countLinesForAccount(int64_t tenantId, int64_t accountId) override {
        auto guard = store_->lock();
        size_t count = 0;
        for (const auto& [entryId, entryLines] : store_->lines) {
            auto entry = store_->entries.find(entryId);
            if (entry == store_->entries.end() || entry->second.tenantId != tenantId) {
                continue;
            }
            count += static_cast<size_t>(std::count_if(entryLines.begin(), entryLines.end(),
                [accountId](const domain::JournalEntryLine& l) { return l.accountId == accountId; }));
        }
        return count;
    }

    size_t size() const {
        auto guard = store_->lock();
        return store_->entries.size();
    }

private:
    std::shared_ptr<InMemoryLedgerStore> store_;

    std::optional<domain::JournalEntry> findBySourceLocked(
        int64_t tenantId,
        const std::string& sourceDocument,
        int64_t sourceDocumentId
    ) const {
        for (const auto& [id, entry] : store_->entries) {
            if (entry.tenantId == tenantId &&
                entry.sourceDocument == sourceDocument &&
                entry.sourceDocumentId == sourceDocumentId) {
                return entry;
            }
        }
        return std::nullopt;
    }

    std::vector<domain::JournalEntryLine> assignIds(
        int64_t entryId,
        const std::vector<domain::JournalEntryLine>& lines
    ) {
        std::vector<domain::JournalEntryLine> result = lines;
        for (auto& line : result) {
            line.id = store_->nextLineId++;
            line.journalEntryId = entryId;
        }
        return result;
    }

    static std::vector<int64_t> accountIdsOf(const std::vector<domain::JournalEntryLine>& lines) {
        std::set<int64_t> ids;
        for (const auto& line : lines) {
            ids.insert(line.accountId);
        }
        return std::vector<int64_t>(ids.begin(), ids.end());
    }
};

} // namespace accounting::adapters::secondary
