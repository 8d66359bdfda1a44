#pragma once

#include "ports/input/IJournalEntryService.hpp"
#include "ports/output/IJournalRepository.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/IEventBus.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include "domain/events/JournalEntryPostedEvent.hpp"
#include "domain/events/JournalEntryReplacedEvent.hpp"
#include "domain/events/JournalEntryDeletedEvent.hpp"
#include <memory>
#include <iostream>
#include <set>
#include <algorithm>

namespace accounting::application {

/**
 * @brief Движок проводок
 *
 * Проверяет строки (непустые, неотрицательные, счета существуют в tenant,
 * дебет = кредит) и передаёт их репозиторию, который атомарно пишет
 * строки и пересчитывает остатки затронутых счетов.
 */
class JournalEntryService : public ports::input::IJournalEntryService {
public:
    JournalEntryService(
        std::shared_ptr<ports::output::IJournalRepository> journalRepository,
        std::shared_ptr<ports::output::IAccountRepository> accountRepository,
        std::shared_ptr<ports::output::IEventBus> eventBus
    ) : journalRepository_(std::move(journalRepository))
      , accountRepository_(std::move(accountRepository))
      , eventBus_(std::move(eventBus))
    {
        std::cout << "[JournalEntryService] Created" << std::endl;
    }

    domain::JournalEntry createEntry(
        const domain::JournalEntryHeader& header,
        const std::vector<domain::JournalLineInput>& lines
    ) override {
        if (header.sourceDocument.has_value() != header.sourceDocumentId.has_value()) {
            throw domain::ValidationError("Source document and its id must be set together");
        }

        auto prepared = prepareLines(header.tenantId, lines);

        auto now = domain::Timestamp::now();
        domain::JournalEntry entry;
        entry.tenantId = header.tenantId;
        entry.entryDate = header.entryDate;
        entry.reference = header.reference;
        entry.entryType = header.entryType.empty() ? "manual" : header.entryType;
        entry.description = header.description;
        entry.isPosted = header.isPosted;
        entry.sourceDocument = header.sourceDocument;
        entry.sourceDocumentId = header.sourceDocumentId;
        entry.totalAmount = prepared.total;
        entry.createdBy = header.createdBy;
        entry.updatedBy = header.createdBy;
        entry.createdAt = now;
        entry.updatedAt = now;

        auto saved = journalRepository_->create(entry, prepared.lines);

        std::cout << "[JournalEntryService] Created entry " << saved.id
                  << " type=" << saved.entryType
                  << " total=" << saved.totalAmount.toString()
                  << " lines=" << prepared.lines.size() << std::endl;

        publishPosted(saved, prepared.lines.size(), accountIdsOf(prepared.lines));
        return saved;
    }

    domain::JournalEntry replaceLines(
        int64_t tenantId,
        int64_t entryId,
        const std::vector<domain::JournalLineInput>& lines,
        const std::optional<domain::JournalHeaderUpdate>& headerUpdate
    ) override {
        auto existing = requireEntry(tenantId, entryId);
        auto prepared = prepareLines(tenantId, lines);

        domain::Money previousTotal = existing.totalAmount;
        domain::JournalEntry entry = existing;
        if (headerUpdate) {
            applyHeaderUpdate(entry, *headerUpdate);
        }
        entry.totalAmount = prepared.total;
        entry.updatedAt = domain::Timestamp::now();

        auto touched = journalRepository_->replaceLines(entry, prepared.lines);

        std::cout << "[JournalEntryService] Replaced lines of entry " << entryId
                  << " total " << previousTotal.toString() << " -> " << entry.totalAmount.toString()
                  << std::endl;

        domain::JournalEntryReplacedEvent event;
        event.tenantId = tenantId;
        event.entryId = entryId;
        event.previousTotal = previousTotal;
        event.totalAmount = entry.totalAmount;
        event.lineCount = prepared.lines.size();
        event.sourceDocument = entry.sourceDocument;
        event.sourceDocumentId = entry.sourceDocumentId;
        event.accountIds = touched;
        eventBus_->publish(event);

        return entry;
    }

    domain::JournalEntry setPosted(
        int64_t tenantId,
        int64_t entryId,
        bool isPosted,
        const std::string& updatedBy
    ) override {
        domain::JournalHeaderUpdate update;
        update.isPosted = isPosted;
        update.updatedBy = updatedBy;
        return updateHeader(tenantId, entryId, update);
    }

    domain::JournalEntry updateHeader(
        int64_t tenantId,
        int64_t entryId,
        const domain::JournalHeaderUpdate& update
    ) override {
        auto entry = requireEntry(tenantId, entryId);
        bool becomesPosted = update.isPosted.value_or(false) && !entry.isPosted;

        std::vector<domain::JournalEntryLine> lines;
        if (becomesPosted) {
            lines = journalRepository_->findLines(tenantId, entryId);
            if (lines.empty()) {
                throw domain::ValidationError("Cannot post journal entry " +
                                              std::to_string(entryId) + " without lines");
            }
        }

        applyHeaderUpdate(entry, update);
        entry.updatedAt = domain::Timestamp::now();
        journalRepository_->updateHeader(entry);

        if (becomesPosted) {
            std::cout << "[JournalEntryService] Posted entry " << entryId << std::endl;
            publishPosted(entry, lines.size(), accountIdsOf(lines));
        }
        return entry;
    }

    void deleteEntry(int64_t tenantId, int64_t entryId) override {
        auto entry = requireEntry(tenantId, entryId);
        auto touched = journalRepository_->remove(tenantId, entryId);

        std::cout << "[JournalEntryService] Deleted entry " << entryId
                  << ", rebalanced " << touched.size() << " accounts" << std::endl;

        domain::JournalEntryDeletedEvent event;
        event.tenantId = tenantId;
        event.entryId = entryId;
        event.totalAmount = entry.totalAmount;
        event.sourceDocument = entry.sourceDocument;
        event.sourceDocumentId = entry.sourceDocumentId;
        event.accountIds = touched;
        eventBus_->publish(event);
    }

    std::optional<domain::JournalEntry> getEntry(int64_t tenantId, int64_t entryId) override {
        return journalRepository_->findById(tenantId, entryId);
    }

    std::vector<domain::JournalEntryLine> getLines(int64_t tenantId, int64_t entryId) override {
        requireEntry(tenantId, entryId);
        return journalRepository_->findLines(tenantId, entryId);
    }

    std::optional<domain::JournalEntry> findBySource(
        int64_t tenantId,
        const std::string& sourceDocument,
        int64_t sourceDocumentId
    ) override {
        return journalRepository_->findBySource(tenantId, sourceDocument, sourceDocumentId);
    }

    std::vector<domain::JournalEntry> listEntries(
        int64_t tenantId,
        const domain::JournalEntryFilter& filter
    ) override {
        return journalRepository_->findEntries(tenantId, filter);
    }

private:
    struct PreparedLines {
        std::vector<domain::JournalEntryLine> lines;
        domain::Money total;
    };

    std::shared_ptr<ports::output::IJournalRepository> journalRepository_;
    std::shared_ptr<ports::output::IAccountRepository> accountRepository_;
    std::shared_ptr<ports::output::IEventBus> eventBus_;

    domain::JournalEntry requireEntry(int64_t tenantId, int64_t entryId) {
        auto entry = journalRepository_->findById(tenantId, entryId);
        if (!entry) {
            throw domain::NotFoundError("JournalEntry", entryId);
        }
        return *entry;
    }

    /**
     * @brief Проверить строки и назначить lineOrder
     *
     * Порядок проверок: пустой набор, отрицательные суммы, счета, баланс.
     */
    PreparedLines prepareLines(int64_t tenantId, const std::vector<domain::JournalLineInput>& inputs) {
        if (inputs.empty()) {
            throw domain::ValidationError("Journal entry requires at least one line");
        }

        for (const auto& input : inputs) {
            if (input.debitAmount.isNegative() || input.creditAmount.isNegative()) {
                throw domain::ValidationError("Line amounts must not be negative (account " +
                                              std::to_string(input.accountId) + ")");
            }
        }

        std::set<int64_t> checked;
        for (const auto& input : inputs) {
            if (checked.count(input.accountId)) continue;
            if (!accountRepository_->findById(tenantId, input.accountId)) {
                throw domain::NotFoundError("Account", input.accountId);
            }
            checked.insert(input.accountId);
        }

        PreparedLines prepared;
        domain::Money totalDebit;
        domain::Money totalCredit;
        std::set<int> orders;

        for (size_t i = 0; i < inputs.size(); ++i) {
            const auto& input = inputs[i];
            totalDebit += input.debitAmount;
            totalCredit += input.creditAmount;

            domain::JournalEntryLine line;
            line.accountId = input.accountId;
            line.debitAmount = input.debitAmount;
            line.creditAmount = input.creditAmount;
            line.description = input.description;
            line.lineOrder = input.lineOrder > 0 ? input.lineOrder : static_cast<int>(i + 1);

            if (!orders.insert(line.lineOrder).second) {
                throw domain::ValidationError("Duplicate line order " + std::to_string(line.lineOrder));
            }
            prepared.lines.push_back(std::move(line));
        }

        if (totalDebit != totalCredit) {
            throw domain::UnbalancedEntryError(totalDebit, totalCredit);
        }

        std::sort(prepared.lines.begin(), prepared.lines.end(),
                  [](const auto& a, const auto& b) { return a.lineOrder < b.lineOrder; });
        prepared.total = totalDebit;
        return prepared;
    }

    static void applyHeaderUpdate(domain::JournalEntry& entry, const domain::JournalHeaderUpdate& update) {
        if (update.entryDate) entry.entryDate = *update.entryDate;
        if (update.reference) entry.reference = *update.reference;
        if (update.description) entry.description = *update.description;
        if (update.isPosted) entry.isPosted = *update.isPosted;
        if (!update.updatedBy.empty()) entry.updatedBy = update.updatedBy;
    }

    static std::vector<int64_t> accountIdsOf(const std::vector<domain::JournalEntryLine>& lines) {
        std::vector<int64_t> ids;
        for (const auto& line : lines) {
            if (std::find(ids.begin(), ids.end(), line.accountId) == ids.end()) {
                ids.push_back(line.accountId);
            }
        }
        return ids;
    }

    void publishPosted(const domain::JournalEntry& entry, size_t lineCount, std::vector<int64_t> accountIds) {
        domain::JournalEntryPostedEvent event;
        event.tenantId = entry.tenantId;
        event.entryId = entry.id;
        event.entryType = entry.entryType;
        event.reference = entry.reference;
        event.isPosted = entry.isPosted;
        event.totalAmount = entry.totalAmount;
        event.lineCount = lineCount;
        event.sourceDocument = entry.sourceDocument;
        event.sourceDocumentId = entry.sourceDocumentId;
        event.accountIds = std::move(accountIds);
        eventBus_->publish(event);
    }
};

} // namespace accounting::application
