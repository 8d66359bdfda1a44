#pragma once

#include "ports/input/IInvoicePostingService.hpp"
#include "ports/input/IAccountResolver.hpp"
#include "ports/input/IJournalEntryService.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include <KeyedMutex.hpp>
#include <memory>
#include <iostream>
#include <vector>

namespace accounting::application {

/**
 * @brief Проектор жизненного цикла счетов-фактур в проводки
 *
 * Каждому документу-источнику ("invoice", id) / ("payment", id)
 * соответствует не более одной проводки. Проводки по одному источнику
 * сериализуются KeyedMutex; в PostgreSQL дополнительно действует
 * уникальный индекс, и проигравшая гонку вставка повторяется как замена.
 */
class InvoicePostingService : public ports::input::IInvoicePostingService {
public:
    static constexpr const char* kInvoiceSource = "invoice";
    static constexpr const char* kPaymentSource = "payment";
    static constexpr const char* kApprovalEntryType = "INVAP";
    static constexpr const char* kPaymentEntryType = "PMT";
    static constexpr const char* kDraftMarker = "[DRAFT] ";
    static constexpr const char* kPostedBy = "system";

    InvoicePostingService(
        std::shared_ptr<ports::input::IAccountResolver> resolver,
        std::shared_ptr<ports::input::IJournalEntryService> journalService,
        std::shared_ptr<ports::output::IAccountRepository> accountRepository
    ) : resolver_(std::move(resolver))
      , journalService_(std::move(journalService))
      , accountRepository_(std::move(accountRepository))
    {
        std::cout << "[InvoicePostingService] Created" << std::endl;
    }

    domain::JournalEntry onInvoiceApproved(
        const domain::Invoice& invoice,
        std::optional<int64_t> selectedIncomeAccountId
    ) override {
        if (!domain::canTransition(invoice.status, domain::InvoiceStatus::APPROVED)) {
            throw domain::ValidationError("Invoice " + invoice.invoiceNumber + " cannot be approved from status " +
                                          domain::toString(invoice.status));
        }
        validateAmounts(invoice);

        auto guard = postingLocks_.lock(sourceKey(invoice.tenantId, kInvoiceSource, invoice.id));

        auto incomeSelection = selectedIncomeAccountId ? selectedIncomeAccountId : invoice.incomeAccountId;
        auto lines = buildInvoiceLines(invoice, incomeSelection);

        domain::JournalEntryHeader header;
        header.tenantId = invoice.tenantId;
        header.entryDate = invoice.issueDate;
        header.reference = invoice.invoiceNumber;
        header.entryType = kApprovalEntryType;
        header.description = approvalDescription(invoice);
        header.isPosted = true;
        header.sourceDocument = kInvoiceSource;
        header.sourceDocumentId = invoice.id;
        header.createdBy = kPostedBy;

        domain::JournalHeaderUpdate update;
        update.entryDate = invoice.issueDate;
        update.reference = invoice.invoiceNumber;
        update.description = header.description;
        update.isPosted = true;
        update.updatedBy = kPostedBy;

        auto entry = postForSource(header, lines, update);
        std::cout << "[InvoicePostingService] Invoice " << invoice.invoiceNumber
                  << " approved -> entry " << entry.id << " total=" << entry.totalAmount.toString() << std::endl;
        return entry;
    }

    std::optional<domain::JournalEntry> onInvoiceEdited(
        const domain::Invoice& invoice,
        const domain::InvoiceChanges& changedFields
    ) override {
        if (!domain::affectsAmounts(changedFields)) {
            return std::nullopt;
        }

        auto guard = postingLocks_.lock(sourceKey(invoice.tenantId, kInvoiceSource, invoice.id));

        auto existing = journalService_->findBySource(invoice.tenantId, kInvoiceSource, invoice.id);
        if (!existing) {
            return std::nullopt;
        }
        validateAmounts(invoice);

        auto incomeSelection = invoice.incomeAccountId;
        if (!incomeSelection) {
            incomeSelection = creditedRevenueAccount(invoice.tenantId, existing->id);
        }
        auto lines = buildInvoiceLines(invoice, incomeSelection);

        domain::JournalHeaderUpdate update;
        update.entryDate = invoice.issueDate;
        update.reference = invoice.invoiceNumber;
        update.updatedBy = kPostedBy;

        auto entry = withInternalErrors([&] {
            return journalService_->replaceLines(invoice.tenantId, existing->id, lines, update);
        });
        std::cout << "[InvoicePostingService] Invoice " << invoice.invoiceNumber
                  << " edited -> entry " << entry.id << " total=" << entry.totalAmount.toString() << std::endl;
        return entry;
    }

    std::optional<domain::JournalEntry> onInvoiceRevertedToDraft(const domain::Invoice& invoice) override {
        auto guard = postingLocks_.lock(sourceKey(invoice.tenantId, kInvoiceSource, invoice.id));

        auto existing = journalService_->findBySource(invoice.tenantId, kInvoiceSource, invoice.id);
        if (!existing) {
            return std::nullopt;
        }

        const std::string marker = kDraftMarker;
        if (existing->description.compare(0, marker.size(), marker) == 0) {
            return existing;
        }

        domain::JournalHeaderUpdate update;
        update.description = marker + existing->description;
        update.updatedBy = kPostedBy;

        auto entry = journalService_->updateHeader(invoice.tenantId, existing->id, update);
        std::cout << "[InvoicePostingService] Invoice " << invoice.invoiceNumber
                  << " reverted to draft, entry " << entry.id << " annotated" << std::endl;
        return entry;
    }

    domain::JournalEntry onPaymentRecorded(
        const domain::Invoice& invoice,
        const domain::Payment& payment
    ) override {
        if (!payment.amount.isPositive()) {
            throw domain::ValidationError("Payment amount must be positive");
        }
        if (payment.tenantId != invoice.tenantId || payment.invoiceId != invoice.id) {
            throw domain::ValidationError("Payment " + std::to_string(payment.id) +
                                          " does not belong to invoice " + invoice.invoiceNumber);
        }

        auto guard = postingLocks_.lock(sourceKey(payment.tenantId, kPaymentSource, payment.id));

        auto plans = planAll(invoice.tenantId, {
            domain::AccountRole::cashOrBank(payment.method),
            domain::AccountRole::entityReceivable(invoice.entityId, invoice.entityName),
        });
        auto cash = resolver_->materialize(invoice.tenantId, plans[0]);
        auto receivable = resolver_->materialize(invoice.tenantId, plans[1]);

        std::vector<domain::JournalLineInput> lines = {
            domain::JournalLineInput::debit(cash.id, payment.amount,
                                            "Payment received (" + domain::toString(payment.method) + ")"),
            domain::JournalLineInput::credit(receivable.id, payment.amount,
                                             "Payment from " + invoice.entityName),
        };

        domain::JournalEntryHeader header;
        header.tenantId = payment.tenantId;
        header.entryDate = payment.paymentDate;
        header.reference = payment.reference.empty() ? invoice.invoiceNumber : payment.reference;
        header.entryType = kPaymentEntryType;
        header.description = "Payment for invoice " + invoice.invoiceNumber;
        header.isPosted = true;
        header.sourceDocument = kPaymentSource;
        header.sourceDocumentId = payment.id;
        header.createdBy = kPostedBy;

        domain::JournalHeaderUpdate update;
        update.entryDate = header.entryDate;
        update.reference = header.reference;
        update.description = header.description;
        update.isPosted = true;
        update.updatedBy = kPostedBy;

        auto entry = postForSource(header, lines, update);
        std::cout << "[InvoicePostingService] Payment " << payment.id << " for invoice " << invoice.invoiceNumber
                  << " -> entry " << entry.id << " amount=" << payment.amount.toString() << std::endl;
        return entry;
    }

private:
    std::shared_ptr<ports::input::IAccountResolver> resolver_;
    std::shared_ptr<ports::input::IJournalEntryService> journalService_;
    std::shared_ptr<ports::output::IAccountRepository> accountRepository_;
    KeyedMutex postingLocks_;

    static std::string sourceKey(int64_t tenantId, const std::string& document, int64_t documentId) {
        return std::to_string(tenantId) + ":" + document + ":" + std::to_string(documentId);
    }

    static std::string approvalDescription(const domain::Invoice& invoice) {
        return "Invoice " + invoice.invoiceNumber + " approved";
    }

    /**
     * @brief totalAmount = subtotal + taxAmount - |discountAmount|
     */
    static void validateAmounts(const domain::Invoice& invoice) {
        if (invoice.subtotal.isNegative() || invoice.taxAmount.isNegative()) {
            throw domain::ValidationError("Invoice " + invoice.invoiceNumber + " has negative subtotal or tax");
        }
        auto expected = invoice.subtotal + invoice.taxAmount - invoice.discountAmount.abs();
        if (invoice.totalAmount != expected) {
            throw domain::ValidationError("Invoice " + invoice.invoiceNumber + " total " +
                                          invoice.totalAmount.toString() + " does not match " + expected.toString());
        }
    }

    /**
     * @brief Спланировать все роли; при пробелах бросить одну ошибку со всеми
     */
    std::vector<domain::ResolutionPlan> planAll(int64_t tenantId, const std::vector<domain::AccountRole>& roles) {
        std::vector<domain::ResolutionPlan> plans;
        std::vector<domain::MissingAccount> gaps;
        for (const auto& role : roles) {
            auto plan = resolver_->plan(tenantId, role);
            if (plan.gap) {
                gaps.push_back(*plan.gap);
            }
            plans.push_back(std::move(plan));
        }

        if (!gaps.empty()) {
            std::cerr << "[InvoicePostingService] " << gaps.size() << " required account(s) missing for tenant "
                      << tenantId << std::endl;
            throw domain::MissingAccountError(std::move(gaps));
        }
        return plans;
    }

    /**
     * @brief Строки проводки утверждения
     *
     * Дт дебиторка total + |d|; Кт доход subtotal; Кт налог tax (> 0);
     * при скидке Дт скидки |d|, Кт дебиторка |d|.
     */
    std::vector<domain::JournalLineInput> buildInvoiceLines(
        const domain::Invoice& invoice,
        std::optional<int64_t> incomeSelection
    ) {
        bool hasTax = invoice.taxAmount.isPositive();
        bool hasDiscount = !invoice.discountAmount.isZero();
        domain::Money discount = invoice.discountAmount.abs();

        std::vector<domain::AccountRole> roles = {
            domain::AccountRole::entityReceivable(invoice.entityId, invoice.entityName),
            domain::AccountRole::income(incomeSelection),
        };
        if (hasTax) roles.push_back(domain::AccountRole::taxPayable());
        if (hasDiscount) roles.push_back(domain::AccountRole::discountAllowed());

        auto plans = planAll(invoice.tenantId, roles);

        std::vector<domain::Account> accounts;
        for (const auto& plan : plans) {
            accounts.push_back(resolver_->materialize(invoice.tenantId, plan));
        }
        const auto& receivable = accounts[0];
        const auto& income = accounts[1];

        std::vector<domain::JournalLineInput> lines;
        lines.push_back(domain::JournalLineInput::debit(
            receivable.id, invoice.totalAmount + discount, "Invoice " + invoice.invoiceNumber + " - " + invoice.entityName));
        lines.push_back(domain::JournalLineInput::credit(
            income.id, invoice.subtotal, "Revenue from invoice " + invoice.invoiceNumber));

        size_t next = 2;
        if (hasTax) {
            lines.push_back(domain::JournalLineInput::credit(
                accounts[next++].id, invoice.taxAmount, "Tax on invoice " + invoice.invoiceNumber));
        }
        if (hasDiscount) {
            const auto& discountAccount = accounts[next++];
            lines.push_back(domain::JournalLineInput::debit(
                discountAccount.id, discount, "Discount on invoice " + invoice.invoiceNumber));
            lines.push_back(domain::JournalLineInput::credit(
                receivable.id, discount, "Discount on invoice " + invoice.invoiceNumber));
        }
        return lines;
    }

    /**
     * @brief Доходный счёт, кредитуемый существующей проводкой
     */
    std::optional<int64_t> creditedRevenueAccount(int64_t tenantId, int64_t entryId) {
        for (const auto& line : journalService_->getLines(tenantId, entryId)) {
            if (!line.creditAmount.isPositive()) continue;
            auto account = accountRepository_->findById(tenantId, line.accountId);
            if (account && account->accountType == domain::AccountType::REVENUE) {
                return account->id;
            }
        }
        return std::nullopt;
    }

    /**
     * @brief Найти проводку источника и заменить строки, иначе создать
     */
    domain::JournalEntry postForSource(
        const domain::JournalEntryHeader& header,
        const std::vector<domain::JournalLineInput>& lines,
        const domain::JournalHeaderUpdate& update
    ) {
        return withInternalErrors([&] {
            auto existing = journalService_->findBySource(header.tenantId, *header.sourceDocument, *header.sourceDocumentId);
            if (existing) {
                return journalService_->replaceLines(header.tenantId, existing->id, lines, update);
            }

            try {
                return journalService_->createEntry(header, lines);
            } catch (const domain::DuplicateSourceDocumentError& e) {
                // Другой процесс успел создать проводку этого источника
                std::cerr << "[InvoicePostingService] " << e.what() << ", retrying as replace" << std::endl;
                existing = journalService_->findBySource(header.tenantId, *header.sourceDocument, *header.sourceDocumentId);
                if (!existing) {
                    throw;
                }
                return journalService_->replaceLines(header.tenantId, existing->id, lines, update);
            }
        });
    }

    template <typename Fn>
    static domain::JournalEntry withInternalErrors(Fn&& fn) {
        try {
            return fn();
        } catch (const domain::UnbalancedEntryError& e) {
            std::cerr << "[InvoicePostingService] Computed unbalanced entry: " << e.what() << std::endl;
            throw domain::InternalPostingError(std::string("Invoice posting produced an unbalanced entry: ") + e.what());
        }
    }
};

} // namespace accounting::application
