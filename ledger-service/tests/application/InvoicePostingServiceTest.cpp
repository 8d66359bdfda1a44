/**
 * @file InvoicePostingServiceTest.cpp
 * @brief Unit tests for InvoicePostingService
 */

#include <gtest/gtest.h>
#include "../fixtures/LedgerTestContext.hpp"
#include <set>
#include <thread>
#include <vector>

using namespace accounting;
using namespace accounting::domain;
using namespace accounting::tests;

class InvoicePostingServiceTest : public ::testing::Test {
protected:
    static constexpr int64_t kTenant = 5;

    void SetUp() override {
        ctx_ = std::make_unique<LedgerTestContext>();
        ctx_->chartService->seedStandardChart(kTenant);
        ctx_->eventBus->clear();
    }

    void TearDown() override {
        ctx_->eventBus->clear();
        ctx_->store->clear();
    }

    Invoice standardInvoice() {
        return LedgerTestContext::invoice(kTenant, 1, "INV-0001", Money::fromUnits(1000), Money::fromUnits(150));
    }

    Payment payment(int64_t id, Money amount, PaymentMethod method = PaymentMethod::BANK_TRANSFER) {
        Payment p;
        p.id = id;
        p.tenantId = kTenant;
        p.invoiceId = 1;
        p.paymentDate = Timestamp::fromDate("2025-03-15");
        p.amount = amount;
        p.method = method;
        return p;
    }

    Account receivable() {
        return ctx_->account(kTenant, "1210-101");
    }

    size_t entriesOfType(const std::string& entryType) {
        JournalEntryFilter filter;
        filter.entryType = entryType;
        return ctx_->journalService->listEntries(kTenant, filter).size();
    }

    std::unique_ptr<LedgerTestContext> ctx_;
};

// ============================================================================
// APPROVAL
// ============================================================================

TEST_F(InvoicePostingServiceTest, Approve_PostsReceivableRevenueAndTax) {
    auto entry = ctx_->postingService->onInvoiceApproved(standardInvoice(), std::nullopt);

    EXPECT_EQ(entry.entryType, "INVAP");
    EXPECT_EQ(entry.reference, "INV-0001");
    EXPECT_TRUE(entry.isPosted);
    EXPECT_EQ(entry.sourceDocument, std::optional<std::string>("invoice"));
    EXPECT_EQ(entry.sourceDocumentId, std::optional<int64_t>(1));
    EXPECT_EQ(entry.totalAmount, Money::fromUnits(1150));
    EXPECT_EQ(entry.entryDate, Timestamp::fromDate("2025-03-01"));

    auto lines = ctx_->journalService->getLines(kTenant, entry.id);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0].accountId, receivable().id);
    EXPECT_EQ(lines[0].debitAmount, Money::fromUnits(1150));
    EXPECT_EQ(lines[1].accountId, ctx_->account(kTenant, "4000").id);
    EXPECT_EQ(lines[1].creditAmount, Money::fromUnits(1000));
    EXPECT_EQ(lines[2].accountId, ctx_->account(kTenant, "2200").id);
    EXPECT_EQ(lines[2].creditAmount, Money::fromUnits(150));

    EXPECT_EQ(receivable().currentBalance, Money::fromUnits(1150));
    EXPECT_EQ(ctx_->balance(kTenant, "4000"), Money::fromUnits(1000));
    EXPECT_EQ(ctx_->balance(kTenant, "2200"), Money::fromUnits(150));
}

TEST_F(InvoicePostingServiceTest, Approve_WithoutTax_TwoLines) {
    auto invoice = LedgerTestContext::invoice(kTenant, 2, "INV-0002", Money::fromUnits(400), Money());

    auto entry = ctx_->postingService->onInvoiceApproved(invoice, std::nullopt);

    EXPECT_EQ(ctx_->journalService->getLines(kTenant, entry.id).size(), 2u);
    EXPECT_TRUE(ctx_->balance(kTenant, "2200").isZero());
}

TEST_F(InvoicePostingServiceTest, Approve_PublishesPostedEvent) {
    ctx_->postingService->onInvoiceApproved(standardInvoice(), std::nullopt);

    EXPECT_EQ(ctx_->eventBus->count("journal.entry_posted"), 1u);
    EXPECT_EQ(ctx_->eventBus->count("account.created"), 1u);
}

TEST_F(InvoicePostingServiceTest, ReApprove_ReplacesExistingEntry) {
    auto first = ctx_->postingService->onInvoiceApproved(standardInvoice(), std::nullopt);

    auto invoice = LedgerTestContext::invoice(kTenant, 1, "INV-0001", Money::fromUnits(2000), Money::fromUnits(300));
    invoice.status = InvoiceStatus::APPROVED;
    auto second = ctx_->postingService->onInvoiceApproved(invoice, std::nullopt);

    EXPECT_EQ(second.id, first.id);
    EXPECT_EQ(entriesOfType("INVAP"), 1u);
    EXPECT_EQ(second.totalAmount, Money::fromUnits(2300));
    EXPECT_EQ(receivable().currentBalance, Money::fromUnits(2300));
    EXPECT_EQ(ctx_->balance(kTenant, "4000"), Money::fromUnits(2000));
    EXPECT_EQ(ctx_->eventBus->count("journal.entry_replaced"), 1u);
}

TEST_F(InvoicePostingServiceTest, Approve_FromIllegalStatus_Throws) {
    auto invoice = standardInvoice();
    invoice.status = InvoiceStatus::PAID;

    EXPECT_THROW(ctx_->postingService->onInvoiceApproved(invoice, std::nullopt), ValidationError);
    EXPECT_EQ(ctx_->journalRepository->size(), 0u);
}

TEST_F(InvoicePostingServiceTest, Approve_TotalMismatch_Throws) {
    auto invoice = standardInvoice();
    invoice.totalAmount = Money::fromUnits(999);

    EXPECT_THROW(ctx_->postingService->onInvoiceApproved(invoice, std::nullopt), ValidationError);
}

TEST_F(InvoicePostingServiceTest, Approve_SelectedIncomeAccountUsed) {
    auto revenue = ctx_->account(kTenant, "4000");
    auto consulting = ctx_->chartService->createAccount(kTenant, revenue.detailedGroupId, "Consulting", Money());

    ctx_->postingService->onInvoiceApproved(standardInvoice(), consulting.id);

    EXPECT_TRUE(ctx_->balance(kTenant, "4000").isZero());
    EXPECT_EQ(ctx_->accountRepository->findById(kTenant, consulting.id)->currentBalance, Money::fromUnits(1000));
}

TEST_F(InvoicePostingServiceTest, Approve_SelectedNonRevenueAccount_ReportsGap) {
    auto bank = ctx_->account(kTenant, "1100");

    try {
        ctx_->postingService->onInvoiceApproved(standardInvoice(), bank.id);
        FAIL() << "Expected MissingAccountError";
    } catch (const MissingAccountError& e) {
        ASSERT_EQ(e.missing().size(), 1u);
        EXPECT_EQ(e.missing()[0].role, "income");
    }
    EXPECT_EQ(ctx_->journalRepository->size(), 0u);
}

TEST_F(InvoicePostingServiceTest, Approve_EmptyChart_ListsAllGaps) {
    const int64_t emptyTenant = 99;
    auto invoice = LedgerTestContext::invoice(emptyTenant, 1, "INV-0001",
                                              Money::fromUnits(1000), Money::fromUnits(150), Money::fromUnits(50));

    try {
        ctx_->postingService->onInvoiceApproved(invoice, std::nullopt);
        FAIL() << "Expected MissingAccountError";
    } catch (const MissingAccountError& e) {
        std::set<std::string> roles;
        for (const auto& gap : e.missing()) {
            roles.insert(gap.role);
            EXPECT_FALSE(gap.guidance.empty());
        }
        EXPECT_EQ(roles, (std::set<std::string>{"entity_receivable", "income", "tax_payable", "discount_allowed"}));
    }

    EXPECT_TRUE(ctx_->accountRepository->findByTenant(emptyTenant).empty());
}

TEST_F(InvoicePostingServiceTest, Approve_PartialGaps_CreatesNothing) {
    const int64_t tenant = 98;
    ports::input::CreateGroupRequest request;
    request.tenantId = tenant;
    request.level = GroupLevel::MAIN;
    request.kind = GroupKind::BALANCE_SHEET;
    auto main = ctx_->chartService->createGroup(request);
    request.level = GroupLevel::ELEMENT;
    request.parentId = main.id;
    request.kind = GroupKind::ASSETS;
    auto element = ctx_->chartService->createGroup(request);
    request.level = GroupLevel::SUB_ELEMENT;
    request.parentId = element.id;
    request.kind = GroupKind::CURRENT_ASSETS;
    auto sub = ctx_->chartService->createGroup(request);
    request.level = GroupLevel::DETAILED;
    request.parentId = sub.id;
    request.kind = GroupKind::TRADE_DEBTORS;
    ctx_->chartService->createGroup(request);

    auto invoice = LedgerTestContext::invoice(tenant, 1, "INV-0001", Money::fromUnits(100), Money::fromUnits(10));

    EXPECT_THROW(ctx_->postingService->onInvoiceApproved(invoice, std::nullopt), MissingAccountError);
    // Дебиторский счёт можно было создать, но проводка всё равно невозможна
    EXPECT_TRUE(ctx_->accountRepository->findByTenant(tenant).empty());
}

// ============================================================================
// DISCOUNT
// ============================================================================

TEST_F(InvoicePostingServiceTest, Approve_WithDiscount_PostsDiscountLines) {
    auto invoice = LedgerTestContext::invoice(kTenant, 3, "INV-0003",
                                              Money::fromUnits(1000), Money::fromUnits(150), Money::fromUnits(100));

    auto entry = ctx_->postingService->onInvoiceApproved(invoice, std::nullopt);

    auto lines = ctx_->journalService->getLines(kTenant, entry.id);
    ASSERT_EQ(lines.size(), 5u);
    EXPECT_EQ(lines[0].debitAmount, Money::fromUnits(1150));
    EXPECT_EQ(lines[3].debitAmount, Money::fromUnits(100));
    EXPECT_EQ(lines[4].creditAmount, Money::fromUnits(100));
    EXPECT_EQ(lines[4].accountId, lines[0].accountId);
    EXPECT_EQ(entry.totalAmount, Money::fromUnits(1250));

    EXPECT_EQ(receivable().currentBalance, Money::fromUnits(1050));
    EXPECT_EQ(ctx_->balance(kTenant, "5100"), Money::fromUnits(100));
}

TEST_F(InvoicePostingServiceTest, Approve_NegativeDiscount_UsesMagnitude) {
    auto invoice = LedgerTestContext::invoice(kTenant, 3, "INV-0003",
                                              Money::fromUnits(1000), Money::fromUnits(150), Money::fromUnits(-100));

    ctx_->postingService->onInvoiceApproved(invoice, std::nullopt);

    EXPECT_EQ(receivable().currentBalance, Money::fromUnits(1050));
    EXPECT_EQ(ctx_->balance(kTenant, "5100"), Money::fromUnits(100));
}

// ============================================================================
// EDIT & REVERT
// ============================================================================

TEST_F(InvoicePostingServiceTest, Edited_AmountChange_ReplacesLines) {
    auto approved = ctx_->postingService->onInvoiceApproved(standardInvoice(), std::nullopt);

    auto invoice = LedgerTestContext::invoice(kTenant, 1, "INV-0001", Money::fromUnits(800), Money::fromUnits(120));
    invoice.status = InvoiceStatus::APPROVED;
    auto edited = ctx_->postingService->onInvoiceEdited(invoice, {InvoiceField::SUBTOTAL, InvoiceField::TAX_AMOUNT});

    ASSERT_TRUE(edited.has_value());
    EXPECT_EQ(edited->id, approved.id);
    EXPECT_EQ(edited->totalAmount, Money::fromUnits(920));
    EXPECT_EQ(receivable().currentBalance, Money::fromUnits(920));
    EXPECT_EQ(entriesOfType("INVAP"), 1u);
}

TEST_F(InvoicePostingServiceTest, Edited_KeepsIncomeAccountChosenAtApproval) {
    auto revenue = ctx_->account(kTenant, "4000");
    auto consulting = ctx_->chartService->createAccount(kTenant, revenue.detailedGroupId, "Consulting", Money());
    ctx_->postingService->onInvoiceApproved(standardInvoice(), consulting.id);

    auto invoice = LedgerTestContext::invoice(kTenant, 1, "INV-0001", Money::fromUnits(500), Money());
    ctx_->postingService->onInvoiceEdited(invoice, {InvoiceField::SUBTOTAL, InvoiceField::TAX_AMOUNT});

    EXPECT_EQ(ctx_->accountRepository->findById(kTenant, consulting.id)->currentBalance, Money::fromUnits(500));
    EXPECT_TRUE(ctx_->balance(kTenant, "4000").isZero());
    EXPECT_TRUE(ctx_->balance(kTenant, "2200").isZero());
}

TEST_F(InvoicePostingServiceTest, Edited_NonAmountFields_NoChange) {
    ctx_->postingService->onInvoiceApproved(standardInvoice(), std::nullopt);
    ctx_->eventBus->clear();

    auto result = ctx_->postingService->onInvoiceEdited(standardInvoice(), {InvoiceField::OTHER});

    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(ctx_->eventBus->size(), 0u);
}

TEST_F(InvoicePostingServiceTest, Edited_NoLinkedEntry_ReturnsNullopt) {
    auto result = ctx_->postingService->onInvoiceEdited(standardInvoice(), {InvoiceField::TOTAL_AMOUNT});

    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(ctx_->journalRepository->size(), 0u);
}

TEST_F(InvoicePostingServiceTest, RevertToDraft_MarksDescriptionOnce) {
    auto approved = ctx_->postingService->onInvoiceApproved(standardInvoice(), std::nullopt);

    auto reverted = ctx_->postingService->onInvoiceRevertedToDraft(standardInvoice());
    auto again = ctx_->postingService->onInvoiceRevertedToDraft(standardInvoice());

    ASSERT_TRUE(reverted.has_value());
    EXPECT_EQ(reverted->id, approved.id);
    EXPECT_EQ(reverted->description, "[DRAFT] Invoice INV-0001 approved");
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->description, "[DRAFT] Invoice INV-0001 approved");
    EXPECT_EQ(receivable().currentBalance, Money::fromUnits(1150));
}

TEST_F(InvoicePostingServiceTest, Edited_AfterRevert_KeepsDraftMarker) {
    ctx_->postingService->onInvoiceApproved(standardInvoice(), std::nullopt);
    ctx_->postingService->onInvoiceRevertedToDraft(standardInvoice());

    auto invoice = LedgerTestContext::invoice(kTenant, 1, "INV-0001", Money::fromUnits(600), Money::fromUnits(90));
    auto edited = ctx_->postingService->onInvoiceEdited(invoice, {InvoiceField::SUBTOTAL, InvoiceField::TAX_AMOUNT});

    ASSERT_TRUE(edited.has_value());
    EXPECT_EQ(edited->description, "[DRAFT] Invoice INV-0001 approved");
    EXPECT_EQ(edited->totalAmount, Money::fromUnits(690));
    EXPECT_EQ(receivable().currentBalance, Money::fromUnits(690));
}

TEST_F(InvoicePostingServiceTest, RevertToDraft_NoEntry_ReturnsNullopt) {
    EXPECT_FALSE(ctx_->postingService->onInvoiceRevertedToDraft(standardInvoice()).has_value());
}

TEST_F(InvoicePostingServiceTest, RevertThenReApprove_RestoresSingleEntry) {
    auto approved = ctx_->postingService->onInvoiceApproved(standardInvoice(), std::nullopt);
    ctx_->postingService->onInvoiceRevertedToDraft(standardInvoice());

    auto invoice = LedgerTestContext::invoice(kTenant, 1, "INV-0001", Money::fromUnits(1200), Money::fromUnits(180));
    auto reapproved = ctx_->postingService->onInvoiceApproved(invoice, std::nullopt);

    EXPECT_EQ(reapproved.id, approved.id);
    EXPECT_EQ(reapproved.description, "Invoice INV-0001 approved");
    EXPECT_EQ(entriesOfType("INVAP"), 1u);
    EXPECT_EQ(receivable().currentBalance, Money::fromUnits(1380));
    EXPECT_EQ(ctx_->balance(kTenant, "2200"), Money::fromUnits(180));
}

// ============================================================================
// PAYMENTS
// ============================================================================

TEST_F(InvoicePostingServiceTest, Payment_DebitsBankCreditsReceivable) {
    ctx_->postingService->onInvoiceApproved(standardInvoice(), std::nullopt);
    auto invoice = standardInvoice();
    invoice.status = InvoiceStatus::APPROVED;

    auto entry = ctx_->postingService->onPaymentRecorded(invoice, payment(10, Money::fromUnits(500)));

    EXPECT_EQ(entry.entryType, "PMT");
    EXPECT_EQ(entry.reference, "INV-0001");
    EXPECT_EQ(entry.sourceDocument, std::optional<std::string>("payment"));
    EXPECT_EQ(entry.totalAmount, Money::fromUnits(500));
    EXPECT_EQ(ctx_->balance(kTenant, "1100"), Money::fromUnits(500));
    EXPECT_EQ(receivable().currentBalance, Money::fromUnits(650));
}

TEST_F(InvoicePostingServiceTest, Payment_Cash_GoesToCashAccount) {
    ctx_->postingService->onInvoiceApproved(standardInvoice(), std::nullopt);
    auto invoice = standardInvoice();
    invoice.status = InvoiceStatus::SENT;
    auto cash = payment(11, Money::fromUnits(200), PaymentMethod::CASH);
    cash.reference = "RCPT-77";

    auto entry = ctx_->postingService->onPaymentRecorded(invoice, cash);

    EXPECT_EQ(entry.reference, "RCPT-77");
    EXPECT_EQ(ctx_->balance(kTenant, "1110"), Money::fromUnits(200));
    EXPECT_TRUE(ctx_->balance(kTenant, "1100").isZero());
}

TEST_F(InvoicePostingServiceTest, Payment_RecordedTwice_ReplacesEntry) {
    ctx_->postingService->onInvoiceApproved(standardInvoice(), std::nullopt);
    auto invoice = standardInvoice();
    invoice.status = InvoiceStatus::APPROVED;

    auto first = ctx_->postingService->onPaymentRecorded(invoice, payment(10, Money::fromUnits(500)));
    auto second = ctx_->postingService->onPaymentRecorded(invoice, payment(10, Money::fromUnits(600)));

    EXPECT_EQ(first.id, second.id);
    EXPECT_EQ(entriesOfType("PMT"), 1u);
    EXPECT_EQ(ctx_->balance(kTenant, "1100"), Money::fromUnits(600));
}

// Статус читается после сохранения платежа: последний платёж видит PAID
TEST_F(InvoicePostingServiceTest, Payment_InvoiceAlreadyPaid_StillPosted) {
    auto invoice = standardInvoice();
    ctx_->postingService->onInvoiceApproved(invoice, std::nullopt);
    invoice.status = InvoiceStatus::PAID;

    auto entry = ctx_->postingService->onPaymentRecorded(invoice, payment(12, Money::fromUnits(1150)));

    EXPECT_EQ(entry.entryType, "PMT");
    EXPECT_EQ(entry.sourceDocumentId, std::optional<int64_t>(12));
    EXPECT_EQ(ctx_->balance(kTenant, "1100"), Money::fromUnits(1150));
    EXPECT_TRUE(receivable().currentBalance.isZero());
}

TEST_F(InvoicePostingServiceTest, Payment_IndependentOfApproval) {
    auto invoice = standardInvoice();

    auto entry = ctx_->postingService->onPaymentRecorded(invoice, payment(13, Money::fromUnits(200)));

    EXPECT_EQ(entriesOfType("INVAP"), 0u);
    EXPECT_EQ(entry.totalAmount, Money::fromUnits(200));
    EXPECT_EQ(receivable().currentBalance, Money::fromUnits(-200));
}

TEST_F(InvoicePostingServiceTest, Payment_Invalid_Throws) {
    auto invoice = standardInvoice();
    invoice.status = InvoiceStatus::APPROVED;

    EXPECT_THROW(ctx_->postingService->onPaymentRecorded(invoice, payment(10, Money())), ValidationError);

    auto foreign = payment(10, Money::fromUnits(5));
    foreign.invoiceId = 2;
    EXPECT_THROW(ctx_->postingService->onPaymentRecorded(invoice, foreign), ValidationError);

    EXPECT_EQ(ctx_->journalRepository->size(), 0u);
}

// ============================================================================
// CONCURRENCY
// ============================================================================

TEST_F(InvoicePostingServiceTest, Approve_ConcurrentSameEntity_SingleEntryPerInvoice) {
    constexpr int kThreads = 8;
    auto second = LedgerTestContext::invoice(kTenant, 2, "INV-0002", Money::fromUnits(500), Money::fromUnits(75));

    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([this, i, &second]() {
            if (i % 2 == 0) {
                ctx_->postingService->onInvoiceApproved(standardInvoice(), std::nullopt);
            } else {
                ctx_->postingService->onInvoiceApproved(second, std::nullopt);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(entriesOfType("INVAP"), 2u);

    size_t linked = 0;
    for (const auto& account : ctx_->accountRepository->findByType(kTenant, AccountType::ASSET)) {
        if (account.entityId == std::optional<int64_t>(101)) ++linked;
    }
    EXPECT_EQ(linked, 1u);
    EXPECT_FALSE(ctx_->accountRepository->findByCode(kTenant, "1210-101-2").has_value());
    EXPECT_EQ(receivable().currentBalance, Money::fromUnits(1725));
}
