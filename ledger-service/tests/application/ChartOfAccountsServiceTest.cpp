/**
 * @file ChartOfAccountsServiceTest.cpp
 * @brief Unit tests for ChartOfAccountsService
 */

#include <gtest/gtest.h>
#include "../fixtures/LedgerTestContext.hpp"
#include "domain/events/AccountCreatedEvent.hpp"

using namespace accounting;
using namespace accounting::domain;
using namespace accounting::ports::input;
using namespace accounting::tests;

class ChartOfAccountsServiceTest : public ::testing::Test {
protected:
    static constexpr int64_t kTenant = 1;
    static constexpr int64_t kOtherTenant = 2;

    void SetUp() override {
        ctx_ = std::make_unique<LedgerTestContext>();
    }

    void TearDown() override {
        ctx_->eventBus->clear();
        ctx_->store->clear();
    }

    AccountGroup createGroup(GroupLevel level, std::optional<int64_t> parentId, GroupKind kind,
                             const std::string& customName = "") {
        CreateGroupRequest request;
        request.tenantId = kTenant;
        request.level = level;
        request.parentId = parentId;
        request.kind = kind;
        request.customName = customName;
        return ctx_->chartService->createGroup(request);
    }

    /**
     * @brief BS → Assets → Current Assets → Trade Debtors
     */
    AccountGroup createDebtorsBranch() {
        auto main = createGroup(GroupLevel::MAIN, std::nullopt, GroupKind::BALANCE_SHEET);
        auto element = createGroup(GroupLevel::ELEMENT, main.id, GroupKind::ASSETS);
        auto sub = createGroup(GroupLevel::SUB_ELEMENT, element.id, GroupKind::CURRENT_ASSETS);
        return createGroup(GroupLevel::DETAILED, sub.id, GroupKind::TRADE_DEBTORS);
    }

    std::unique_ptr<LedgerTestContext> ctx_;
};

// ============================================================================
// GROUP TESTS
// ============================================================================

TEST_F(ChartOfAccountsServiceTest, CreateGroup_StandardCodesFollowHierarchy) {
    auto detailed = createDebtorsBranch();

    EXPECT_EQ(detailed.code, "BS-A-CA-TD");
    EXPECT_EQ(detailed.level, GroupLevel::DETAILED);
    ASSERT_TRUE(detailed.parentId.has_value());

    auto path = ctx_->chartService->getGroupPath(kTenant, detailed.id);
    EXPECT_EQ(path.main.kind, GroupKind::BALANCE_SHEET);
    EXPECT_EQ(path.element.kind, GroupKind::ASSETS);
    EXPECT_EQ(path.subElement.kind, GroupKind::CURRENT_ASSETS);
    EXPECT_EQ(path.detailed.id, detailed.id);
}

TEST_F(ChartOfAccountsServiceTest, CreateGroup_ElementUnderWrongMainGroup_Throws) {
    auto profitAndLoss = createGroup(GroupLevel::MAIN, std::nullopt, GroupKind::PROFIT_AND_LOSS);

    EXPECT_THROW(createGroup(GroupLevel::ELEMENT, profitAndLoss.id, GroupKind::ASSETS), ValidationError);
}

TEST_F(ChartOfAccountsServiceTest, CreateGroup_KindAtWrongLevel_Throws) {
    EXPECT_THROW(createGroup(GroupLevel::MAIN, std::nullopt, GroupKind::ASSETS), ValidationError);
    EXPECT_THROW(createGroup(GroupLevel::MAIN, std::nullopt, GroupKind::CUSTOM, "Misc"), ValidationError);
}

TEST_F(ChartOfAccountsServiceTest, CreateGroup_CustomWithoutName_Throws) {
    auto main = createGroup(GroupLevel::MAIN, std::nullopt, GroupKind::BALANCE_SHEET);
    auto element = createGroup(GroupLevel::ELEMENT, main.id, GroupKind::ASSETS);

    EXPECT_THROW(createGroup(GroupLevel::SUB_ELEMENT, element.id, GroupKind::CUSTOM, "   "), ValidationError);
}

TEST_F(ChartOfAccountsServiceTest, CreateGroup_ParentOfWrongLevel_Throws) {
    auto main = createGroup(GroupLevel::MAIN, std::nullopt, GroupKind::BALANCE_SHEET);

    EXPECT_THROW(createGroup(GroupLevel::SUB_ELEMENT, main.id, GroupKind::CURRENT_ASSETS), ValidationError);
}

TEST_F(ChartOfAccountsServiceTest, CreateGroup_UnknownParent_Throws) {
    EXPECT_THROW(createGroup(GroupLevel::ELEMENT, 999, GroupKind::ASSETS), NotFoundError);
}

TEST_F(ChartOfAccountsServiceTest, CreateGroup_DuplicateStandardGroup_Throws) {
    createGroup(GroupLevel::MAIN, std::nullopt, GroupKind::BALANCE_SHEET);

    EXPECT_THROW(createGroup(GroupLevel::MAIN, std::nullopt, GroupKind::BALANCE_SHEET), DuplicateCodeError);
}

TEST_F(ChartOfAccountsServiceTest, CreateGroup_CustomGroupsGetDistinctCodes) {
    auto main = createGroup(GroupLevel::MAIN, std::nullopt, GroupKind::PROFIT_AND_LOSS);
    auto element = createGroup(GroupLevel::ELEMENT, main.id, GroupKind::INCOMES);

    auto first = createGroup(GroupLevel::SUB_ELEMENT, element.id, GroupKind::CUSTOM, "Online");
    auto second = createGroup(GroupLevel::SUB_ELEMENT, element.id, GroupKind::CUSTOM, "Retail");

    EXPECT_NE(first.code, second.code);
    EXPECT_EQ(first.code.rfind("PL-I-", 0), 0u);
    EXPECT_EQ(first.label(), "Online");
}

TEST_F(ChartOfAccountsServiceTest, DeleteGroup_WithChildren_Throws) {
    auto detailed = createDebtorsBranch();

    EXPECT_THROW(ctx_->chartService->deleteGroup(kTenant, *detailed.parentId), ConstraintError);
}

TEST_F(ChartOfAccountsServiceTest, DeleteGroup_WithAccounts_Throws) {
    auto detailed = createDebtorsBranch();
    ctx_->chartService->createAccount(kTenant, detailed.id, "Debtors", Money());

    EXPECT_THROW(ctx_->chartService->deleteGroup(kTenant, detailed.id), ConstraintError);
}

TEST_F(ChartOfAccountsServiceTest, DeleteGroup_AfterLastAccountDeleted_Succeeds) {
    auto detailed = createDebtorsBranch();
    auto first = ctx_->chartService->createAccount(kTenant, detailed.id, "Debtors A", Money());
    auto second = ctx_->chartService->createAccount(kTenant, detailed.id, "Debtors B", Money());

    ctx_->chartService->deleteAccount(kTenant, first.id);
    EXPECT_THROW(ctx_->chartService->deleteGroup(kTenant, detailed.id), ConstraintError);

    ctx_->chartService->deleteAccount(kTenant, second.id);
    EXPECT_NO_THROW(ctx_->chartService->deleteGroup(kTenant, detailed.id));

    EXPECT_FALSE(ctx_->chartService->getGroup(kTenant, detailed.id).has_value());
    EXPECT_NO_THROW(ctx_->chartService->deleteGroup(kTenant, *detailed.parentId));
}

TEST_F(ChartOfAccountsServiceTest, DeleteGroup_Empty_Removes) {
    auto detailed = createDebtorsBranch();

    ctx_->chartService->deleteGroup(kTenant, detailed.id);

    EXPECT_FALSE(ctx_->chartService->getGroup(kTenant, detailed.id).has_value());
}

// ============================================================================
// ACCOUNT TESTS
// ============================================================================

TEST_F(ChartOfAccountsServiceTest, CreateAccount_DerivesTypeAndCode) {
    auto detailed = createDebtorsBranch();

    auto account = ctx_->chartService->createAccount(kTenant, detailed.id, "  Debtors  ", Money::fromUnits(25));

    EXPECT_EQ(account.accountName, "Debtors");
    EXPECT_EQ(account.accountType, AccountType::ASSET);
    EXPECT_EQ(account.accountCode, "A.CA.TD.001");
    EXPECT_EQ(account.openingBalance, Money::fromUnits(25));
    EXPECT_EQ(account.currentBalance, Money::fromUnits(25));
    EXPECT_TRUE(account.isActive);

    auto second = ctx_->chartService->createAccount(kTenant, detailed.id, "Other Debtors", Money());
    EXPECT_EQ(second.accountCode, "A.CA.TD.002");
}

TEST_F(ChartOfAccountsServiceTest, CreateAccount_PublishesAccountCreated) {
    auto detailed = createDebtorsBranch();

    auto account = ctx_->chartService->createAccount(kTenant, detailed.id, "Debtors", Money());

    ASSERT_EQ(ctx_->eventBus->count("account.created"), 1u);
    auto event = ctx_->eventBus->last<AccountCreatedEvent>("account.created");
    ASSERT_NE(event, nullptr);
    EXPECT_EQ(event->accountId, account.id);
    EXPECT_EQ(event->accountCode, "A.CA.TD.001");
    EXPECT_EQ(event->tenantId, kTenant);
}

TEST_F(ChartOfAccountsServiceTest, CreateAccount_UnderNonDetailedGroup_Throws) {
    auto detailed = createDebtorsBranch();

    EXPECT_THROW(ctx_->chartService->createAccount(kTenant, *detailed.parentId, "Debtors", Money()),
                 ValidationError);
}

TEST_F(ChartOfAccountsServiceTest, CreateAccount_EmptyName_Throws) {
    auto detailed = createDebtorsBranch();

    EXPECT_THROW(ctx_->chartService->createAccount(kTenant, detailed.id, " ", Money()), ValidationError);
}

TEST_F(ChartOfAccountsServiceTest, CreateAccount_DuplicateExplicitCode_Throws) {
    auto detailed = createDebtorsBranch();
    AccountOptions options;
    options.accountCode = "1200";
    ctx_->chartService->createAccount(kTenant, detailed.id, "Debtors", Money(), options);

    EXPECT_THROW(ctx_->chartService->createAccount(kTenant, detailed.id, "Debtors 2", Money(), options),
                 DuplicateCodeError);
}

TEST_F(ChartOfAccountsServiceTest, Account_InvisibleToOtherTenant) {
    auto detailed = createDebtorsBranch();
    auto account = ctx_->chartService->createAccount(kTenant, detailed.id, "Debtors", Money());

    EXPECT_FALSE(ctx_->chartService->getAccount(kOtherTenant, account.id).has_value());
    EXPECT_FALSE(ctx_->chartService->findAccountByCode(kOtherTenant, account.accountCode).has_value());
    EXPECT_THROW(ctx_->chartService->createAccount(kOtherTenant, detailed.id, "Debtors", Money()), NotFoundError);
}

TEST_F(ChartOfAccountsServiceTest, DeleteAccount_SystemAccount_Throws) {
    ctx_->chartService->seedStandardChart(kTenant);
    auto bank = ctx_->account(kTenant, "1100");

    EXPECT_THROW(ctx_->chartService->deleteAccount(kTenant, bank.id), SystemAccountProtectionError);
    EXPECT_THROW(ctx_->chartService->renameAccount(kTenant, bank.id, "Bank 2"), SystemAccountProtectionError);
}

TEST_F(ChartOfAccountsServiceTest, DeleteAccount_ReferencedByLines_Throws) {
    auto detailed = createDebtorsBranch();
    auto first = ctx_->chartService->createAccount(kTenant, detailed.id, "Debtor A", Money());
    auto second = ctx_->chartService->createAccount(kTenant, detailed.id, "Debtor B", Money());

    JournalEntryHeader header;
    header.tenantId = kTenant;
    ctx_->journalService->createEntry(header, {
        JournalLineInput::debit(first.id, Money::fromUnits(10)),
        JournalLineInput::credit(second.id, Money::fromUnits(10)),
    });

    EXPECT_THROW(ctx_->chartService->deleteAccount(kTenant, first.id), ConstraintError);
}

TEST_F(ChartOfAccountsServiceTest, DeleteAccount_Unused_Removes) {
    auto detailed = createDebtorsBranch();
    auto account = ctx_->chartService->createAccount(kTenant, detailed.id, "Debtors", Money());

    ctx_->chartService->deleteAccount(kTenant, account.id);

    EXPECT_FALSE(ctx_->chartService->getAccount(kTenant, account.id).has_value());
}

TEST_F(ChartOfAccountsServiceTest, RenameAccount_UpdatesName) {
    auto detailed = createDebtorsBranch();
    auto account = ctx_->chartService->createAccount(kTenant, detailed.id, "Debtors", Money());

    ctx_->chartService->renameAccount(kTenant, account.id, "Customers");

    EXPECT_EQ(ctx_->chartService->getAccount(kTenant, account.id)->accountName, "Customers");
}

TEST_F(ChartOfAccountsServiceTest, SetAccountActive_TogglesFlag) {
    auto detailed = createDebtorsBranch();
    auto account = ctx_->chartService->createAccount(kTenant, detailed.id, "Debtors", Money());

    auto updated = ctx_->chartService->setAccountActive(kTenant, account.id, false);

    EXPECT_FALSE(updated.isActive);
    EXPECT_FALSE(ctx_->chartService->getAccount(kTenant, account.id)->isActive);
}

// ============================================================================
// SEED TESTS
// ============================================================================

TEST_F(ChartOfAccountsServiceTest, SeedStandardChart_CreatesSystemAccounts) {
    auto summary = ctx_->chartService->seedStandardChart(kTenant);

    EXPECT_GT(summary.groupsCreated, 0u);
    EXPECT_EQ(summary.accountsCreated, 5u);

    auto tax = ctx_->account(kTenant, "2200");
    EXPECT_EQ(tax.accountType, AccountType::LIABILITY);
    EXPECT_TRUE(tax.isSystemAccount);

    auto revenue = ctx_->account(kTenant, "4000");
    EXPECT_EQ(revenue.accountType, AccountType::REVENUE);
}

TEST_F(ChartOfAccountsServiceTest, SeedStandardChart_IsIdempotent) {
    ctx_->chartService->seedStandardChart(kTenant);
    size_t groups = ctx_->groupRepository->size();
    size_t accounts = ctx_->accountRepository->size();

    auto second = ctx_->chartService->seedStandardChart(kTenant);

    EXPECT_EQ(second.groupsCreated, 0u);
    EXPECT_EQ(second.accountsCreated, 0u);
    EXPECT_EQ(ctx_->groupRepository->size(), groups);
    EXPECT_EQ(ctx_->accountRepository->size(), accounts);
}

TEST_F(ChartOfAccountsServiceTest, SeedStandardChart_TenantsAreIndependent) {
    ctx_->chartService->seedStandardChart(kTenant);
    auto summary = ctx_->chartService->seedStandardChart(kOtherTenant);

    EXPECT_EQ(summary.accountsCreated, 5u);
    EXPECT_NE(ctx_->account(kTenant, "1100").id, ctx_->account(kOtherTenant, "1100").id);
}
