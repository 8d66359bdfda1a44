/**
 * @file ChartImportServiceTest.cpp
 * @brief Unit tests for ChartImportService
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../fixtures/LedgerTestContext.hpp"
#include "../mocks/MockChartOfAccountsService.hpp"

using namespace accounting;
using namespace accounting::domain;
using namespace accounting::tests;

class ChartImportServiceTest : public ::testing::Test {
protected:
    static constexpr int64_t kTenant = 21;

    void SetUp() override {
        ctx_ = std::make_unique<LedgerTestContext>();
    }

    void TearDown() override {
        ctx_->store->clear();
    }

    static ImportRow row(const std::string& name, const std::string& main, const std::string& element,
                         const std::string& sub, const std::string& detailed,
                         Money opening = Money()) {
        ImportRow r;
        r.accountName = name;
        r.mainGroupName = main;
        r.elementGroupName = element;
        r.subElementGroupName = sub;
        r.detailedGroupName = detailed;
        r.openingBalance = opening;
        return r;
    }

    size_t groupsAt(GroupLevel level) {
        return ctx_->groupRepository->findByLevel(kTenant, level).size();
    }

    std::unique_ptr<LedgerTestContext> ctx_;
};

// ============================================================================
// IMPORT TESTS
// ============================================================================

TEST_F(ChartImportServiceTest, Import_PredefinedGroupsMatchedByDisplayName) {
    auto report = ctx_->importService->importChart(kTenant, {
        row("Main Bank", "Balance Sheet", "Assets", "Current Assets", "Cash Bank Balances", Money::fromUnits(500)),
    });

    ASSERT_EQ(report.rows.size(), 1u);
    ASSERT_TRUE(report.rows[0].success) << report.rows[0].message;
    EXPECT_EQ(report.rows[0].accountCode, "A.CA.CB.001");

    auto account = ctx_->account(kTenant, "A.CA.CB.001");
    EXPECT_EQ(account.accountType, AccountType::ASSET);
    EXPECT_EQ(account.openingBalance, Money::fromUnits(500));
    EXPECT_EQ(account.currentBalance, Money::fromUnits(500));
    EXPECT_FALSE(account.isSystemAccount);

    auto detailed = ctx_->detailedGroup(kTenant, GroupKind::CASH_BANK_BALANCES);
    EXPECT_EQ(detailed.code, "BS-A-CA-CB");
}

TEST_F(ChartImportServiceTest, Import_CustomGroupCreatedOnceAndReused) {
    auto report = ctx_->importService->importChart(kTenant, {
        row("Web Shop", "P&L", "Income", "Online Sales", "Marketplaces"),
        row("App Store", "Profit and Loss", "Revenue", "online sales", "MARKETPLACES"),
    });

    EXPECT_EQ(report.succeeded(), 2u);
    EXPECT_EQ(groupsAt(GroupLevel::MAIN), 1u);
    EXPECT_EQ(groupsAt(GroupLevel::ELEMENT), 1u);
    EXPECT_EQ(groupsAt(GroupLevel::SUB_ELEMENT), 1u);
    EXPECT_EQ(groupsAt(GroupLevel::DETAILED), 1u);

    auto sub = ctx_->groupRepository->findByLevel(kTenant, GroupLevel::SUB_ELEMENT).front();
    EXPECT_EQ(sub.kind, GroupKind::CUSTOM);
    EXPECT_EQ(sub.customName, "Online Sales");

    auto first = ctx_->accountRepository->findById(kTenant, *report.rows[0].accountId);
    auto second = ctx_->accountRepository->findById(kTenant, *report.rows[1].accountId);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->detailedGroupId, second->detailedGroupId);
    EXPECT_EQ(first->accountType, AccountType::REVENUE);
}

TEST_F(ChartImportServiceTest, Import_FailingRowDoesNotStopBatch) {
    auto report = ctx_->importService->importChart(kTenant, {
        row("Debtors", "BS", "Assets", "Current Assets", "Trade Debtors"),
        row("Broken", "Balance Sheet", "Expenses", "Cost of Sales", "Misc"),
        row("", "BS", "Assets", "Current Assets", "Trade Debtors"),
        row("Loan", "BS", "Liabilities", "Non Current Liabilities", "Long Term Loans"),
    });

    ASSERT_EQ(report.rows.size(), 4u);
    EXPECT_TRUE(report.rows[0].success);
    EXPECT_FALSE(report.rows[1].success);
    EXPECT_FALSE(report.rows[1].message.empty());
    EXPECT_FALSE(report.rows[2].success);
    EXPECT_TRUE(report.rows[3].success);
    EXPECT_EQ(report.rows[3].rowNumber, 4u);
    EXPECT_EQ(report.succeeded(), 2u);
    EXPECT_EQ(report.failed(), 2u);

    EXPECT_EQ(ctx_->account(kTenant, report.rows[3].accountCode).accountType, AccountType::LIABILITY);
}

TEST_F(ChartImportServiceTest, Import_UnknownMainGroup_Fails) {
    auto report = ctx_->importService->importChart(kTenant, {
        row("Debtors", "Cash Flow", "Assets", "Current Assets", "Trade Debtors"),
    });

    EXPECT_EQ(report.failed(), 1u);
    EXPECT_EQ(groupsAt(GroupLevel::MAIN), 0u);
}

TEST_F(ChartImportServiceTest, Import_ReusesSeededGroups) {
    ctx_->chartService->seedStandardChart(kTenant);
    size_t detailedBefore = groupsAt(GroupLevel::DETAILED);

    auto report = ctx_->importService->importChart(kTenant, {
        row("Acme Receivable", "balance_sheet", "assets", "current_assets", "trade_debtors"),
        row("Consulting", "Income Statement", "Incomes", "Service Revenue", "Service Revenue"),
    });

    EXPECT_EQ(report.succeeded(), 2u);
    EXPECT_EQ(groupsAt(GroupLevel::DETAILED), detailedBefore);

    auto consulting = ctx_->accountRepository->findById(kTenant, *report.rows[1].accountId);
    EXPECT_EQ(consulting->detailedGroupId, ctx_->account(kTenant, "4000").detailedGroupId);
}

TEST_F(ChartImportServiceTest, Import_EmptyBatch_EmptyReport) {
    auto report = ctx_->importService->importChart(kTenant, {});

    EXPECT_TRUE(report.rows.empty());
    EXPECT_EQ(report.succeeded(), 0u);
}

// ============================================================================
// ISOLATED FROM CHART SERVICE
// ============================================================================

using ::testing::_;
using ::testing::Return;
using ::testing::Throw;
using ::testing::Field;
using ::testing::Eq;
using ::testing::NiceMock;

class ChartImportServiceMockTest : public ::testing::Test {
protected:
    static constexpr int64_t kTenant = 22;

    void SetUp() override {
        chartService_ = std::make_shared<NiceMock<MockChartOfAccountsService>>();
        importService_ = std::make_shared<application::ChartImportService>(chartService_);

        ON_CALL(*chartService_, listGroups(kTenant, GroupLevel::MAIN, _))
            .WillByDefault(Return(std::vector<AccountGroup>{group(1, GroupLevel::MAIN, GroupKind::BALANCE_SHEET)}));
        ON_CALL(*chartService_, listGroups(kTenant, GroupLevel::ELEMENT, _))
            .WillByDefault(Return(std::vector<AccountGroup>{group(2, GroupLevel::ELEMENT, GroupKind::ASSETS)}));
        ON_CALL(*chartService_, listGroups(kTenant, GroupLevel::SUB_ELEMENT, _))
            .WillByDefault(Return(std::vector<AccountGroup>{group(3, GroupLevel::SUB_ELEMENT, GroupKind::CURRENT_ASSETS)}));
        ON_CALL(*chartService_, listGroups(kTenant, GroupLevel::DETAILED, _))
            .WillByDefault(Return(std::vector<AccountGroup>{group(4, GroupLevel::DETAILED, GroupKind::TRADE_DEBTORS)}));
    }

    static AccountGroup group(int64_t id, GroupLevel level, GroupKind kind) {
        AccountGroup g;
        g.id = id;
        g.tenantId = kTenant;
        g.level = level;
        g.kind = kind;
        if (id > 1) g.parentId = id - 1;
        return g;
    }

    static ImportRow debtorRow(const std::string& name, const std::string& description = "") {
        ImportRow r;
        r.accountName = name;
        r.mainGroupName = "BS";
        r.elementGroupName = "Assets";
        r.subElementGroupName = "Current Assets";
        r.detailedGroupName = "Trade Debtors";
        r.description = description;
        return r;
    }

    static Account created(int64_t id, const std::string& code) {
        Account a;
        a.id = id;
        a.tenantId = kTenant;
        a.accountCode = code;
        return a;
    }

    std::shared_ptr<NiceMock<MockChartOfAccountsService>> chartService_;
    std::shared_ptr<ports::input::IChartImportService> importService_;
};

TEST_F(ChartImportServiceMockTest, Import_ExistingGroups_NoGroupCreated) {
    EXPECT_CALL(*chartService_, createGroup(_)).Times(0);
    EXPECT_CALL(*chartService_, createAccount(kTenant, 4, "Acme", _,
                                              Field(&AccountOptions::description, Eq("Key client"))))
        .WillOnce(Return(created(10, "A.CA.TD.001")));

    auto report = importService_->importChart(kTenant, {debtorRow(" Acme ", "  Key client ")});

    ASSERT_EQ(report.rows.size(), 1u);
    EXPECT_TRUE(report.rows[0].success);
    EXPECT_EQ(report.rows[0].accountCode, "A.CA.TD.001");
}

TEST_F(ChartImportServiceMockTest, Import_CreateAccountFails_NextRowStillImported) {
    EXPECT_CALL(*chartService_, createAccount(kTenant, 4, _, _, _))
        .WillOnce(Throw(DuplicateCodeError("A.CA.TD.001")))
        .WillOnce(Return(created(11, "A.CA.TD.002")));

    auto report = importService_->importChart(kTenant, {debtorRow("First"), debtorRow("Second")});

    ASSERT_EQ(report.rows.size(), 2u);
    EXPECT_FALSE(report.rows[0].success);
    EXPECT_NE(report.rows[0].message.find("A.CA.TD.001"), std::string::npos);
    EXPECT_TRUE(report.rows[1].success);
    EXPECT_EQ(*report.rows[1].accountId, 11);
}

TEST_F(ChartImportServiceMockTest, Import_MissingDetailedGroupName_NoAccountCall) {
    EXPECT_CALL(*chartService_, createAccount(_, _, _, _, _)).Times(0);

    auto row = debtorRow("Acme");
    row.detailedGroupName = "   ";
    auto report = importService_->importChart(kTenant, {row});

    EXPECT_EQ(report.failed(), 1u);
}
