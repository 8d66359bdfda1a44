/**
 * @file LedgerJsonTest.cpp
 * @brief Unit tests for LedgerJson
 */

#include <gtest/gtest.h>
#include "adapters/primary/LedgerJson.hpp"

using namespace accounting::adapters::primary;
using namespace accounting::domain;

TEST(LedgerJsonTest, AccountToJson_MoneyAsDecimalStrings) {
    Account account;
    account.id = 7;
    account.accountCode = "1210-101";
    account.accountName = "Acme Ltd Receivable";
    account.accountType = AccountType::ASSET;
    account.entityId = 101;
    account.isSystemAccount = true;
    account.openingBalance = Money::fromMinor(5);
    account.currentBalance = Money::fromUnits(-1150);

    auto j = LedgerJson::accountToJson(account);

    EXPECT_EQ(j["code"], "1210-101");
    EXPECT_EQ(j["type"], "asset");
    EXPECT_EQ(j["entity_id"], 101);
    EXPECT_EQ(j["is_system"], true);
    EXPECT_EQ(j["opening_balance"], "0.05");
    EXPECT_EQ(j["current_balance"], "-1150.00");
}

TEST(LedgerJsonTest, AccountToJson_NoEntity_Null) {
    Account account;
    auto j = LedgerJson::accountToJson(account);
    EXPECT_TRUE(j["entity_id"].is_null());
}

TEST(LedgerJsonTest, ErrorToJson_MissingAccountsListed) {
    MissingAccountError error({
        {"income", "No revenue account", "Create a revenue account"},
        {"tax_payable", "No Tax Liability group", "Create a Tax Liability group"},
    });

    auto j = LedgerJson::errorToJson("missing_accounts", error);

    EXPECT_EQ(j["error"], "missing_accounts");
    EXPECT_FALSE(j["message"].get<std::string>().empty());
    ASSERT_TRUE(j["missing"].is_array());
    ASSERT_EQ(j["missing"].size(), 2u);
    EXPECT_EQ(j["missing"][0]["role"], "income");
    EXPECT_EQ(j["missing"][1]["guidance"], "Create a Tax Liability group");
}

TEST(LedgerJsonTest, ErrorToJson_PlainError_NoMissingField) {
    NotFoundError error("Account", 5);

    auto j = LedgerJson::errorToJson("not_found", error);

    EXPECT_EQ(j["message"], "Account 5 not found");
    EXPECT_FALSE(j.contains("missing"));
}

TEST(LedgerJsonTest, ImportReportToJson_CountsAndRows) {
    ImportReport report;
    ImportRowResult ok;
    ok.rowNumber = 1;
    ok.success = true;
    ok.accountId = 3;
    ok.accountCode = "A.CA.CB.001";
    ImportRowResult failed;
    failed.rowNumber = 2;
    failed.message = "Unknown main group";
    report.rows = {ok, failed};

    auto j = LedgerJson::importReportToJson(report);

    EXPECT_EQ(j["succeeded"], 1);
    EXPECT_EQ(j["failed"], 1);
    EXPECT_EQ(j["rows"][0]["account_code"], "A.CA.CB.001");
    EXPECT_TRUE(j["rows"][1]["account_id"].is_null());
    EXPECT_EQ(j["rows"][1]["message"], "Unknown main group");
}
