/**
 * @file CsvChartReaderTest.cpp
 * @brief Unit tests for CsvChartReader
 */

#include <gtest/gtest.h>
#include "adapters/primary/CsvChartReader.hpp"
#include <sstream>

using namespace accounting::adapters::primary;
using namespace accounting::domain;

class CsvChartReaderTest : public ::testing::Test {
protected:
    static CsvReadResult readText(const std::string& text) {
        std::istringstream input(text);
        return CsvChartReader::read(input);
    }

    static constexpr const char* kHeader =
        "account_name,main_group,element_group,sub_element_group,detailed_group,opening_balance\n";
};

// ============================================================================
// HEADER
// ============================================================================

TEST_F(CsvChartReaderTest, Read_EmptyInput_Throws) {
    EXPECT_THROW(readText(""), std::invalid_argument);
    EXPECT_THROW(readText("\n  \n"), std::invalid_argument);
}

TEST_F(CsvChartReaderTest, Read_MissingRequiredColumn_Throws) {
    EXPECT_THROW(readText("account_name,main_group,element_group,detailed_group\n"), std::invalid_argument);
}

TEST_F(CsvChartReaderTest, Read_HeaderInAnyOrderAndCase) {
    auto result = readText(
        "Detailed Group,Account Name,Sub-Element Group,Main Group,Element Group,Description\n"
        "Trade Debtors,Acme,Current Assets,Balance Sheet,Assets,Key client\n");

    ASSERT_EQ(result.rows.size(), 1u);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_EQ(result.rows[0].accountName, "Acme");
    EXPECT_EQ(result.rows[0].mainGroupName, "Balance Sheet");
    EXPECT_EQ(result.rows[0].elementGroupName, "Assets");
    EXPECT_EQ(result.rows[0].subElementGroupName, "Current Assets");
    EXPECT_EQ(result.rows[0].detailedGroupName, "Trade Debtors");
    EXPECT_EQ(result.rows[0].description, "Key client");
    EXPECT_TRUE(result.rows[0].openingBalance.isZero());
}

// ============================================================================
// ROWS
// ============================================================================

TEST_F(CsvChartReaderTest, Read_QuotedFields_CommasAndEscapedQuotes) {
    auto result = readText(std::string(kHeader) +
        "\"Smith, Jones & Co\",Balance Sheet,Assets,Current Assets,Trade Debtors,\"1,250.50\"\n"
        "\"The \"\"Big\"\" Client\",Balance Sheet,Assets,Current Assets,Trade Debtors,\n");

    ASSERT_EQ(result.rows.size(), 2u);
    EXPECT_EQ(result.rows[0].accountName, "Smith, Jones & Co");
    EXPECT_EQ(result.rows[0].openingBalance, Money::parse("1250.50"));
    EXPECT_EQ(result.rows[1].accountName, "The \"Big\" Client");
    EXPECT_TRUE(result.rows[1].openingBalance.isZero());
}

TEST_F(CsvChartReaderTest, Read_FieldsTrimmed) {
    auto result = readText(std::string(kHeader) +
        "  Petty Cash , Balance Sheet ,Assets, Current Assets ,Cash Bank Balances, 20 \n");

    ASSERT_EQ(result.rows.size(), 1u);
    EXPECT_EQ(result.rows[0].accountName, "Petty Cash");
    EXPECT_EQ(result.rows[0].mainGroupName, "Balance Sheet");
    EXPECT_EQ(result.rows[0].openingBalance, Money::fromUnits(20));
}

TEST_F(CsvChartReaderTest, Read_BlankLinesAndCarriageReturns) {
    auto result = readText(
        "\r\n"
        "account_name,main_group,element_group,sub_element_group,detailed_group\r\n"
        "\r\n"
        "Bank,Balance Sheet,Assets,Current Assets,Cash Bank Balances\r\n"
        "   \r\n"
        "Loan,Balance Sheet,Liabilities,Non Current Liabilities,Long Term Loans\r\n");

    ASSERT_EQ(result.rows.size(), 2u);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_EQ(result.rows[0].detailedGroupName, "Cash Bank Balances");
    EXPECT_EQ(result.rows[1].detailedGroupName, "Long Term Loans");

    ASSERT_EQ(result.lineNumbers.size(), 2u);
    EXPECT_EQ(result.lineNumbers[0], 4u);
    EXPECT_EQ(result.lineNumbers[1], 6u);
}

TEST_F(CsvChartReaderTest, Read_BadOpeningBalance_RecordedAsLineError) {
    auto result = readText(std::string(kHeader) +
        "Bank,Balance Sheet,Assets,Current Assets,Cash Bank Balances,100\n"
        "Cash,Balance Sheet,Assets,Current Assets,Cash Bank Balances,abc\n"
        "Till,Balance Sheet,Assets,Current Assets,Cash Bank Balances,5\n");

    ASSERT_EQ(result.rows.size(), 2u);
    EXPECT_EQ(result.rows[0].accountName, "Bank");
    EXPECT_EQ(result.rows[1].accountName, "Till");
    EXPECT_EQ(result.lineNumbers[1], 4u);

    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].lineNumber, 3u);
    EXPECT_FALSE(result.errors[0].message.empty());
}

TEST_F(CsvChartReaderTest, Read_UnterminatedQuote_RecordedAsLineError) {
    auto result = readText(std::string(kHeader) +
        "\"Broken,Balance Sheet,Assets,Current Assets,Trade Debtors,\n"
        "Fine,Balance Sheet,Assets,Current Assets,Trade Debtors,\n");

    ASSERT_EQ(result.rows.size(), 1u);
    EXPECT_EQ(result.rows[0].accountName, "Fine");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].lineNumber, 2u);
}

TEST_F(CsvChartReaderTest, Read_ShortRow_MissingFieldsEmpty) {
    auto result = readText(std::string(kHeader) + "Orphan,Balance Sheet\n");

    ASSERT_EQ(result.rows.size(), 1u);
    EXPECT_EQ(result.rows[0].accountName, "Orphan");
    EXPECT_TRUE(result.rows[0].elementGroupName.empty());
    EXPECT_TRUE(result.rows[0].detailedGroupName.empty());
}

// ============================================================================
// SPLIT LINE
// ============================================================================

TEST_F(CsvChartReaderTest, SplitLine_EmptyFieldsPreserved) {
    auto fields = CsvChartReader::splitLine("a,,c,");

    ASSERT_EQ(fields.size(), 4u);
    EXPECT_EQ(fields[0], "a");
    EXPECT_EQ(fields[1], "");
    EXPECT_EQ(fields[2], "c");
    EXPECT_EQ(fields[3], "");
}
