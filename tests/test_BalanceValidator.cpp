// =====================================================================================
//
//       Filename:  test_BalanceValidator.cpp
//
//    Description:  Tests for flow direction and running balance checks.
//
//        Version:  1.0
//        Created:  11/13/2025 01:47:22 PM
//       Revision:  none
//       Compiler:  g++
//
//         Author:  David P. Riedel (dpr), driedel@cox.net
//        License:  GNU General Public License v3
//        Company:
//
// =====================================================================================

/* This file is part of Statement_Extractor. */

/* Statement_Extractor is free software: you can redistribute it and/or modify */
/* it under the terms of the GNU General Public License as published by */
/* the Free Software Foundation, either version 3 of the License, or */
/* (at your option) any later version. */

/* Statement_Extractor is distributed in the hope that it will be useful, */
/* but WITHOUT ANY WARRANTY; without even the implied warranty of */
/* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the */
/* GNU General Public License for more details. */

/* You should have received a copy of the GNU General Public License */
/* along with Statement_Extractor.  If not, see <http://www.gnu.org/licenses/>. */


#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE balance_validator
#include <boost/test/unit_test.hpp>

#include "LogCapture.h"

#include "BalanceValidator.h"
#include "FlowDirection.h"
#include "StatementDialect.h"
#include "Statement_Utils.h"

namespace tt = boost::test_tools;

using namespace date::literals;

namespace
{
    const StatementDialect& TestDialect()
    {
        static const StatementDialect dialect = DefaultStatementDialect();
        return dialect;
    }

    SX::TransactionRecord MakeRecord(std::optional<double> received, std::optional<double> spent,
            std::optional<double> balance)
    {
        SX::TransactionRecord record;
        record.booking_date = 2021_y/date::April/21;
        record.category = "Handel";
        record.description = "Kauf DE0007664039";
        record.received = received;
        record.spent = spent;
        record.balance = balance;
        return record;
    }

    constexpr double epsilon = 0.01;

}   // namespace

BOOST_AUTO_TEST_SUITE(flow_direction)

BOOST_AUTO_TEST_CASE(rising_balance_is_inflow_whatever_the_category)
{
    BOOST_TEST((DetermineFlowDirection(100.0, 150.0, "Handel", TestDialect()) == SX::FlowDirection::e_Inflow));
    BOOST_TEST((DetermineFlowDirection(100.0, 50.0, "Überweisung", TestDialect()) == SX::FlowDirection::e_Outflow));
}

BOOST_AUTO_TEST_CASE(unchanged_balance_is_outflow)
{
    BOOST_TEST((DetermineFlowDirection(100.0, 100.0, "Erträge", TestDialect()) == SX::FlowDirection::e_Outflow));
}

BOOST_AUTO_TEST_CASE(category_decides_without_previous_balance)
{
    BOOST_TEST((DetermineFlowDirection(std::nullopt, 100.0, "Überweisung", TestDialect()) == SX::FlowDirection::e_Inflow));
    BOOST_TEST((DetermineFlowDirection(std::nullopt, 100.0, "Erträge", TestDialect()) == SX::FlowDirection::e_Inflow));
    BOOST_TEST((DetermineFlowDirection(std::nullopt, 100.0, "Zinszahlung", TestDialect()) == SX::FlowDirection::e_Inflow));
    BOOST_TEST((DetermineFlowDirection(std::nullopt, 264.0, "Handel", TestDialect()) == SX::FlowDirection::e_Outflow));
    BOOST_TEST((DetermineFlowDirection(100.0, std::nullopt, "Kartentransaktion", TestDialect()) == SX::FlowDirection::e_Outflow));
}

BOOST_AUTO_TEST_CASE(unknown_category_is_outflow)
{
    BOOST_TEST((DetermineFlowDirection(std::nullopt, std::nullopt, "Sonstiges", TestDialect()) == SX::FlowDirection::e_Outflow));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(validate_balance, LogCapture)

BOOST_AUTO_TEST_CASE(consistent_rows_are_quiet)
{
    BOOST_TEST(! ValidateBalance(MakeRecord(100.0, std::nullopt, 100.0), 0.0, epsilon).has_value());
    BOOST_TEST(! ValidateBalance(MakeRecord(std::nullopt, 50.0, 50.0), 100.0, epsilon).has_value());
    BOOST_TEST(! ValidateBalance(MakeRecord(std::nullopt, 236.0, 264.0), 500.0, epsilon).has_value());
    BOOST_TEST(CountLines("Balance calculation error") == 0);
}

BOOST_AUTO_TEST_CASE(rounding_within_epsilon)
{
    BOOST_TEST(! ValidateBalance(MakeRecord(0.1, std::nullopt, 0.3), 0.2, epsilon).has_value());
    BOOST_TEST(! ValidateBalance(MakeRecord(1.71, std::nullopt, 1101.46), 1099.75, epsilon).has_value());
}

BOOST_AUTO_TEST_CASE(mismatch_is_reported_once)
{
    auto mismatch = ValidateBalance(MakeRecord(std::nullopt, 236.0, 264.0), 600.0, epsilon);

    BOOST_TEST_REQUIRE(mismatch.has_value());
    BOOST_TEST(mismatch->expected == 364.0, tt::tolerance(0.001));
    BOOST_TEST(mismatch->actual == 264.0, tt::tolerance(0.001));
    BOOST_TEST(mismatch->record.description == "Kauf DE0007664039");
    BOOST_TEST(CountLines("warning|Balance calculation error") == 1);
    BOOST_TEST(CountLines("600.00 - 236.00 = 364.00 but balance is: 264.00") == 1);
    BOOST_TEST(CountLines("balance unchanged") == 0);
}

BOOST_AUTO_TEST_CASE(unchanged_balance_is_flagged)
{
    auto mismatch = ValidateBalance(MakeRecord(std::nullopt, 20.0, 100.0), 100.0, epsilon);

    BOOST_TEST(mismatch.has_value());
    BOOST_TEST(CountLines("(balance unchanged)") == 1);
}

BOOST_AUTO_TEST_CASE(nothing_to_compare)
{
    BOOST_TEST(! ValidateBalance(MakeRecord(std::nullopt, 236.0, 264.0), std::nullopt, epsilon).has_value());
    BOOST_TEST(! ValidateBalance(MakeRecord(std::nullopt, std::nullopt, std::nullopt), 600.0, epsilon).has_value());
    BOOST_TEST(Captured().empty());
}

BOOST_AUTO_TEST_SUITE_END()
