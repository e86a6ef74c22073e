// =====================================================================================
//
//       Filename:  test_TransactionSegment.cpp
//
//    Description:  Tests for turning ledger rows into transaction records.
//
//        Version:  1.0
//        Created:  11/13/2025 11:05:19 AM
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
#define BOOST_TEST_MODULE transaction_segment
#include <boost/test/unit_test.hpp>

#include "LogCapture.h"

#include "StatementDialect.h"
#include "Statement_Utils.h"
#include "TransactionSegment.h"
#include "TransactionTable.h"

namespace tt = boost::test_tools;

using namespace date::literals;

namespace
{
    const StatementDialect& TestDialect()
    {
        static const StatementDialect dialect = DefaultStatementDialect();
        return dialect;
    }

    constexpr auto jan_1_2021 = 2021_y/date::January/1;

}   // namespace

BOOST_FIXTURE_TEST_SUITE(parse_segment, LogCapture)

BOOST_AUTO_TEST_CASE(simple_incoming_transfer)
{
    auto record = ParseTransactionSegment("Überweisung Test transaction 100,00 € 100,00 €", jan_1_2021, std::nullopt,
            TestDialect());

    BOOST_TEST(record.booking_date == jan_1_2021);
    BOOST_TEST(record.category == "Überweisung");
    BOOST_TEST(record.description == "Test transaction");
    BOOST_TEST_REQUIRE(record.received.has_value());
    BOOST_TEST(*record.received == 100.0, tt::tolerance(0.001));
    BOOST_TEST(! record.spent.has_value());
    BOOST_TEST_REQUIRE(record.balance.has_value());
    BOOST_TEST(*record.balance == 100.0, tt::tolerance(0.001));
}

BOOST_AUTO_TEST_CASE(description_over_several_lines)
{
    auto record = ParseTransactionSegment("Handel Ausführung Handel Direktkauf Kauf DE0007664039 "
            "VOLKSWAGEN AG VZO O.N. 4788270820210421 236,00 € 264,00 €", 2021_y/date::April/21, std::nullopt,
            TestDialect());

    BOOST_TEST(record.category == "Handel");
    BOOST_TEST(record.description ==
            "Ausführung Handel Direktkauf Kauf DE0007664039 VOLKSWAGEN AG VZO O.N. 4788270820210421");
    BOOST_TEST(! record.received.has_value());
    BOOST_TEST_REQUIRE(record.spent.has_value());
    BOOST_TEST(*record.spent == 236.0, tt::tolerance(0.001));
    BOOST_TEST(*record.balance == 264.0, tt::tolerance(0.001));
}

BOOST_AUTO_TEST_CASE(thousands_separator_in_balance)
{
    auto record = ParseTransactionSegment("Erträge Cash Dividend for ISIN US85254J1025 1,71 € 1.101,46 €",
            2021_y/date::February/15, 1099.75, TestDialect());

    BOOST_TEST(*record.received == 1.71, tt::tolerance(0.001));
    BOOST_TEST(*record.balance == 1101.46, tt::tolerance(0.001));
    BOOST_TEST(record.description == "Cash Dividend for ISIN US85254J1025");
}

BOOST_AUTO_TEST_CASE(every_amount_leaves_description)
{
    auto record = ParseTransactionSegment("Kartentransaktion Refund of 5,00 € fee 5,00 € 95,00 €", jan_1_2021, 100.0,
            TestDialect());

    BOOST_TEST(record.description == "Refund of fee");
    BOOST_TEST(*record.spent == 5.0, tt::tolerance(0.001));
    BOOST_TEST(*record.balance == 95.0, tt::tolerance(0.001));
}

BOOST_AUTO_TEST_CASE(unknown_category_is_kept_and_logged)
{
    auto record = ParseTransactionSegment("Sonstiges Irgendwas 3,00 € 97,00 €", jan_1_2021, 100.0, TestDialect());

    BOOST_TEST(record.category == "Sonstiges");
    BOOST_TEST(record.description == "Irgendwas");
    BOOST_TEST(*record.spent == 3.0, tt::tolerance(0.001));
    BOOST_TEST(CountLines("error|Unknown transaction category: 'Sonstiges'") == 1);
}

BOOST_AUTO_TEST_CASE(category_must_end_at_word_boundary)
{
    auto record = ParseTransactionSegment("Handelsblatt Abo 3,00 € 97,00 €", jan_1_2021, 100.0, TestDialect());

    BOOST_TEST(record.category == "Handelsblatt");
    BOOST_TEST(record.description == "Abo");
    BOOST_TEST(CountLines("Unknown transaction category") == 1);
}

BOOST_AUTO_TEST_CASE(incomplete_segment_has_no_amounts)
{
    auto record = ParseTransactionSegment("Überweisung Only one amount 100,00 €", jan_1_2021, 50.0, TestDialect());

    BOOST_TEST(record.category == "Überweisung");
    BOOST_TEST(! record.received.has_value());
    BOOST_TEST(! record.spent.has_value());
    BOOST_TEST(! record.balance.has_value());
    BOOST_TEST(record.description == "Only one amount");
    BOOST_TEST(CountLines("warning|Incomplete transaction") == 1);
}

BOOST_AUTO_TEST_CASE(collapses_extra_spaces)
{
    auto record = ParseTransactionSegment("  Zinszahlung   Your   interest payment 0,53 €   1.101,99 €  ", jan_1_2021,
            1101.46, TestDialect());

    BOOST_TEST(record.category == "Zinszahlung");
    BOOST_TEST(record.description == "Your interest payment");
    BOOST_TEST(*record.received == 0.53, tt::tolerance(0.001));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(money_values)

BOOST_AUTO_TEST_CASE(finds_amounts_with_positions)
{
    const std::string segment = "Erträge Ertrag US85254J1025 STAG INDUSTRI. INC. DL-,01 6932977820240215 100,25 € 1099,75 €";

    auto amounts = FindMonetaryValues(segment, TestDialect());

    BOOST_TEST_REQUIRE(amounts.size() == 2u);
    BOOST_TEST(amounts[0].text == "100,25 €");
    BOOST_TEST(amounts[1].text == "1099,75 €");
    BOOST_TEST(segment.substr(amounts[1].position, amounts[1].length) == "1099,75 €");
}

BOOST_AUTO_TEST_CASE(long_reference_numbers_are_not_amounts)
{
    auto amounts = FindMonetaryValues("Kauf 4788270820210421 DL-,001", TestDialect());

    BOOST_TEST(amounts.empty());
}

BOOST_AUTO_TEST_CASE(parse_amounts)
{
    BOOST_TEST(*ParseAmount("1.101,46 €") == 1101.46, tt::tolerance(0.0001));
    BOOST_TEST(*ParseAmount("100,00 €") == 100.0, tt::tolerance(0.0001));
    BOOST_TEST(*ParseAmount("+5,50€") == 5.5, tt::tolerance(0.0001));
    BOOST_TEST(*ParseAmount("-12,34 €") == -12.34, tt::tolerance(0.0001));
    BOOST_TEST(*ParseAmount("1.234.567,89 €") == 1234567.89, tt::tolerance(0.0001));
    BOOST_TEST(*ParseAmount("42 €") == 42.0, tt::tolerance(0.0001));
}

BOOST_AUTO_TEST_CASE(zero_in_any_form)
{
    BOOST_TEST(*ParseAmount("0") == 0.0);
    BOOST_TEST(*ParseAmount("0,00") == 0.0);
    BOOST_TEST(*ParseAmount("0.00") == 0.0);
}

BOOST_AUTO_TEST_CASE(other_separators)
{
    BOOST_TEST(*ParseAmount("$1,234.50", ',', '.') == 1234.5, tt::tolerance(0.0001));
}

BOOST_AUTO_TEST_CASE(not_numbers)
{
    BOOST_TEST(! ParseAmount("").has_value());
    BOOST_TEST(! ParseAmount("€").has_value());
    BOOST_TEST(! ParseAmount("abc").has_value());
    BOOST_TEST(! ParseAmount("12x34 €").has_value());
    BOOST_TEST(! ParseAmount("1,2,3 €").has_value());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(transaction_table, LogCapture)

BOOST_AUTO_TEST_CASE(skips_ledger_header)
{
    SX::LineList lines{"DATUM TYP BESCHREIBUNG ZAHLUNGSEINGANG ZAHLUNGSAUSGANG SALDO", "1", "Jan.", "2021",
        "Überweisung Test transaction 100,00 € 100,00 €"};

    auto records = ProcessTransactionTable(lines, TestDialect());

    BOOST_TEST_REQUIRE(records.size() == 1u);
    BOOST_TEST(records[0].description == "Test transaction");
}

BOOST_AUTO_TEST_CASE(rows_in_document_order)
{
    SX::LineList lines{"1", "Jan.", "2021", "Überweisung Deposit 100,00 € 100,00 €",
        "2", "Jan.", "2021", "Zinszahlung Interest payment 10,00 € 110,00 €",
        "3 Jan.", "2021 Handel Ausführung Kauf", "DE0007664039 30,00 € 80,00 €"};

    auto records = ProcessTransactionTable(lines, TestDialect());

    BOOST_TEST_REQUIRE(records.size() == 3u);
    BOOST_TEST(records[0].booking_date == jan_1_2021);
    BOOST_TEST(records[1].booking_date == 2021_y/date::January/2);
    BOOST_TEST(records[2].booking_date == 2021_y/date::January/3);
    BOOST_TEST(*records[1].received == 10.0, tt::tolerance(0.001));
    BOOST_TEST(records[2].category == "Handel");
    BOOST_TEST(records[2].description == "Ausführung Kauf DE0007664039");
    BOOST_TEST(*records[2].spent == 30.0, tt::tolerance(0.001));
    BOOST_TEST(CountLines("Balance calculation error") == 0);
}

BOOST_AUTO_TEST_CASE(lines_before_first_date_are_skipped)
{
    SX::LineList lines{"Übertrag", "1", "Jan.", "2021", "Überweisung Deposit 100,00 € 100,00 €"};

    auto records = ProcessTransactionTable(lines, TestDialect());

    BOOST_TEST(records.size() == 1u);
}

BOOST_AUTO_TEST_CASE(unknown_month_keeps_earlier_rows)
{
    SX::LineList lines{"1", "Jan.", "2021", "Überweisung Deposit 100,00 € 100,00 €",
        "2", "Foo.", "2021", "Handel Purchase 50,00 € 50,00 €",
        "3", "Jan.", "2021", "Handel Purchase 10,00 € 40,00 €"};

    auto records = ProcessTransactionTable(lines, TestDialect());

    BOOST_TEST(records.size() == 1u);
    BOOST_TEST(CountLines("error|Stopped reading transactions") == 1);
}

BOOST_AUTO_TEST_CASE(incomplete_row_does_not_move_carried_balance)
{
    SX::LineList lines{"1", "Jan.", "2021", "Überweisung Deposit 100,00 € 100,00 €",
        "2", "Jan.", "2021", "Handel Purchase",
        "3", "Jan.", "2021", "Handel Purchase 10,00 € 90,00 €"};

    auto records = ProcessTransactionTable(lines, TestDialect());

    BOOST_TEST_REQUIRE(records.size() == 3u);
    BOOST_TEST(! records[1].balance.has_value());
    BOOST_TEST(*records[2].spent == 10.0, tt::tolerance(0.001));
    BOOST_TEST(CountLines("Balance calculation error") == 0);
}

BOOST_AUTO_TEST_CASE(mismatch_is_reported_and_row_kept)
{
    SX::LineList lines{"1", "Jan.", "2021", "Überweisung Deposit 100,00 € 100,00 €",
        "2", "Jan.", "2021", "Überweisung Deposit 25,00 € 150,00 €",
        "3", "Jan.", "2021", "Handel Purchase 50,00 € 100,00 €"};

    auto records = ProcessTransactionTable(lines, TestDialect());

    BOOST_TEST_REQUIRE(records.size() == 3u);
    BOOST_TEST(*records[1].balance == 150.0, tt::tolerance(0.001));
    BOOST_TEST(CountLines("warning|Balance calculation error") == 1);
}

BOOST_AUTO_TEST_SUITE_END()
