// =====================================================================================
//
//       Filename:  test_DateAnchor.cpp
//
//    Description:  Tests for finding the dates which start ledger rows.
//
//        Version:  1.0
//        Created:  11/13/2025 10:12:35 AM
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
#define BOOST_TEST_MODULE date_anchor
#include <boost/test/unit_test.hpp>

#include "DateAnchor.h"
#include "StatementDialect.h"
#include "Statement_Utils.h"

using namespace date::literals;

namespace
{
    const StatementDialect& TestDialect()
    {
        static const StatementDialect dialect = DefaultStatementDialect();
        return dialect;
    }

}   // namespace

BOOST_AUTO_TEST_SUITE(three_line_dates)

BOOST_AUTO_TEST_CASE(day_month_year_on_own_lines)
{
    SX::LineList lines{"1", "Jan.", "2021", "Überweisung Test 100,00 € 100,00 €"};

    auto anchor = TryParseDateAnchor(lines, 0, TestDialect());

    BOOST_TEST_REQUIRE(anchor.has_value());
    BOOST_TEST(anchor->anchor_date == 2021_y/date::January/1);
    BOOST_TEST(anchor->found_at == 0u);
    BOOST_TEST(anchor->resume_at == 3u);
    BOOST_TEST(anchor->residual_text.empty());
}

BOOST_AUTO_TEST_CASE(month_with_and_without_period)
{
    SX::LineList lines{"2", "Feb", "2021", "x", "2", "Feb.", "2021"};

    auto without_period = TryParseDateAnchor(lines, 0, TestDialect());
    auto with_period = TryParseDateAnchor(lines, 4, TestDialect());

    BOOST_TEST_REQUIRE(without_period.has_value());
    BOOST_TEST_REQUIRE(with_period.has_value());
    BOOST_TEST(without_period->anchor_date == 2021_y/date::February/2);
    BOOST_TEST(with_period->anchor_date == 2021_y/date::February/2);
}

BOOST_AUTO_TEST_CASE(month_names_with_umlaut_and_long_forms)
{
    SX::LineList lines{"01", "März", "2021", "23", "Juni", "2021", "24", "Sept.", "2025", "3", "Mär.", "2024"};

    BOOST_TEST(TryParseDateAnchor(lines, 0, TestDialect())->anchor_date == 2021_y/date::March/1);
    BOOST_TEST(TryParseDateAnchor(lines, 3, TestDialect())->anchor_date == 2021_y/date::June/23);
    BOOST_TEST(TryParseDateAnchor(lines, 6, TestDialect())->anchor_date == 2025_y/date::September/24);
    BOOST_TEST(TryParseDateAnchor(lines, 9, TestDialect())->anchor_date == 2024_y/date::March/3);
}

BOOST_AUTO_TEST_CASE(needs_all_three_lines)
{
    SX::LineList lines{"1", "Jan."};

    BOOST_TEST(! TryParseDateAnchor(lines, 0, TestDialect()).has_value());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(two_line_dates)

BOOST_AUTO_TEST_CASE(year_leads_next_line)
{
    SX::LineList lines{"09 Juli", "2021 Erträge Ereignisausführung Ertrag LU2082999132 LIF-600 TR.+LEI",
        "EOD 1864121920220709 0,58 € 678,90 €"};

    auto anchor = TryParseDateAnchor(lines, 0, TestDialect());

    BOOST_TEST_REQUIRE(anchor.has_value());
    BOOST_TEST(anchor->anchor_date == 2021_y/date::July/9);
    BOOST_TEST(anchor->residual_text == "Erträge Ereignisausführung Ertrag LU2082999132 LIF-600 TR.+LEI");

    // scanning picks up after the year line, not on it.

    BOOST_TEST(anchor->resume_at == 2u);
}

BOOST_AUTO_TEST_CASE(year_alone_on_next_line)
{
    SX::LineList lines{"xx", "24 Sept.", "2025", "Kauf"};

    auto anchor = TryParseDateAnchor(lines, 1, TestDialect());

    BOOST_TEST_REQUIRE(anchor.has_value());
    BOOST_TEST(anchor->found_at == 1u);
    BOOST_TEST(anchor->resume_at == 3u);
    BOOST_TEST(anchor->residual_text.empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(not_dates)

BOOST_AUTO_TEST_CASE(bare_numbers_are_not_dates)
{
    SX::LineList lines{"5", "10", "2021"};

    BOOST_TEST(! TryParseDateAnchor(lines, 0, TestDialect()).has_value());
}

BOOST_AUTO_TEST_CASE(text_lines_are_not_dates)
{
    SX::LineList lines{"Überweisung Test 100,00 € 100,00 €", "100,00 €", "123 Jan.", "2021"};

    BOOST_TEST(! TryParseDateAnchor(lines, 0, TestDialect()).has_value());
    BOOST_TEST(! TryParseDateAnchor(lines, 1, TestDialect()).has_value());

    // 3 digits is not a day.

    BOOST_TEST(! TryParseDateAnchor(lines, 2, TestDialect()).has_value());
}

BOOST_AUTO_TEST_CASE(day_and_month_without_year)
{
    SX::LineList lines{"1 Jan.", "Überweisung 100,00 € 100,00 €"};

    BOOST_TEST(! TryParseDateAnchor(lines, 0, TestDialect()).has_value());
}

BOOST_AUTO_TEST_CASE(index_past_end)
{
    SX::LineList lines{"1", "Jan.", "2021"};

    BOOST_TEST(! TryParseDateAnchor(lines, 3, TestDialect()).has_value());
    BOOST_TEST(! TryParseDateAnchor(lines, 42, TestDialect()).has_value());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(bad_dates)

BOOST_AUTO_TEST_CASE(unknown_month_throws)
{
    SX::LineList lines{"1", "Foo.", "2021"};

    BOOST_CHECK_THROW(static_cast<void>(TryParseDateAnchor(lines, 0, TestDialect())), DateException);
}

BOOST_AUTO_TEST_CASE(unknown_month_on_day_line_throws)
{
    SX::LineList lines{"1 Xyz", "2021 Handel"};

    BOOST_CHECK_THROW(static_cast<void>(TryParseDateAnchor(lines, 0, TestDialect())), DateException);
}

BOOST_AUTO_TEST_CASE(impossible_calendar_date_throws)
{
    SX::LineList lines{"31", "Feb.", "2021"};

    BOOST_CHECK_THROW(static_cast<void>(TryParseDateAnchor(lines, 0, TestDialect())), DateException);
}

BOOST_AUTO_TEST_CASE(leap_day_is_fine)
{
    SX::LineList lines{"29", "Feb.", "2024"};

    BOOST_TEST(TryParseDateAnchor(lines, 0, TestDialect())->anchor_date == 2024_y/date::February/29);
}

BOOST_AUTO_TEST_SUITE_END()
