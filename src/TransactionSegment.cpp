// =====================================================================================
//
//       Filename:  TransactionSegment.cpp
//
//    Description:  Turn the text between two date anchors into a transaction record.
//
//        Version:  1.0
//        Created:  11/10/2025 10:40:58 AM
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

#include "TransactionSegment.h"

#include <cctype>
#include <charconv>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/regex.hpp>

#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/find_if.hpp>

#include <spdlog/spdlog.h>

#include "FlowDirection.h"
#include "StatementDialect.h"
#include "Statement_Utils.h"

namespace
{
    const boost::regex regex_multiple_spaces{R"***( {2,})***"};
    const std::string one_space = " ";

    bool IsSpace (char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

}   // namespace

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  FindMonetaryValues
 *  Description:
 * =====================================================================================
 */
MoneyMatchList FindMonetaryValues (SX::sv segment, const StatementDialect& dialect)
{
    MoneyMatchList results;

    boost::regex_iterator<SX::sv::const_iterator> next_match(segment.cbegin(), segment.cend(), dialect.MoneyPattern());
    boost::regex_iterator<SX::sv::const_iterator> end;

    for (; next_match != end; ++next_match)
    {
        const auto& found = (*next_match)[0];
        results.push_back(MoneyMatch{static_cast<std::size_t>(found.first - segment.cbegin()),
                static_cast<std::size_t>(found.length()), found.str()});
    }
    return results;
}		/* -----  end of function FindMonetaryValues  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  FindCategory
 *  Description:  the longest known category which the segment starts with as a
 *                whole word. otherwise the first word, which we keep and complain
 *                about.
 * =====================================================================================
 */
std::string FindCategory (SX::sv segment, const StatementDialect& dialect)
{
    const auto& categories = dialect.Categories();
    auto found = ranges::find_if(categories, [segment](const std::string& category)
        {
            return boost::algorithm::starts_with(segment, category)
                && (segment.size() == category.size() || IsSpace(segment[category.size()]));
        });

    if (found != categories.end())
    {
        return *found;
    }

    auto first_word = segment.substr(0, segment.find_first_of(" \t\r\n"));

    spdlog::error(catenate("Unknown transaction category: '", first_word, "' in: '", segment, "'."));
    return std::string{first_word};
}		/* -----  end of function FindCategory  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ExtractDescription
 *  Description:  removes by position. every monetary value goes, not just the
 *                amount and balance.
 * =====================================================================================
 */
std::string ExtractDescription (SX::sv segment, SX::sv category, const MoneyMatchList& amounts_to_remove)
{
    std::string description;
    description.reserve(segment.size());

    std::size_t start = boost::algorithm::starts_with(segment, category) ? category.size() : 0;

    for (std::size_t i = start; i < segment.size(); ++i)
    {
        bool remove_it = ranges::any_of(amounts_to_remove, [i](const MoneyMatch& amount)
            { return i >= amount.position && i < amount.position + amount.length; });
        if (! remove_it)
        {
            description += segment[i];
        }
    }

    description = boost::regex_replace(description, regex_multiple_spaces, one_space);
    boost::algorithm::trim(description);
    return description;
}		/* -----  end of function ExtractDescription  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ParseAmount
 *  Description:
 * =====================================================================================
 */
std::optional<double> ParseAmount (SX::sv amount_text, char thousands_separator, char decimal_separator)
{
    auto is_number_part = [decimal_separator](char c)
        { return std::isdigit(static_cast<unsigned char>(c)) != 0 || c == '-' || c == decimal_separator; };

    // the currency mark may come before or after the number.

    auto trimmed = boost::algorithm::trim_copy_if(std::string{amount_text},
            [&is_number_part](char c) { return ! is_number_part(c); });

    std::string digits;
    digits.reserve(trimmed.size());

    for (char c : trimmed)
    {
        if (IsSpace(c) || c == '+' || c == thousands_separator)
        {
            continue;
        }
        digits += c == decimal_separator ? '.' : c;
    }

    if (digits.empty())
    {
        return std::nullopt;
    }

    double result{0.0};
    if (auto [p, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), result);
            ec != std::errc() || p != digits.data() + digits.size())
    {
        return std::nullopt;
    }
    return result;
}		/* -----  end of function ParseAmount  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ParseTransactionSegment
 *  Description:
 * =====================================================================================
 */
SX::TransactionRecord ParseTransactionSegment (SX::sv segment, date::year_month_day booking_date,
        std::optional<double> previous_balance, const StatementDialect& dialect)
{
    const std::string text = boost::algorithm::trim_copy(std::string{segment});

    SX::TransactionRecord record;
    record.booking_date = booking_date;
    record.category = FindCategory(text, dialect);

    auto amounts = FindMonetaryValues(text, dialect);
    if (amounts.size() < 2)
    {
        spdlog::warn(catenate("Incomplete transaction. Found: ", amounts.size(),
                    " amount(s) but need 2 on: ", booking_date, " in: '", text, "'."));
        record.description = ExtractDescription(text, record.category, amounts);
        return record;
    }

    const auto& vocabulary = dialect.Vocabulary();
    const auto& amount_match = amounts[amounts.size() - 2];
    const auto& balance_match = amounts.back();

    record.balance = ParseAmount(balance_match.text, vocabulary.thousands_separator, vocabulary.decimal_separator);
    if (! record.balance)
    {
        spdlog::warn(catenate("Can't convert balance: '", balance_match.text, "' on: ", booking_date, '.'));
    }

    auto amount = ParseAmount(amount_match.text, vocabulary.thousands_separator, vocabulary.decimal_separator);
    if (! amount)
    {
        spdlog::warn(catenate("Can't convert amount: '", amount_match.text, "' on: ", booking_date, '.'));
    }
    else if (DetermineFlowDirection(previous_balance, record.balance, record.category, dialect)
            == SX::FlowDirection::e_Inflow)
    {
        record.received = amount;
    }
    else
    {
        record.spent = amount;
    }

    record.description = ExtractDescription(text, record.category, amounts);

    spdlog::debug(catenate("Found transaction: ", record));
    return record;
}		/* -----  end of function ParseTransactionSegment  ----- */
