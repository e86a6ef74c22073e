// =====================================================================================
//
//       Filename:  TransactionClassifier.cpp
//
//    Description:  Turn statement transaction records into normalized transactions.
//
//        Version:  1.0
//        Created:  11/11/2025 11:15:40 AM
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

#include "TransactionClassifier.h"

#include <boost/regex.hpp>

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <spdlog/spdlog.h>

#include "StatementDialect.h"
#include "Statement_Utils.h"

namespace
{
    const boost::regex regex_isin{R"***(\b[A-Z]{2}[A-Z0-9]{10}\b)***"};

}   // namespace

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ClassifyTransaction
 *  Description:  the trade category can go either way.
 * =====================================================================================
 */
SX::TransactionType ClassifyTransaction (const SX::TransactionRecord& record, const StatementDialect& dialect)
{
    if (record.category.empty())
    {
        return SX::TransactionType::e_Fee;
    }
    if (auto type = dialect.CategoryType(record.category); type)
    {
        return *type;
    }
    if (record.category == dialect.Vocabulary().trade_category)
    {
        return record.received ? SX::TransactionType::e_Sell : SX::TransactionType::e_Buy;
    }

    spdlog::warn(catenate("Unmapped transaction category: '", record.category, "'. Using: fee."));
    return SX::TransactionType::e_Fee;
}		/* -----  end of function ClassifyTransaction  ----- */

SX::Transaction NormalizeTransaction (const SX::TransactionRecord& record, const StatementDialect& dialect)
{
    SX::Transaction result;
    result.type = ClassifyTransaction(record, dialect);
    result.booking_date = record.booking_date;
    result.name = record.description;
    result.isin = FindISIN(record.description);
    result.amount = record.received ? *record.received : record.spent ? - *record.spent : 0.0;
    result.currency = dialect.Vocabulary().currency;
    result.source = dialect.Vocabulary().name;
    return result;
}		/* -----  end of function NormalizeTransaction  ----- */

SX::NormalizedTransactionList NormalizeTransactions (const SX::TransactionList& records, const StatementDialect& dialect)
{
    return records
        | ranges::views::transform([&dialect](const SX::TransactionRecord& record) { return NormalizeTransaction(record, dialect); })
        | ranges::to<SX::NormalizedTransactionList>();
}		/* -----  end of function NormalizeTransactions  ----- */

std::string FindISIN (SX::sv text)
{
    boost::match_results<SX::sv::const_iterator> found;
    if (boost::regex_search(text.cbegin(), text.cend(), found, regex_isin))
    {
        return found.str(0);
    }
    return {};
}		/* -----  end of function FindISIN  ----- */
