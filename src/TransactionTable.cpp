// =====================================================================================
//
//       Filename:  TransactionTable.cpp
//
//    Description:  Extract the transaction records from the ledger chapter.
//
//        Version:  1.0
//        Created:  11/10/2025 02:29:05 PM
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

#include "TransactionTable.h"

#include <optional>
#include <string>
#include <vector>

#include <boost/algorithm/string/join.hpp>

#include <spdlog/spdlog.h>

#include "BalanceValidator.h"
#include "DateAnchor.h"
#include "StatementDialect.h"
#include "Statement_Utils.h"
#include "TransactionSegment.h"

SX::TransactionList ProcessTransactionTable (const SX::LineList& lines, const StatementDialect& dialect)
{
    SX::TransactionList records;
    std::optional<double> carried_balance;
    int balance_mismatches{0};
    bool stop_reading{false};

    // a bad date ends the table. rows already started are kept.

    auto find_anchor = [&](std::size_t at) -> std::optional<SX::DateAnchor>
    {
        try
        {
            return TryParseDateAnchor(lines, at, dialect);
        }
        catch (const DateException& e)
        {
            spdlog::error(catenate("Stopped reading transactions. ", e.what(),
                        ". Keeping the transactions found so far."));
            stop_reading = true;
        }
        return std::nullopt;
    };

    std::size_t index = ! lines.empty() && lines.front() == dialect.Vocabulary().ledger_header ? 1 : 0;

    while (index < lines.size() && ! stop_reading)
    {
        auto anchor = find_anchor(index);
        if (! anchor)
        {
            if (! stop_reading)
            {
                spdlog::debug(catenate("Skipping line not in a transaction: '", lines[index], "'."));
            }
            ++index;
            continue;
        }

        std::vector<std::string> segment_lines;
        if (! anchor->residual_text.empty())
        {
            segment_lines.push_back(anchor->residual_text);
        }

        // the row ends where the next one starts.

        index = anchor->resume_at;
        while (index < lines.size() && ! find_anchor(index) && ! stop_reading)
        {
            segment_lines.push_back(lines[index]);
            ++index;
        }

        auto record = ParseTransactionSegment(boost::algorithm::join(segment_lines, " "), anchor->anchor_date,
                carried_balance, dialect);

        if (ValidateBalance(record, carried_balance, dialect.BalanceEpsilon()))
        {
            ++balance_mismatches;
        }
        if (record.balance)
        {
            carried_balance = record.balance;
        }
        records.push_back(std::move(record));
    }

    spdlog::info(catenate("Found: ", records.size(), " transaction(s) with: ", balance_mismatches,
                " balance mismatch(es)."));
    return records;
}		/* -----  end of function ProcessTransactionTable  ----- */
