// =====================================================================================
//
//       Filename:  TransactionSegment.h
//
//    Description:  Turn the text between two date anchors into a transaction record.
//
//        Version:  1.0
//        Created:  11/10/2025 10:14:26 AM
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

#ifndef _TRANSACTIONSEGMENT_INC_
#define _TRANSACTIONSEGMENT_INC_

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "Statement.h"

class StatementDialect;

// where an amount with its currency mark was found in a segment.

struct MoneyMatch
{
    std::size_t position = 0;
    std::size_t length = 0;
    std::string text;
};

using MoneyMatchList = std::vector<MoneyMatch>;

// the segment is one table row with its lines joined by single spaces, e.g.
//
//  'Handel Ausführung Handel Direktkauf Kauf DE0007664039 VOLKSWAGEN AG VZO O.N.
//      4788270820210421 236,00 € 264,00 €'
//
// the last 2 amounts are the booking amount and the new balance. Never throws
// for content it doesn't understand. Problems are logged and show up as
// missing values.

[[nodiscard]] SX::TransactionRecord ParseTransactionSegment(SX::sv segment, date::year_month_day booking_date,
        std::optional<double> previous_balance, const StatementDialect& dialect);

[[nodiscard]] MoneyMatchList FindMonetaryValues(SX::sv segment, const StatementDialect& dialect);

[[nodiscard]] std::string FindCategory(SX::sv segment, const StatementDialect& dialect);

[[nodiscard]] std::string ExtractDescription(SX::sv segment, SX::sv category, const MoneyMatchList& amounts_to_remove);

// '1.234,56 €' -> 1234.56 with the default separators.
// empty for anything which is not a number once the currency mark, any '+'
// and whitespace are gone.

[[nodiscard]] std::optional<double> ParseAmount(SX::sv amount_text, char thousands_separator = '.',
        char decimal_separator = ',');

#endif   // ----- #ifndef _TRANSACTIONSEGMENT_INC_  -----
