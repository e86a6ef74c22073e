// =====================================================================================
//
//       Filename:  TransactionTable.h
//
//    Description:  Extract the transaction records from the ledger chapter.
//
//        Version:  1.0
//        Created:  11/10/2025 02:16:44 PM
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

#ifndef _TRANSACTIONTABLE_INC_
#define _TRANSACTIONTABLE_INC_

#include "Statement.h"

class StatementDialect;

// each row starts with a date. everything up to the next date belongs to
// that row. lines in front of the first date are skipped.
// a date we can't make sense of ends the table. what we have so far is
// returned and the problem is logged.

[[nodiscard]] SX::TransactionList ProcessTransactionTable(const SX::LineList& lines, const StatementDialect& dialect);

#endif   // ----- #ifndef _TRANSACTIONTABLE_INC_  -----
