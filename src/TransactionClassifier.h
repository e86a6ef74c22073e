// =====================================================================================
//
//       Filename:  TransactionClassifier.h
//
//    Description:  Turn statement transaction records into normalized transactions.
//
//        Version:  1.0
//        Created:  11/11/2025 11:02:19 AM
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

#ifndef _TRANSACTIONCLASSIFIER_INC_
#define _TRANSACTIONCLASSIFIER_INC_

#include <string>

#include "Statement.h"

class StatementDialect;

[[nodiscard]] SX::TransactionType ClassifyTransaction(const SX::TransactionRecord& record, const StatementDialect& dialect);

[[nodiscard]] SX::Transaction NormalizeTransaction(const SX::TransactionRecord& record, const StatementDialect& dialect);

[[nodiscard]] SX::NormalizedTransactionList NormalizeTransactions(const SX::TransactionList& records,
        const StatementDialect& dialect);

// first ISIN shaped word in the text or empty.

[[nodiscard]] std::string FindISIN(SX::sv text);

#endif   // ----- #ifndef _TRANSACTIONCLASSIFIER_INC_  -----
