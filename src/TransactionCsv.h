// =====================================================================================
//
//       Filename:  TransactionCsv.h
//
//    Description:  Write transactions as CSV.
//
//        Version:  1.0
//        Created:  11/11/2025 01:40:08 PM
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

#ifndef _TRANSACTIONCSV_INC_
#define _TRANSACTIONCSV_INC_

#include <ostream>
#include <string>

#include "Statement.h"

// fields with a comma, a quote or a newline are quoted. embedded quotes
// are doubled.

[[nodiscard]] std::string CsvField(SX::sv field);

// date,category,description,received,spent,balance
// a missing amount is an empty field.

void WriteRecordsAsCsv(const SX::TransactionList& records, std::ostream& output);

// date,type,isin,name,amount,currency,source

void WriteTransactionsAsCsv(const SX::NormalizedTransactionList& transactions, std::ostream& output);

#endif   // ----- #ifndef _TRANSACTIONCSV_INC_  -----
