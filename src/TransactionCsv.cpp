// =====================================================================================
//
//       Filename:  TransactionCsv.cpp
//
//    Description:  Write transactions as CSV.
//
//        Version:  1.0
//        Created:  11/11/2025 01:52:33 PM
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

#include "TransactionCsv.h"

#include <boost/algorithm/string/replace.hpp>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include "StatementDialect.h"
#include "Statement_Utils.h"

namespace
{
    std::string CsvAmount (std::optional<double> amount)
    {
        return amount ? fmt::format("{:.2f}", *amount) : std::string{};
    }

}   // namespace

std::string CsvField (SX::sv field)
{
    if (field.find_first_of(",\"\n") == SX::sv::npos)
    {
        return std::string{field};
    }
    std::string escaped{field};
    boost::algorithm::replace_all(escaped, "\"", "\"\"");
    return catenate('"', escaped, '"');
}		/* -----  end of function CsvField  ----- */

void WriteRecordsAsCsv (const SX::TransactionList& records, std::ostream& output)
{
    fmt::print(output, "date,category,description,received,spent,balance\n");
    for (const auto& record : records)
    {
        fmt::print(output, "{},{},{},{},{},{}\n", record.booking_date, CsvField(record.category),
                CsvField(record.description), CsvAmount(record.received), CsvAmount(record.spent),
                CsvAmount(record.balance));
    }
}		/* -----  end of function WriteRecordsAsCsv  ----- */

void WriteTransactionsAsCsv (const SX::NormalizedTransactionList& transactions, std::ostream& output)
{
    fmt::print(output, "date,type,isin,name,amount,currency,source\n");
    for (const auto& transaction : transactions)
    {
        fmt::print(output, "{},{},{},{},{:.2f},{},{}\n", transaction.booking_date, TransactionTypeName(transaction.type),
                transaction.isin, CsvField(transaction.name), transaction.amount, transaction.currency,
                CsvField(transaction.source));
    }
}		/* -----  end of function WriteTransactionsAsCsv  ----- */
