// =====================================================================================
//
//       Filename:  StatementParser.h
//
//    Description:  Run all the steps needed to get the transactions out of the
//                  text of one statement.
//
//        Version:  1.0
//        Created:  11/11/2025 09:05:37 AM
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

#ifndef _STATEMENTPARSER_INC_
#define _STATEMENTPARSER_INC_

#include <string>
#include <utility>
#include <vector>

#include "Statement.h"
#include "StatementDialect.h"

struct ParsedStatement
{
    SX::TransactionList transactions;
    std::vector<std::string> chapters_found;
};

// =====================================================================================
//        Class:  StatementParser
//  Description:  Keeps nothing between calls so one parser can be used for any
//                number of statements.
// =====================================================================================

class StatementParser
{
public:
    // ====================  LIFECYCLE     =======================================

    StatementParser() : dialect_{DefaultStatementDialect()} { }
    explicit StatementParser(StatementDialect dialect) : dialect_{std::move(dialect)} { }

    // ====================  ACCESSORS     =======================================

    [[nodiscard]] const StatementDialect& Dialect() const { return dialect_; }

    [[nodiscard]] ParsedStatement Parse(const SX::PageList& pages) const;
    [[nodiscard]] ParsedStatement Parse(const std::string& single_page) const;

private:
    // ====================  DATA MEMBERS  =======================================

    StatementDialect dialect_;

}; // -----  end of class StatementParser  -----

#endif   // ----- #ifndef _STATEMENTPARSER_INC_  -----
