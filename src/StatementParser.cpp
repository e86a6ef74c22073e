// =====================================================================================
//
//       Filename:  StatementParser.cpp
//
//    Description:  Run all the steps needed to get the transactions out of the
//                  text of one statement.
//
//        Version:  1.0
//        Created:  11/11/2025 09:18:22 AM
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

#include "StatementParser.h"

#include <iterator>

#include <spdlog/spdlog.h>

#include "ChaptersFromLines.h"
#include "LineSanitizer.h"
#include "Statement_Utils.h"
#include "TransactionTable.h"

/*
 *--------------------------------------------------------------------------------------
 *       Class:  StatementParser
 *      Method:  StatementParser :: Parse
 * Description:  only the ledger chapter is turned into transactions. The other
 *               chapters are summaries of it.
 *--------------------------------------------------------------------------------------
 */
ParsedStatement StatementParser::Parse (const SX::PageList& pages) const
{
    ParsedStatement result;

    auto lines = FlattenPages(SanitizePages(pages, dialect_));
    ChaptersFromLines chapters{lines, dialect_};

    for (const auto& chapter : chapters)
    {
        spdlog::debug(catenate("Chapter: ", chapter.name, " has: ", chapter.lines.size(), " line(s)."));
        result.chapters_found.push_back(chapter.name);

        if (chapter.name == dialect_.Vocabulary().ledger_chapter)
        {
            auto transactions = ProcessTransactionTable(chapter.lines, dialect_);
            result.transactions.insert(result.transactions.end(), std::make_move_iterator(transactions.begin()),
                    std::make_move_iterator(transactions.end()));
        }
    }

    if (result.chapters_found.empty() || result.transactions.empty())
    {
        spdlog::warn(catenate("No transactions found in: ", pages.size(), " page(s) using dialect: ",
                    dialect_.Vocabulary().name, '.'));
    }
    return result;
}		/* -----  end of method StatementParser::Parse  ----- */

ParsedStatement StatementParser::Parse (const std::string& single_page) const
{
    return Parse(SX::PageList{single_page});
}		/* -----  end of method StatementParser::Parse  ----- */
