// =====================================================================================
//
//       Filename:  StatementDialect.h
//
//    Description:  The closed vocabularies and patterns which describe one family of
//                  statement layouts.
//
//        Version:  1.0
//        Created:  11/08/2025 01:05:44 PM
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

#ifndef _STATEMENTDIALECT_INC_
#define _STATEMENTDIALECT_INC_

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <boost/regex.hpp>

#include "Statement.h"

// everything here is data. a new statement layout should only need a new
// dialect file, not new code.

struct DialectVocabulary
{
    std::string name;
    std::string currency;

    // chapters

    std::string holder_chapter;
    std::string ledger_chapter;
    std::string ledger_header;
    std::vector<std::string> chapters;
    std::vector<std::string> table_headers;

    // boilerplate

    std::vector<std::string> boilerplate_lines;
    std::vector<std::string> footer_patterns;

    // dates. month ordinals are 0 - 11.

    std::map<std::string, int, std::less<>> months;
    std::string month_shape_pattern;

    // transactions

    std::map<std::string, SX::FlowDirection, std::less<>> category_directions;
    std::map<std::string, SX::TransactionType, std::less<>> category_types;
    std::string trade_category;

    std::string money_pattern;
    char thousands_separator = '.';
    char decimal_separator = ',';
    double balance_epsilon = 0.01;
};

// =====================================================================================
//        Class:  StatementDialect
//  Description:  A validated vocabulary plus its compiled patterns.
//                Immutable once built so it can be shared by concurrent parses.
// =====================================================================================

class StatementDialect
{
public:
    // ====================  LIFECYCLE     =======================================

    explicit StatementDialect(DialectVocabulary vocabulary);

    // ====================  ACCESSORS     =======================================

    [[nodiscard]] const DialectVocabulary& Vocabulary() const { return vocabulary_; }

    [[nodiscard]] bool IsChapterHeading(SX::sv line) const;
    [[nodiscard]] bool IsTableHeader(SX::sv line) const;
    [[nodiscard]] bool IsBoilerplate(SX::sv line) const;

    [[nodiscard]] bool LooksLikeMonth(SX::sv token) const;
    [[nodiscard]] std::optional<int> MonthOrdinal(SX::sv token) const;

    // longest first so that a category which prefixes another can't win.

    [[nodiscard]] const std::vector<std::string>& Categories() const { return categories_by_length_; }
    [[nodiscard]] std::optional<SX::FlowDirection> CategoryDirection(SX::sv category) const;
    [[nodiscard]] std::optional<SX::TransactionType> CategoryType(SX::sv category) const;

    [[nodiscard]] const boost::regex& MoneyPattern() const { return regex_money_; }
    [[nodiscard]] double BalanceEpsilon() const { return vocabulary_.balance_epsilon; }

private:
    // ====================  METHODS       =======================================

    void CheckVocabulary() const;

    // ====================  DATA MEMBERS  =======================================

    DialectVocabulary vocabulary_;

    std::vector<std::string> categories_by_length_;
    std::vector<boost::regex> regex_footers_;
    boost::regex regex_month_shape_;
    boost::regex regex_money_;

}; // -----  end of class StatementDialect  -----

[[nodiscard]] DialectVocabulary DefaultDialectVocabulary();

[[nodiscard]] StatementDialect DefaultStatementDialect();

// reads an ini style file. keys not in the file keep their default values.
// throws DialectException for unusable content.

[[nodiscard]] StatementDialect LoadStatementDialect(const SX::FileName& dialect_file_name);

[[nodiscard]] SX::sv TransactionTypeName(SX::TransactionType type);
[[nodiscard]] std::optional<SX::TransactionType> TransactionTypeFromName(SX::sv name);

#endif   // ----- #ifndef _STATEMENTDIALECT_INC_  -----
