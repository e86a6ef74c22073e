// =====================================================================================
//
//       Filename:  DateAnchor.cpp
//
//    Description:  Find the dates which start each row of a flattened transaction table.
//
//        Version:  1.0
//        Created:  11/09/2025 02:05:12 PM
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

#include "DateAnchor.h"

#include <charconv>
#include <string>
#include <vector>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/regex.hpp>

#include "StatementDialect.h"
#include "Statement_Utils.h"

namespace
{
    const boost::regex regex_day{R"***(^\d{1,2}$)***"};
    const boost::regex regex_year{R"***(^\d{4}$)***"};

    std::vector<std::string> Tokenize (const std::string& line)
    {
        std::vector<std::string> tokens;
        auto trimmed = boost::algorithm::trim_copy(line);
        if (trimmed.empty())
        {
            return tokens;
        }
        boost::algorithm::split(tokens, trimmed, boost::algorithm::is_space(), boost::algorithm::token_compress_on);
        return tokens;
    }

    bool IsDay (SX::sv token) { return boost::regex_match(token.begin(), token.end(), regex_day); }
    bool IsYear (SX::sv token) { return boost::regex_match(token.begin(), token.end(), regex_year); }

    int ToInt (SX::sv digits)
    {
        int result{0};
        if (auto [p, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), result);
                ec != std::errc() || p != digits.data() + digits.size())
        {
            throw DateException(catenate("Can't convert: '", digits, "' to a number."));
        }
        return result;
    }

}   // namespace

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  MakeStatementDate
 *  Description:
 * =====================================================================================
 */
date::year_month_day MakeStatementDate (SX::sv day, SX::sv month, SX::sv year, const StatementDialect& dialect)
{
    auto month_ordinal = dialect.MonthOrdinal(month);
    if (! month_ordinal)
    {
        throw DateException(catenate("Unknown month: '", month, "' in date: ", day, ' ', month, ' ', year));
    }

    date::year_month_day result{date::year{ToInt(year)}, date::month{static_cast<unsigned>(*month_ordinal + 1)},
        date::day{static_cast<unsigned>(ToInt(day))}};
    if (! result.ok())
    {
        throw DateException(catenate("Not a calendar date: ", day, ' ', month, ' ', year));
    }
    return result;
}		/* -----  end of function MakeStatementDate  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  TryParseDateAnchor
 *  Description:
 * =====================================================================================
 */
std::optional<SX::DateAnchor> TryParseDateAnchor (const SX::LineList& lines, std::size_t index,
        const StatementDialect& dialect)
{
    if (index >= lines.size())
    {
        return std::nullopt;
    }

    auto current_tokens = Tokenize(lines[index]);
    if (current_tokens.empty() || ! IsDay(current_tokens[0]))
    {
        return std::nullopt;
    }

    // 'day month' with the year leading the next line

    if (current_tokens.size() == 2 && dialect.LooksLikeMonth(current_tokens[1]) && index + 1 < lines.size())
    {
        auto next_tokens = Tokenize(lines[index + 1]);
        if (! next_tokens.empty() && IsYear(next_tokens[0]))
        {
            SX::DateAnchor anchor;
            anchor.anchor_date = MakeStatementDate(current_tokens[0], current_tokens[1], next_tokens[0], dialect);
            anchor.found_at = index;
            anchor.resume_at = index + 2;
            next_tokens.erase(next_tokens.begin());
            anchor.residual_text = boost::algorithm::join(next_tokens, " ");
            return anchor;
        }
    }

    // one line each

    if (current_tokens.size() == 1 && index + 2 < lines.size())
    {
        auto month = boost::algorithm::trim_copy(lines[index + 1]);
        auto year = boost::algorithm::trim_copy(lines[index + 2]);

        if (dialect.LooksLikeMonth(month) && IsYear(year))
        {
            SX::DateAnchor anchor;
            anchor.anchor_date = MakeStatementDate(current_tokens[0], month, year, dialect);
            anchor.found_at = index;
            anchor.resume_at = index + 3;
            return anchor;
        }
    }

    return std::nullopt;
}		/* -----  end of function TryParseDateAnchor  ----- */
