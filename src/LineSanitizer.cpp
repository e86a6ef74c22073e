// =====================================================================================
//
//       Filename:  LineSanitizer.cpp
//
//    Description:  Remove page boilerplate from extracted statement text.
//
//        Version:  1.0
//        Created:  11/09/2025 09:21:03 AM
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

#include "LineSanitizer.h"

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/transform.hpp>

#include <spdlog/spdlog.h>

#include "StatementDialect.h"
#include "Statement_Utils.h"

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  SanitizeLines
 *  Description:
 * =====================================================================================
 */
SX::LineList SanitizeLines (SX::sv page, const StatementDialect& dialect)
{
    auto lines = split_string<SX::sv>(page, '\n');

    // pdftotext can leave DOS line endings behind. trim handles the '\r'.

    auto kept = lines
        | ranges::views::transform([](SX::sv line) { return boost::algorithm::trim_copy(std::string{line}); })
        | ranges::views::filter([&dialect](const std::string& line) { return ! line.empty() && ! dialect.IsBoilerplate(line); })
        | ranges::to<SX::LineList>();

    return kept;
}		/* -----  end of function SanitizeLines  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  SanitizePages
 *  Description:
 * =====================================================================================
 */
SX::PageList SanitizePages (const SX::PageList& pages, const StatementDialect& dialect)
{
    SX::PageList results;
    results.reserve(pages.size());

    for (const auto& page : pages)
    {
        auto lines = SanitizeLines(page, dialect);
        results.push_back(boost::algorithm::join(lines, "\n"));
    }

    spdlog::debug(catenate("Sanitized: ", pages.size(), " page(s)."));
    return results;
}		/* -----  end of function SanitizePages  ----- */
