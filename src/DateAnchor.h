// =====================================================================================
//
//       Filename:  DateAnchor.h
//
//    Description:  Find the dates which start each row of a flattened transaction table.
//
//        Version:  1.0
//        Created:  11/09/2025 01:47:30 PM
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

#ifndef _DATEANCHOR_INC_
#define _DATEANCHOR_INC_

#include <cstddef>
#include <optional>

#include "Statement.h"

class StatementDialect;

// recognizes either of
//
//      '21 Apr.'                     '21'
//      '2021 Handel Ausführung...'   'Apr.'
//                                    '2021'
//
// starting at lines[index].
// returns nothing when there is no date at index.
// throws DateException when the pieces are there but don't make a date
// (a month shaped token which is not a month or something like 31 Feb.)

[[nodiscard]] std::optional<SX::DateAnchor> TryParseDateAnchor(const SX::LineList& lines, std::size_t index,
        const StatementDialect& dialect);

[[nodiscard]] date::year_month_day MakeStatementDate(SX::sv day, SX::sv month, SX::sv year,
        const StatementDialect& dialect);

#endif   // ----- #ifndef _DATEANCHOR_INC_  -----
