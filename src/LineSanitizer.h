// =====================================================================================
//
//       Filename:  LineSanitizer.h
//
//    Description:  Remove page boilerplate from extracted statement text.
//
//        Version:  1.0
//        Created:  11/09/2025 09:14:27 AM
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

#ifndef _LINESANITIZER_INC_
#define _LINESANITIZER_INC_

#include "Statement.h"

class StatementDialect;

// each page comes back with its lines trimmed, empty lines dropped and
// the dialect's boilerplate removed. sanitizing twice changes nothing.

[[nodiscard]] SX::PageList SanitizePages(const SX::PageList& pages, const StatementDialect& dialect);

[[nodiscard]] SX::LineList SanitizeLines(SX::sv page, const StatementDialect& dialect);

#endif   // ----- #ifndef _LINESANITIZER_INC_  -----
