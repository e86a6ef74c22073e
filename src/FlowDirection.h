// =====================================================================================
//
//       Filename:  FlowDirection.h
//
//    Description:  Decide whether a transaction's amount was received or spent.
//
//        Version:  1.0
//        Created:  11/10/2025 08:52:39 AM
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

#ifndef _FLOWDIRECTION_INC_
#define _FLOWDIRECTION_INC_

#include <optional>

#include "Statement.h"

class StatementDialect;

// the balance tells the truth when we have 2 of them. otherwise we go by
// what the category usually does. anything we don't know is treated as
// money going out.

[[nodiscard]] SX::FlowDirection DetermineFlowDirection(std::optional<double> previous_balance,
        std::optional<double> current_balance, SX::sv category, const StatementDialect& dialect);

#endif   // ----- #ifndef _FLOWDIRECTION_INC_  -----
