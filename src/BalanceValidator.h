// =====================================================================================
//
//       Filename:  BalanceValidator.h
//
//    Description:  Check that each running balance follows from the one before it.
//
//        Version:  1.0
//        Created:  11/10/2025 09:20:51 AM
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

#ifndef _BALANCEVALIDATOR_INC_
#define _BALANCEVALIDATOR_INC_

#include <optional>

#include "Statement.h"

struct BalanceMismatch
{
    SX::TransactionRecord record;
    double expected = 0.0;
    double actual = 0.0;
};

// a mismatch is logged as a warning and returned. it is never fatal.
// nothing to check without a previous balance or without a balance on
// the record.

std::optional<BalanceMismatch> ValidateBalance(const SX::TransactionRecord& record,
        std::optional<double> previous_balance, double epsilon);

#endif   // ----- #ifndef _BALANCEVALIDATOR_INC_  -----
