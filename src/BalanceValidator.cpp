// =====================================================================================
//
//       Filename:  BalanceValidator.cpp
//
//    Description:  Check that each running balance follows from the one before it.
//
//        Version:  1.0
//        Created:  11/10/2025 09:33:07 AM
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

#include "BalanceValidator.h"

#include <cmath>

#include <spdlog/spdlog.h>

#include "Statement_Utils.h"

std::optional<BalanceMismatch> ValidateBalance (const SX::TransactionRecord& record,
        std::optional<double> previous_balance, double epsilon)
{
    if (! previous_balance || ! record.balance)
    {
        return std::nullopt;
    }

    const double received = record.received.value_or(0.0);
    const double spent = record.spent.value_or(0.0);
    const double expected = *previous_balance + received - spent;

    if (std::abs(expected - *record.balance) <= epsilon)
    {
        return std::nullopt;
    }

    // the amount booked but the balance did not move.

    const bool balance_unchanged = std::abs(*record.balance - *previous_balance) <= epsilon
        && std::abs(received - spent) > epsilon;

    spdlog::warn(catenate("Balance calculation error: ", FormatAmount(previous_balance),
                record.received ? catenate(" + ", FormatAmount(record.received)) : catenate(" - ", FormatAmount(record.spent)),
                " = ", FormatAmount(expected), " but balance is: ", FormatAmount(record.balance),
                balance_unchanged ? " (balance unchanged)" : "", " for: ", record));

    return BalanceMismatch{record, expected, *record.balance};
}		/* -----  end of function ValidateBalance  ----- */
