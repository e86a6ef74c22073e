// =====================================================================================
//
//       Filename:  Statement.h
//
//    Description:  holds some common type defs shared by several classes.
//
//        Version:  1.0
//        Created:  11/08/2025 10:12:31 AM
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

#ifndef STATEMENT_H_
#define STATEMENT_H_


#include <cstddef>
#include <filesystem>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <date/date.h>

namespace Statement
{
    // thanks to Jonathan Boccara of fluentcpp.com for his articles on
    // Strong Types and the NamedType library.
    //
    // this code is a simplified and somewhat stripped down version of his.

    // =====================================================================================
    //        Class:  UniqType
    //  Description: Provides a wrapper which makes embedded common data types distinguisable
    // =====================================================================================

    template <typename T, typename Uniqueifier>
    class UniqType
    {
    public:
        // ====================  LIFECYCLE     =======================================

        UniqType() requires std::is_default_constructible_v<T>
            : value_{} {}

        UniqType(const UniqType<T, Uniqueifier>& rhs) requires std::is_copy_constructible_v<T>
            : value_{rhs.value_} {}

        explicit UniqType(T const& value) requires std::is_copy_constructible_v<T>
            : value_{value} {}

        UniqType(UniqType<T, Uniqueifier>&& rhs) requires std::is_move_constructible_v<T>
            : value_(std::move(rhs.value_)) {}

        explicit UniqType(T&& value) requires std::is_move_constructible_v<T>
            : value_(std::move(value)) {}

        // ====================  ACCESSORS     =======================================

        T& get() { return value_; }
        const T& get() const { return value_; }

        // ====================  OPERATORS     =======================================

        UniqType& operator=(const UniqType<T, Uniqueifier>& rhs) requires std::is_copy_assignable_v<T>
        {
            if (this != &rhs)
            {
                value_ = rhs.value_;
            }
            return *this;
        }
        UniqType& operator=(const T& rhs) requires std::is_copy_assignable_v<T>
        {
            if (&value_ != &rhs)
            {
                value_ = rhs;
            }
            return *this;
        }
        UniqType& operator=(UniqType<T, Uniqueifier>&& rhs) requires std::is_move_assignable_v<T>
        {
            if (this != &rhs)
            {
                value_ = std::move(rhs.value_);
            }
            return *this;
        }

    private:
        // ====================  DATA MEMBERS  =======================================

        T value_;

    }; // -----  end of class UniqType  -----

    // program options reads and writes these through lexical_cast so they
    // have to be found by ADL.

    template <typename T, typename Uniqueifier>
    std::ostream& operator<<(std::ostream& os, const UniqType<T, Uniqueifier>& a_type)
    {
        os << a_type.get();
        return os;
    }

    template <typename T, typename Uniqueifier>
    std::istream& operator>>(std::istream& is, UniqType<T, Uniqueifier>& a_type)
    {
        T temp = a_type.get();
        is >> temp;
        a_type = temp;
        return is;
    }

    using sv = std::string_view;
    using std::filesystem::path;

    using FileName = UniqType<path, struct FileNameTag>;

    // one string per physical page, lines separated by '\n'

    using PageList = std::vector<std::string>;
    using LineList = std::vector<std::string>;

    enum class FlowDirection
    {
        e_Inflow,
        e_Outflow
    };

    struct Chapter
    {
        std::string name;
        LineList lines;

        bool operator==(Chapter const& rhs) const = default;
    };

    // a date which may occupy 1, 2 or 3 physical lines.
    // resume_at is the first line following the date.

    struct DateAnchor
    {
        date::year_month_day anchor_date;
        std::size_t found_at = 0;
        std::size_t resume_at = 0;
        std::string residual_text;
    };

    // at most one of received and spent is ever set.

    struct TransactionRecord
    {
        date::year_month_day booking_date;
        std::string category;
        std::string description;
        std::optional<double> received;
        std::optional<double> spent;
        std::optional<double> balance;
    };

    using TransactionList = std::vector<TransactionRecord>;

    enum class TransactionType
    {
        e_Buy,
        e_Sell,
        e_Dividend,
        e_Interest,
        e_Fee,
        e_Tax,
        e_Liability,
        e_Canceled,
        e_Refund,
        e_Payment,
        e_Transfer,
        e_Deposit,
        e_Withdrawal,
        e_Verification,
        e_Gift
    };

    struct Transaction
    {
        TransactionType type = TransactionType::e_Fee;
        date::year_month_day booking_date;
        std::string name;
        std::string isin;
        double amount = 0.0;
        std::string currency;
        std::string source;
    };

    using NormalizedTransactionList = std::vector<Transaction>;

}		// namespace Statement

namespace SX = Statement;

#endif /* end of include guard: STATEMENT_H_ */
