/*
 * =====================================================================================
 *
 *       Filename:  Statement_Utils.h
 *
 *    Description:  Routines shared by the statement parsing modules.
 *
 *        Version:  1.0
 *        Created:  11/08/2025 10:31:07 AM
 *       Revision:  none
 *       Compiler:  gcc
 *
 *         Author:  David P. Riedel (), driedel@cox.net
 *   Organization:
 *
 * =====================================================================================
 */

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

#ifndef _STATEMENT_UTILS_INC_
#define _STATEMENT_UTILS_INC_

#include <chrono>
#include <exception>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <vector>

#include <boost/assert.hpp>

#include <date/tz.h>

#include <fmt/format.h>

#include "Statement.h"

namespace fs = std::filesystem;

using namespace std::string_literals;

// custom fmtlib formatter for filesytem paths

template <>
struct fmt::formatter<std::filesystem::path> : formatter<std::string> {
  // parse is inherited from formatter<string_view>.
  template <typename FormatContext>
  auto format(const std::filesystem::path &p, FormatContext &ctx) const {
    std::string f_name = p.string();
    return formatter<std::string>::format(f_name, ctx);
  }
};

// custom fmtlib formatter for date year_month_day

template <>
struct fmt::formatter<date::year_month_day> : formatter<std::string> {
  // parse is inherited from formatter<string_view>.
  template <typename FormatContext>
  auto format(date::year_month_day d, FormatContext &ctx) const {
    std::string s_date = date::format("%Y-%m-%d", d);
    return formatter<std::string>::format(s_date, ctx);
  }
};

// amounts print with 2 decimals. an absent amount prints as '-'.

inline std::string FormatAmount(std::optional<double> amount) {
  return amount ? fmt::format("{:.2f}", *amount) : "-"s;
}

// a compact, single line view of a transaction for our log messages.

template <>
struct fmt::formatter<SX::TransactionRecord> : formatter<std::string> {
  template <typename FormatContext>
  auto format(const SX::TransactionRecord &r, FormatContext &ctx) const {
    std::string s_record = fmt::format(
        "{{date: {}, category: '{}', description: '{}', received: {}, spent: {}, balance: {}}}",
        date::format("%Y-%m-%d", r.booking_date), r.category, r.description,
        FormatAmount(r.received), FormatAmount(r.spent), FormatAmount(r.balance));
    return formatter<std::string>::format(s_record, ctx);
  }
};

template <typename... Ts> inline std::string catenate(Ts &&...ts) {

  constexpr auto N = sizeof...(Ts);

  // first, construct our format string

  std::string f_string;
  for (std::size_t i = 0; i < N; ++i) {
    f_string.append("{}");
  }

  return fmt::vformat(f_string, fmt::make_format_args(ts...));
}

// let's add tuples...
// based on code techniques from C++17 STL Cookbook zipping tuples.
// (works for any class which supports the '+' operator)

template <typename... Ts>
std::tuple<Ts...> AddTs(std::tuple<Ts...> const &t1,
                        std::tuple<Ts...> const &t2) {
  auto z_([](auto... xs) {
    return [xs...](auto... ys) { return std::make_tuple((xs + ys)...); };
  });

  return std::apply(std::apply(z_, t1), t2);
}

// let's sum the contents of a single tuple
// (from C++ Templates...second edition p.58
// and C++17 STL Cookbook.

template <typename... Ts> auto SumT(const std::tuple<Ts...> &t) {
  auto z_([](auto... ys) { return (... + ys); });
  return std::apply(z_, t);
}

// using Howard Hinnant's date library

inline std::string
LocalDateTimeAsString(std::chrono::system_clock::time_point a_date_time) {
  auto t = date::make_zoned(date::current_zone(), a_date_time);
  std::string ts = date::format("%a, %b %d, %Y at %I:%M:%S %p %Z", t);
  return ts;
}

std::string LoadDataFileForUse(const SX::FileName &file_name);

// pdftotext separates pages with a form feed.

SX::PageList SplitIntoPages(SX::sv file_content, char page_separator = '\f');

// so we can recognize our errors if we want to do something special

class StatementException : public std::runtime_error {
public:
  explicit StatementException(const char *what);

  explicit StatementException(const std::string &what);
};

class AssertionException : public std::invalid_argument {
public:
  explicit AssertionException(const char *what);

  explicit AssertionException(const std::string &what);
};

// a date whose parts we found but can't turn into a calendar date.

class DateException : public StatementException {
public:
  explicit DateException(const char *what);

  explicit DateException(const std::string &what);
};

class DialectException : public StatementException {
public:
  explicit DialectException(const char *what);

  explicit DialectException(const std::string &what);
};

//  let's do a little 'template normal' programming again

// function to split a string on a delimiter and return a vector of items.
// use concepts to restrict to strings and string_views.

template <typename T>
inline std::vector<T> split_string(SX::sv string_data, char delim)
  requires std::is_same_v<T, std::string> || std::is_same_v<T, SX::sv>
{
  std::vector<T> results;
  for (std::size_t it = 0; it != SX::sv::npos; ++it) {
    auto pos = string_data.find(delim, it);
    if (pos != SX::sv::npos) {
      results.emplace_back(string_data.substr(it, pos - it));
    } else {
      results.emplace_back(string_data.substr(it));
      break;
    }
    it = pos;
  }
  return results;
}

#endif /* ----- #ifndef _STATEMENT_UTILS_INC_  ----- */
