/*
 * =====================================================================================
 *
 *       Filename:  Statement_Utils.cpp
 *
 *    Description:  Routines shared by the statement parsing modules.
 *
 *        Version:  1.0
 *        Created:  11/08/2025 10:44:52 AM
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

#include "Statement_Utils.h"

#include <filesystem>
#include <fstream>

#include <boost/algorithm/string/trim.hpp>

#include <range/v3/action/remove_if.hpp>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

using namespace std::string_literals;

/*
 *--------------------------------------------------------------------------------------
 *       Class:  StatementException
 *      Method:  StatementException
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
StatementException::StatementException(const char *text)
    : std::runtime_error(text) {
} /* -----  end of method StatementException::StatementException  (constructor)
     ----- */

StatementException::StatementException(const std::string &text)
    : std::runtime_error(text) {
} /* -----  end of method StatementException::StatementException  (constructor)
     ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  AssertionException
 *      Method:  AssertionException
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
AssertionException::AssertionException(const char *text)
    : std::invalid_argument(text) {
} /* -----  end of method AssertionException::AssertionException  (constructor)
     ----- */

AssertionException::AssertionException(const std::string &text)
    : std::invalid_argument(text) {
} /* -----  end of method AssertionException::AssertionException  (constructor)
     ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  DateException
 *      Method:  DateException
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
DateException::DateException(const char *text)
    : StatementException(text) {
} /* -----  end of method DateException::DateException  (constructor)  ----- */

DateException::DateException(const std::string &text)
    : StatementException(text) {
} /* -----  end of method DateException::DateException  (constructor)  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  DialectException
 *      Method:  DialectException
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
DialectException::DialectException(const char *text)
    : StatementException(text) {
} /* -----  end of method DialectException::DialectException  (constructor)  ----- */

DialectException::DialectException(const std::string &text)
    : StatementException(text) {
} /* -----  end of method DialectException::DialectException  (constructor)  ----- */

/*
 * ===  FUNCTION
 * ====================================================================== Name:
 * LoadDataFileForUse Description:
 * =====================================================================================
 */
std::string LoadDataFileForUse(const SX::FileName &file_name) {
  std::ifstream input_file{file_name.get(),
                           std::ios_base::in | std::ios_base::binary};
  if (!input_file) {
    throw StatementException(
        catenate("Unable to open input file: ", file_name.get()));
  }
  std::string file_content(fs::file_size(file_name.get()), '\0');
  input_file.read(&file_content[0], file_content.size());
  input_file.close();

  return file_content;
} /* -----  end of function LoadDataFileForUse  ----- */

/*
 * ===  FUNCTION
 * ====================================================================== Name:
 * SplitIntoPages Description: a trailing separator does not start a new page.
 * =====================================================================================
 */
SX::PageList SplitIntoPages(SX::sv file_content, char page_separator) {
  auto pages = split_string<std::string>(file_content, page_separator);

  // blank pages carry nothing we can use.

  pages |= ranges::actions::remove_if([](const std::string &page) {
    return boost::algorithm::trim_copy(page).empty();
  });

  spdlog::debug(catenate("Found: ", pages.size(), " page(s) of text."));
  return pages;
} /* -----  end of function SplitIntoPages  ----- */

namespace boost {
// these functions are declared in the library headers but left to the user to
// define. so here they are...
//
/*
 * ===  FUNCTION
 * ====================================================================== Name:
 * assertion_failed_mgs Description: defined in boost header but left to us to
 * implement.
 * =====================================================================================
 */

void assertion_failed_msg(char const *expr, char const *msg,
                          char const *function, char const *file, long line) {
  throw AssertionException(catenate(
      "\n*** Assertion failed *** test: ", expr, " in function: ", function,
      " from file: ", file, " at line: ", line, ".\nassertion msg: ", msg));
} /* -----  end of function assertion_failed_mgs  ----- */

/*
 * ===  FUNCTION
 * ====================================================================== Name:
 * assertion_failed Description:
 * =====================================================================================
 */
void assertion_failed(char const *expr, char const *function, char const *file,
                      long line) {
  throw AssertionException(catenate("\n*** Assertion failed *** test: ", expr,
                                    " in function: ", function,
                                    " from file: ", file, " at line: ", line));
} /* -----  end of function assertion_failed  ----- */
} /* end namespace boost */
