// =====================================================================================
//
//       Filename:  statement_main.cpp
//
//    Description:  Extract the transactions from account statement text files
//                  and write them as CSV.
//
//        Version:  1.0
//        Created:  11/12/2025 11:26:50 AM
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

#include <iostream>

#include "spdlog/spdlog.h"

#include "StatementApp.h"
#include "Statement_Utils.h"

int main(int argc, char* argv[])
{
    auto result{0};

    StatementApp statement_app(argc, argv);

    try
    {
        if (! statement_app.Startup())
        {
            return 1;
        }
        statement_app.Run();
        statement_app.Shutdown();
    }
    catch (std::exception& e)
    {
        spdlog::error(catenate("Problem processing statements: ", e.what()));
        std::cerr << e.what() << '\n';
        statement_app.Shutdown();
        result = 1;
    }

    return result;

}        // -----  end of method main  -----
