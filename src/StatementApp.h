// =====================================================================================
//
//       Filename:  StatementApp.h
//
//    Description:  Command line application to extract the transactions from
//                  account statement text.
//
//        Version:  1.0
//        Created:  11/12/2025 09:11:45 AM
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

// =====================================================================================
//        Class:  StatementApp
//  Description:
// =====================================================================================

#ifndef STATEMENTAPP_H_
#define STATEMENTAPP_H_

#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <tuple>
#include <vector>

namespace fs = std::filesystem;

#include <boost/program_options.hpp>

#include <spdlog/spdlog.h>

namespace po = boost::program_options;

#include "Statement.h"
#include "StatementParser.h"
#include "Statement_Utils.h"

class StatementApp
{
public:
    StatementApp(int argc, char *argv[]);

    // use ctor below for testing with predefined options

    explicit StatementApp(const std::vector<std::string> &tokens);

    StatementApp() = delete;
    StatementApp(const StatementApp &rhs) = delete;
    StatementApp(StatementApp &&rhs) = delete;

    ~StatementApp() = default;

    StatementApp &operator=(const StatementApp &rhs) = delete;
    StatementApp &operator=(StatementApp &&rhs) = delete;

    bool Startup();

    // files with transactions, files skipped, files without transactions

    std::tuple<int, int, int> Run();
    void Shutdown();

    [[nodiscard]] const SX::TransactionList &Transactions() const { return transactions_; }

protected:
    //	Setup for parsing program options.

    void SetupProgramOptions();
    void ParseProgramOptions();
    void ParseProgramOptions(const std::vector<std::string> &tokens);

    void ConfigureLogging();

    bool CheckArgs();

    std::tuple<int, int, int> ParseEachFile();
    std::tuple<int, int, int> ParseAsOneStatement();
    std::tuple<int, int, int> KeepTransactions(const ParsedStatement &statement, const SX::FileName &file_name);

    void WriteOutput(std::ostream &output) const;

    // ====================  DATA MEMBERS  =======================================

private:
    po::positional_options_description mPositional;       //	old style options
    std::unique_ptr<po::options_description> mNewOptions; //	new style options (with identifiers)
    po::variables_map mVariableMap;

    int mArgc = 0;
    char **mArgv = nullptr;
    const std::vector<std::string> tokens_;

    std::string logging_level_{"information"};

    std::vector<SX::FileName> input_file_names_;

    SX::FileName dialect_file_name_;
    SX::FileName output_file_name_;
    SX::FileName log_file_path_name_;

    std::optional<StatementParser> parser_;

    SX::TransactionList transactions_;

    std::shared_ptr<spdlog::logger> logger_;

    bool normalize_{false};
    bool combine_files_{false};

}; // -----  end of class StatementApp  -----

#endif /* STATEMENTAPP_H_ */
