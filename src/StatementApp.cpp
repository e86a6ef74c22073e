// =====================================================================================
//
//       Filename:  StatementApp.cpp
//
//    Description:  Command line application to extract the transactions from
//                  account statement text.
//
//        Version:  1.0
//        Created:  11/12/2025 09:40:02 AM
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

#include "StatementApp.h"

#include <fstream>
#include <iostream>
#include <iterator>
#include <map>

#include "spdlog/sinks/basic_file_sink.h"

#include "StatementDialect.h"
#include "TransactionClassifier.h"
#include "TransactionCsv.h"

using namespace std::string_literals;

/*
 *--------------------------------------------------------------------------------------
 *       Class:  StatementApp
 *      Method:  StatementApp
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
StatementApp::StatementApp (int argc, char* argv[])
    : mArgc{argc}, mArgv{argv}
{
}  /* -----  end of method StatementApp::StatementApp  (constructor)  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  StatementApp
 *      Method:  StatementApp
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
StatementApp::StatementApp (const std::vector<std::string>& tokens)
    : tokens_{tokens}
{
}  /* -----  end of method StatementApp::StatementApp  (constructor)  ----- */

void StatementApp::ConfigureLogging()
{
    // we need to set log level if specified and also log file.

    if (! log_file_path_name_.get().empty())
    {
        // if we are running inside our test harness, logging may already by
        // running so we don't want to clobber it.
        // different tests may use different names.

        auto logger_name = log_file_path_name_.get().filename();
        logger_ = spdlog::get(logger_name);
        if (! logger_)
        {
            fs::path log_dir = log_file_path_name_.get().parent_path();
            if (! log_dir.empty() && ! fs::exists(log_dir))
            {
                fs::create_directories(log_dir);
            }

            logger_ = spdlog::basic_logger_mt(logger_name, log_file_path_name_.get().string());
            spdlog::set_default_logger(logger_);
        }
    }

    // we are running before 'CheckArgs' so we need to do a little editiing ourselves.

    std::map<std::string, spdlog::level::level_enum> levels
    {
        {"none", spdlog::level::off},
        {"error", spdlog::level::err},
        {"information", spdlog::level::info},
        {"debug", spdlog::level::debug}
    };

    auto which_level = levels.find(logging_level_);
    if (which_level != levels.end())
    {
        spdlog::set_level(which_level->second);
    }
}		/* -----  end of method StatementApp::ConfigureLogging  ----- */

bool StatementApp::Startup()
{
    bool result{true};
	try
	{
		SetupProgramOptions();
        if (tokens_.empty())
        {
            ParseProgramOptions();
        }
        else
        {
            ParseProgramOptions(tokens_);
        }
        ConfigureLogging();
        spdlog::info(catenate("\n\n*** Begin run ", LocalDateTimeAsString(std::chrono::system_clock::now()), " ***\n"));
		result = CheckArgs ();
	}
	catch(const std::exception& e)
	{
        spdlog::error(catenate("Problem in startup: ", e.what(), '\n'));
		//	we're outta here!

		this->Shutdown();
        result = false;
    }
    return result;
}		/* -----  end of method StatementApp::Startup  ----- */

void StatementApp::SetupProgramOptions ()
{
    mNewOptions = std::make_unique<po::options_description>();

	mNewOptions->add_options()
		("help,h", "produce help message")
		("file,f", po::value<std::vector<SX::FileName>>(&input_file_names_)->composing(),
         "statement text file[s] to be processed. Pages are separated by form feeds.")
		("combine", po::value<bool>(&combine_files_)->default_value(false)->implicit_value(true),
            "treat the files, in order, as the pages of one statement. Default is 'false'")
		("dialect", po::value<SX::FileName>(&dialect_file_name_),
         "path to file describing the statement layout. Default is the built in Trade Republic layout.")
		("output,o", po::value<SX::FileName>(&output_file_name_), "path name for CSV output. Default is stdout.")
		("normalize", po::value<bool>(&normalize_)->default_value(false)->implicit_value(true),
            "write normalized transactions instead of statement rows. Default is 'false'")
		("log-level,l", po::value<std::string>(&logging_level_),
         "logging level. Must be 'none|error|information|debug'. Default is 'information'.")
		("log-path", po::value<SX::FileName>(&log_file_path_name_),	"path name for log file.")
		;

    mPositional.add("file", -1);
}		/* -----  end of method StatementApp::SetupProgramOptions  ----- */

void StatementApp::ParseProgramOptions ()
{
	auto options = po::command_line_parser(mArgc, mArgv).options(*mNewOptions).positional(mPositional).run();
	po::store(options, mVariableMap);
	if (this->mArgc == 1 ||	mVariableMap.count("help") == 1)
	{
		std::cout << *mNewOptions << "\n";
		throw std::runtime_error("\nExiting after 'help'.");
	}
	po::notify(mVariableMap);

}		/* -----  end of method StatementApp::ParseProgramOptions  ----- */

void StatementApp::ParseProgramOptions (const std::vector<std::string>& tokens)
{
	auto options = po::command_line_parser(tokens).options(*mNewOptions).positional(mPositional).run();
	po::store(options, mVariableMap);
	if (mVariableMap.count("help") == 1)
	{
		std::cout << *mNewOptions << "\n";
		throw std::runtime_error("\nExiting after 'help'.");
	}
	po::notify(mVariableMap);
}		/* -----  end of method StatementApp::ParseProgramOptions  ----- */

bool StatementApp::CheckArgs ()
{
    BOOST_ASSERT_MSG(logging_level_ == "none" || logging_level_ == "error" || logging_level_ == "information"
            || logging_level_ == "debug", catenate("Unknown logging level: ", logging_level_).c_str());

    BOOST_ASSERT_MSG(! input_file_names_.empty(), "Must specify at least 1 statement file to process.");

    for (const auto& input_file_name : input_file_names_)
    {
        BOOST_ASSERT_MSG(fs::exists(input_file_name.get()),
                catenate("Can't find statement file: ", input_file_name.get()).c_str());
    }

    if (! dialect_file_name_.get().empty())
    {
        BOOST_ASSERT_MSG(fs::exists(dialect_file_name_.get()),
                catenate("Can't find dialect file: ", dialect_file_name_.get()).c_str());
        parser_.emplace(LoadStatementDialect(dialect_file_name_));
    }
    else
    {
        parser_.emplace();
    }

    if (! output_file_name_.get().empty())
    {
        auto output_directory = output_file_name_.get().parent_path();
        if (! output_directory.empty() && ! fs::exists(output_directory))
        {
            fs::create_directories(output_directory);
        }
    }

    return true;
}		/* -----  end of method StatementApp::CheckArgs  ----- */

std::tuple<int, int, int> StatementApp::Run()
{
    transactions_.clear();

    auto counters = combine_files_ ? ParseAsOneStatement() : ParseEachFile();

    if (output_file_name_.get().empty())
    {
        WriteOutput(std::cout);
    }
    else
    {
        std::ofstream output{output_file_name_.get(), std::ios::out | std::ios::binary | std::ios::trunc};
        if (! output)
        {
            throw StatementException(catenate("Unable to open output file: ", output_file_name_.get()));
        }
        WriteOutput(output);
        output.close();
        spdlog::info(catenate("Wrote: ", transactions_.size(), " transaction(s) to: ", output_file_name_.get()));
    }

    auto [success_counter, skipped_counter, empty_counter] = counters;

    spdlog::info(catenate("Processed: ", SumT(counters), " statement(s). With transactions: ",
            success_counter, ". Skips: ", skipped_counter , ". Without transactions: ", empty_counter, "."));

    return counters;
}		/* -----  end of method StatementApp::Run  ----- */

std::tuple<int, int, int> StatementApp::ParseEachFile ()
{
    std::tuple<int, int, int> counters{0, 0, 0};

    for (const auto& input_file_name : input_file_names_)
    {
        spdlog::info(catenate("Processing statement file: ", input_file_name.get()));

        const std::string file_content = LoadDataFileForUse(input_file_name);
        auto pages = SplitIntoPages(file_content);
        if (pages.empty())
        {
            spdlog::info(catenate("Skipping empty statement file: ", input_file_name.get()));
            counters = AddTs(counters, std::make_tuple(0, 1, 0));
            continue;
        }
        counters = AddTs(counters, KeepTransactions(parser_->Parse(pages), input_file_name));
    }
    return counters;
}		/* -----  end of method StatementApp::ParseEachFile  ----- */

std::tuple<int, int, int> StatementApp::ParseAsOneStatement ()
{
    SX::PageList pages;
    for (const auto& input_file_name : input_file_names_)
    {
        const std::string file_content = LoadDataFileForUse(input_file_name);
        auto file_pages = SplitIntoPages(file_content);
        pages.insert(pages.end(), std::make_move_iterator(file_pages.begin()), std::make_move_iterator(file_pages.end()));
    }

    if (pages.empty())
    {
        spdlog::info("Skipping statement with no text.");
        return {0, 1, 0};
    }

    return KeepTransactions(parser_->Parse(pages), input_file_names_.front());
}		/* -----  end of method StatementApp::ParseAsOneStatement  ----- */

std::tuple<int, int, int> StatementApp::KeepTransactions (const ParsedStatement& statement,
        const SX::FileName& file_name)
{
    if (statement.transactions.empty())
    {
        spdlog::error(catenate("No transactions found in: ", file_name.get()));
        return {0, 0, 1};
    }
    transactions_.insert(transactions_.end(), statement.transactions.begin(), statement.transactions.end());
    return {1, 0, 0};
}		/* -----  end of method StatementApp::KeepTransactions  ----- */

void StatementApp::WriteOutput (std::ostream& output) const
{
    if (normalize_)
    {
        WriteTransactionsAsCsv(NormalizeTransactions(transactions_, parser_->Dialect()), output);
    }
    else
    {
        WriteRecordsAsCsv(transactions_, output);
    }
}		/* -----  end of method StatementApp::WriteOutput  ----- */

void StatementApp::Shutdown ()
{
    spdlog::info(catenate("\n\n*** End run ", LocalDateTimeAsString(std::chrono::system_clock::now()), " ***\n"));
}       // -----  end of method StatementApp::Shutdown  -----
