// =====================================================================================
//
//       Filename:  StatementDialect.cpp
//
//    Description:  The closed vocabularies and patterns which describe one family of
//                  statement layouts.
//
//        Version:  1.0
//        Created:  11/08/2025 01:22:19 PM
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

#include "StatementDialect.h"

#include <array>
#include <charconv>
#include <fstream>
#include <utility>

#include <boost/program_options.hpp>

#include <range/v3/action/sort.hpp>
#include <range/v3/action/stable_sort.hpp>
#include <range/v3/action/unique.hpp>
#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/find.hpp>
#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/view/keys.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/concat.hpp>

#include <spdlog/spdlog.h>

#include "Statement_Utils.h"

namespace po = boost::program_options;

namespace
{
    using TypeName = std::pair<SX::TransactionType, SX::sv>;

    constexpr std::array<TypeName, 15> TRANSACTION_TYPE_NAMES
    {{
        {SX::TransactionType::e_Buy, "buy"},
        {SX::TransactionType::e_Sell, "sell"},
        {SX::TransactionType::e_Dividend, "dividend"},
        {SX::TransactionType::e_Interest, "interest"},
        {SX::TransactionType::e_Fee, "fee"},
        {SX::TransactionType::e_Tax, "tax"},
        {SX::TransactionType::e_Liability, "liability"},
        {SX::TransactionType::e_Canceled, "canceled"},
        {SX::TransactionType::e_Refund, "refund"},
        {SX::TransactionType::e_Payment, "payment"},
        {SX::TransactionType::e_Transfer, "transfer"},
        {SX::TransactionType::e_Deposit, "deposit"},
        {SX::TransactionType::e_Withdrawal, "withdrawal"},
        {SX::TransactionType::e_Verification, "verification"},
        {SX::TransactionType::e_Gift, "gift"}
    }};

    // dialect file entries look like 'key=value' inside the option value
    // e.g. 'month = Jan.=0'

    std::pair<std::string, std::string> SplitEntry(const std::string& entry, const char* option_name)
    {
        auto pos = entry.rfind('=');
        if (pos == std::string::npos || pos == 0 || pos == entry.size() - 1)
        {
            throw DialectException(catenate("Dialect option: '", option_name, "' needs 'name=value' but found: '", entry, "'."));
        }
        return {entry.substr(0, pos), entry.substr(pos + 1)};
    }

}   // namespace

/*
 *--------------------------------------------------------------------------------------
 *       Class:  StatementDialect
 *      Method:  StatementDialect
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
StatementDialect::StatementDialect (DialectVocabulary vocabulary)
    : vocabulary_{std::move(vocabulary)}
{
    CheckVocabulary();

    try
    {
        for (const auto& pattern : vocabulary_.footer_patterns)
        {
            regex_footers_.emplace_back(pattern);
        }
        regex_month_shape_.assign(vocabulary_.month_shape_pattern);
        regex_money_.assign(vocabulary_.money_pattern);
    }
    catch (const boost::regex_error& e)
    {
        throw DialectException(catenate("Dialect: ", vocabulary_.name, " has an unusable pattern: ", e.what()));
    }

    categories_by_length_ = ranges::views::concat(ranges::views::keys(vocabulary_.category_directions),
            ranges::views::keys(vocabulary_.category_types)) | ranges::to<std::vector<std::string>>();

    categories_by_length_ |= ranges::actions::sort | ranges::actions::unique;
    categories_by_length_ |= ranges::actions::stable_sort([](const auto& a, const auto& b) { return a.size() > b.size(); });
}  /* -----  end of method StatementDialect::StatementDialect  (constructor)  ----- */

void StatementDialect::CheckVocabulary () const
{
    if (vocabulary_.ledger_chapter.empty())
    {
        throw DialectException(catenate("Dialect: ", vocabulary_.name, " has no transaction ledger chapter."));
    }
    if (ranges::find(vocabulary_.chapters, vocabulary_.ledger_chapter) == vocabulary_.chapters.end())
    {
        throw DialectException(catenate("Dialect: ", vocabulary_.name, " ledger chapter: '", vocabulary_.ledger_chapter,
                    "' is not one of its chapter headings."));
    }
    if (auto bad_month = ranges::find_if(vocabulary_.months, [](const auto& m) { return m.second < 0 || m.second > 11; });
            bad_month != vocabulary_.months.end())
    {
        throw DialectException(catenate("Dialect: ", vocabulary_.name, " month: '", bad_month->first,
                    "' has ordinal: ", bad_month->second, ". Must be 0 - 11."));
    }
    if (vocabulary_.thousands_separator == vocabulary_.decimal_separator)
    {
        throw DialectException(catenate("Dialect: ", vocabulary_.name, " uses the same thousands and decimal separator."));
    }
    if (vocabulary_.balance_epsilon < 0.0)
    {
        throw DialectException(catenate("Dialect: ", vocabulary_.name, " balance epsilon can not be negative."));
    }
}		/* -----  end of method StatementDialect::CheckVocabulary  ----- */

bool StatementDialect::IsChapterHeading (SX::sv line) const
{
    return ranges::any_of(vocabulary_.chapters, [line](const auto& chapter) { return chapter == line; });
}		/* -----  end of method StatementDialect::IsChapterHeading  ----- */

bool StatementDialect::IsTableHeader (SX::sv line) const
{
    return ranges::any_of(vocabulary_.table_headers, [line](const auto& header) { return header == line; });
}		/* -----  end of method StatementDialect::IsTableHeader  ----- */

bool StatementDialect::IsBoilerplate (SX::sv line) const
{
    if (ranges::any_of(vocabulary_.boilerplate_lines, [line](const auto& boilerplate) { return boilerplate == line; }))
    {
        return true;
    }
    return ranges::any_of(regex_footers_, [line](const auto& regex_footer)
        { return boost::regex_match(line.begin(), line.end(), regex_footer); });
}		/* -----  end of method StatementDialect::IsBoilerplate  ----- */

bool StatementDialect::LooksLikeMonth (SX::sv token) const
{
    return boost::regex_match(token.begin(), token.end(), regex_month_shape_);
}		/* -----  end of method StatementDialect::LooksLikeMonth  ----- */

std::optional<int> StatementDialect::MonthOrdinal (SX::sv token) const
{
    if (auto found = vocabulary_.months.find(token); found != vocabulary_.months.end())
    {
        return found->second;
    }
    return std::nullopt;
}		/* -----  end of method StatementDialect::MonthOrdinal  ----- */

std::optional<SX::FlowDirection> StatementDialect::CategoryDirection (SX::sv category) const
{
    if (auto found = vocabulary_.category_directions.find(category); found != vocabulary_.category_directions.end())
    {
        return found->second;
    }
    return std::nullopt;
}		/* -----  end of method StatementDialect::CategoryDirection  ----- */

std::optional<SX::TransactionType> StatementDialect::CategoryType (SX::sv category) const
{
    if (auto found = vocabulary_.category_types.find(category); found != vocabulary_.category_types.end())
    {
        return found->second;
    }
    return std::nullopt;
}		/* -----  end of method StatementDialect::CategoryType  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  DefaultDialectVocabulary
 *  Description:  Trade Republic account statements, German edition.
 * =====================================================================================
 */
DialectVocabulary DefaultDialectVocabulary ()
{
    DialectVocabulary vocabulary;

    vocabulary.name = "trade-republic-pdf";
    vocabulary.currency = "EUR";

    vocabulary.holder_chapter = "KONTOINHABER";
    vocabulary.ledger_chapter = "UMSATZÜBERSICHT";
    vocabulary.ledger_header = "DATUM TYP BESCHREIBUNG ZAHLUNGSEINGANG ZAHLUNGSAUSGANG SALDO";
    vocabulary.chapters =
    {
        "KONTOÜBERSICHT",
        "UMSATZÜBERSICHT",
        "BARMITTELÜBERSICHT",
        "TRANSAKTIONSÜBERSICHT",
        "HINWEISE ZUM KONTOAUSZUG"
    };
    vocabulary.table_headers =
    {
        "PRODUKT ANFANGSSALDO ZAHLUNGSEINGANG ZAHLUNGSAUSGANG ENDSALDO",
        "DATUM TYP BESCHREIBUNG ZAHLUNGSEINGANG ZAHLUNGSAUSGANG SALDO",
        "DATUM ZAHLUNGSART GELDMARKTFONDS STÜCK KURS PRO STÜCK BETRAG"
    };

    vocabulary.boilerplate_lines =
    {
        "TRADE REPUBLIC BANK GMBH BRUNNENSTRASSE 19-21 10119 BERLIN",
        "Trade Republic Bank GmbH",
        "Brunnenstraße 19-21",
        "10119 Berlin",
        "www.traderepublic.com Sitz der Gesellschaft: Berlin",
        "AG Charlottenburg HRB 244347 B",
        "Umsatzsteuer-ID DE307510626",
        "Geschäftsführer",
        "Andreas Torner",
        "Gernot Mittendorfer",
        "Christian Hecker",
        "Thomas Pischke"
    };
    vocabulary.footer_patterns =
    {
        R"***(^Erstellt am \d{2}\.\d{2}\.\d{4}, \d{2}:\d{2}:\d{2} Seite \d+ von \d+$)***"
    };

    vocabulary.months =
    {
        {"Jan", 0}, {"Jan.", 0},
        {"Feb", 1}, {"Feb.", 1},
        {"März", 2}, {"Mär.", 2},
        {"Apr", 3}, {"Apr.", 3},
        {"Mai", 4}, {"Mai.", 4},
        {"Juni", 5}, {"Jun.", 5},
        {"Juli", 6}, {"Jul.", 6},
        {"Aug", 7}, {"Aug.", 7},
        {"Sep", 8}, {"Sept.", 8},
        {"Okt", 9}, {"Okt.", 9},
        {"Nov", 10}, {"Nov.", 10},
        {"Dez", 11}, {"Dez.", 11}
    };

    // one capital letter then 2 or 3 small ones, maybe a period.
    // the umlauts are 2 bytes in UTF-8 so they are spelled out.

    vocabulary.month_shape_pattern = R"***(^(?:[A-Z]|Ä|Ö|Ü)(?:[a-z]|ä|ö|ü|ß){2,3}\.?$)***";

    vocabulary.category_directions =
    {
        {"Erträge", SX::FlowDirection::e_Inflow},
        {"Überweisung", SX::FlowDirection::e_Inflow},
        {"Zinszahlung", SX::FlowDirection::e_Inflow},
        {"Prämie", SX::FlowDirection::e_Inflow},
        {"Steuern", SX::FlowDirection::e_Inflow},
        {"Empfehlung", SX::FlowDirection::e_Inflow},
        {"Handel", SX::FlowDirection::e_Outflow},
        {"Kartentransaktion", SX::FlowDirection::e_Outflow},
        {"Geschenk", SX::FlowDirection::e_Outflow}
    };
    vocabulary.category_types =
    {
        {"Erträge", SX::TransactionType::e_Dividend},
        {"Überweisung", SX::TransactionType::e_Deposit},
        {"Zinszahlung", SX::TransactionType::e_Interest},
        {"Prämie", SX::TransactionType::e_Deposit},
        {"Steuern", SX::TransactionType::e_Tax},
        {"Empfehlung", SX::TransactionType::e_Deposit},
        {"Kartentransaktion", SX::TransactionType::e_Payment},
        {"Geschenk", SX::TransactionType::e_Gift}
    };
    vocabulary.trade_category = "Handel";

    vocabulary.money_pattern = R"***(-?\d+(?:\.\d{3})*(?:,\d{2})?\s*€)***";
    vocabulary.thousands_separator = '.';
    vocabulary.decimal_separator = ',';
    vocabulary.balance_epsilon = 0.01;

    return vocabulary;
}		/* -----  end of function DefaultDialectVocabulary  ----- */

StatementDialect DefaultStatementDialect ()
{
    return StatementDialect{DefaultDialectVocabulary()};
}		/* -----  end of function DefaultStatementDialect  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  LoadStatementDialect
 *  Description:  list valued keys replace the default list when present.
 * =====================================================================================
 */
StatementDialect LoadStatementDialect (const SX::FileName& dialect_file_name)
{
    std::ifstream dialect_file{dialect_file_name.get()};
    if (! dialect_file)
    {
        throw DialectException(catenate("Can't open dialect file: ", dialect_file_name.get()));
    }

    DialectVocabulary vocabulary = DefaultDialectVocabulary();

    std::vector<std::string> chapters;
    std::vector<std::string> table_headers;
    std::vector<std::string> boilerplate_lines;
    std::vector<std::string> footer_patterns;
    std::vector<std::string> months;
    std::vector<std::string> categories_in;
    std::vector<std::string> categories_out;
    std::vector<std::string> category_types;

    po::options_description dialect_options;
    dialect_options.add_options()
        ("name", po::value<std::string>(&vocabulary.name), "dialect name, used as the source of transactions")
        ("currency", po::value<std::string>(&vocabulary.currency), "ISO 4217 code of the account currency")
        ("holder-chapter", po::value<std::string>(&vocabulary.holder_chapter), "name of the section before the first heading")
        ("ledger-chapter", po::value<std::string>(&vocabulary.ledger_chapter), "heading of the transaction ledger")
        ("ledger-header", po::value<std::string>(&vocabulary.ledger_header), "column header line of the ledger")
        ("chapter", po::value<std::vector<std::string>>(&chapters)->composing(), "chapter heading")
        ("table-header", po::value<std::vector<std::string>>(&table_headers)->composing(), "table column header line")
        ("boilerplate", po::value<std::vector<std::string>>(&boilerplate_lines)->composing(), "line to remove")
        ("footer-pattern", po::value<std::vector<std::string>>(&footer_patterns)->composing(), "regex of lines to remove")
        ("month", po::value<std::vector<std::string>>(&months)->composing(), "'spelling=ordinal', ordinal 0 - 11")
        ("month-shape", po::value<std::string>(&vocabulary.month_shape_pattern), "regex of month like tokens")
        ("category-in", po::value<std::vector<std::string>>(&categories_in)->composing(), "typically incoming category")
        ("category-out", po::value<std::vector<std::string>>(&categories_out)->composing(), "typically outgoing category")
        ("category-type", po::value<std::vector<std::string>>(&category_types)->composing(), "'category=type'")
        ("trade-category", po::value<std::string>(&vocabulary.trade_category), "category which is a buy or a sell")
        ("money-pattern", po::value<std::string>(&vocabulary.money_pattern), "regex of an amount with its currency mark")
        ("thousands-separator", po::value<char>(&vocabulary.thousands_separator), "thousands separator")
        ("decimal-separator", po::value<char>(&vocabulary.decimal_separator), "decimal separator")
        ("balance-epsilon", po::value<double>(&vocabulary.balance_epsilon), "tolerance for balance checks")
        ;

    po::variables_map dialect_values;
    try
    {
        po::store(po::parse_config_file(dialect_file, dialect_options), dialect_values);
        po::notify(dialect_values);
    }
    catch (const po::error& e)
    {
        throw DialectException(catenate("Problem reading dialect file: ", dialect_file_name.get(), ". ", e.what()));
    }

    if (! chapters.empty())
    {
        vocabulary.chapters = std::move(chapters);
    }
    if (! table_headers.empty())
    {
        vocabulary.table_headers = std::move(table_headers);
    }
    if (! boilerplate_lines.empty())
    {
        vocabulary.boilerplate_lines = std::move(boilerplate_lines);
    }
    if (! footer_patterns.empty())
    {
        vocabulary.footer_patterns = std::move(footer_patterns);
    }
    if (! months.empty())
    {
        vocabulary.months.clear();
        for (const auto& entry : months)
        {
            auto [spelling, ordinal_text] = SplitEntry(entry, "month");
            int ordinal{-1};
            if (auto [p, ec] = std::from_chars(ordinal_text.data(), ordinal_text.data() + ordinal_text.size(), ordinal);
                    ec != std::errc() || p != ordinal_text.data() + ordinal_text.size())
            {
                throw DialectException(catenate("Dialect month: '", spelling, "' has a bad ordinal: '", ordinal_text, "'."));
            }
            vocabulary.months[spelling] = ordinal;
        }
    }
    if (! categories_in.empty() || ! categories_out.empty())
    {
        vocabulary.category_directions.clear();
        for (const auto& category : categories_in)
        {
            vocabulary.category_directions[category] = SX::FlowDirection::e_Inflow;
        }
        for (const auto& category : categories_out)
        {
            vocabulary.category_directions[category] = SX::FlowDirection::e_Outflow;
        }
    }
    if (! category_types.empty())
    {
        vocabulary.category_types.clear();
        for (const auto& entry : category_types)
        {
            auto [category, type_name] = SplitEntry(entry, "category-type");
            auto type = TransactionTypeFromName(type_name);
            if (! type)
            {
                throw DialectException(catenate("Dialect category: '", category, "' has unknown type: '", type_name, "'."));
            }
            vocabulary.category_types[category] = *type;
        }
    }

    spdlog::info(catenate("Using statement dialect: ", vocabulary.name, " from: ", dialect_file_name.get()));

    return StatementDialect{std::move(vocabulary)};
}		/* -----  end of function LoadStatementDialect  ----- */

SX::sv TransactionTypeName (SX::TransactionType type)
{
    auto found = ranges::find_if(TRANSACTION_TYPE_NAMES, [type](const auto& entry) { return entry.first == type; });
    return found != TRANSACTION_TYPE_NAMES.end() ? found->second : SX::sv{"fee"};
}		/* -----  end of function TransactionTypeName  ----- */

std::optional<SX::TransactionType> TransactionTypeFromName (SX::sv name)
{
    auto found = ranges::find_if(TRANSACTION_TYPE_NAMES, [name](const auto& entry) { return entry.second == name; });
    if (found != TRANSACTION_TYPE_NAMES.end())
    {
        return found->first;
    }
    return std::nullopt;
}		/* -----  end of function TransactionTypeFromName  ----- */
