// =====================================================================================
//
//       Filename:  ChaptersFromLines.cpp
//
//    Description:  Range compatible class to split a statement's lines into chapters.
//
//        Version:  1.0
//        Created:  11/09/2025 10:31:16 AM
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

#include "ChaptersFromLines.h"

#include <utility>

#include <boost/algorithm/string/trim.hpp>

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/join.hpp>
#include <range/v3/view/transform.hpp>

#include <spdlog/spdlog.h>

#include "StatementDialect.h"
#include "Statement_Utils.h"

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  FlattenPages
 *  Description:
 * =====================================================================================
 */
SX::LineList FlattenPages (const SX::PageList& pages)
{
    auto lines = pages
        | ranges::views::transform([](const std::string& page) { return split_string<std::string>(page, '\n'); })
        | ranges::views::join
        | ranges::views::transform([](const std::string& line) { return boost::algorithm::trim_copy(line); })
        | ranges::to<SX::LineList>();

    return lines;
}		/* -----  end of function FlattenPages  ----- */

ChaptersFromLines::const_iterator ChaptersFromLines::begin () const
{
    return chapter_itor{this};
}		/* -----  end of method ChaptersFromLines::begin  ----- */

ChaptersFromLines::const_iterator ChaptersFromLines::end () const
{
    return {};
}		/* -----  end of method ChaptersFromLines::end  ----- */

std::vector<SX::Chapter> ChaptersFromLines::AllChapters () const
{
    std::vector<SX::Chapter> chapters;
    for (const auto& chapter : *this)
    {
        chapters.push_back(chapter);
    }
    return chapters;
}		/* -----  end of method ChaptersFromLines::AllChapters  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  ChaptersFromLines::chapter_itor
 *      Method:  ChaptersFromLines::chapter_itor
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
ChaptersFromLines::chapter_itor::chapter_itor (ChaptersFromLines const * chapters)
    : chapters_{chapters}
{
    pending_name_ = chapters_->dialect_->Vocabulary().holder_chapter;
    if (! LoadNextChapter())
    {
        MakeEnd();
    }
}  /* -----  end of method ChaptersFromLines::chapter_itor::chapter_itor  (constructor)  ----- */

ChaptersFromLines::chapter_itor& ChaptersFromLines::chapter_itor::operator++ ()
{
    if (chapters_ == nullptr)
    {
        return *this;
    }
    if (! LoadNextChapter())
    {
        MakeEnd();
    }
    return *this;
}		/* -----  end of method ChaptersFromLines::chapter_itor::operator++  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  ChaptersFromLines::chapter_itor
 *      Method:  LoadNextChapter
 * Description:  collect lines until the next heading which follows some content
 *               or the end of the lines.
 *               A heading right after a heading just renames the empty chapter.
 *--------------------------------------------------------------------------------------
 */
bool ChaptersFromLines::chapter_itor::LoadNextChapter ()
{
    const auto& lines = *chapters_->lines_;
    const auto& dialect = *chapters_->dialect_;

    SX::Chapter chapter{pending_name_, {}};
    bool header_seen{false};

    while (next_line_ < lines.size())
    {
        const auto& line = lines[next_line_++];
        if (line.empty())
        {
            continue;
        }
        if (dialect.IsChapterHeading(line))
        {
            if (! chapter.lines.empty())
            {
                pending_name_ = line;
                chapter_ = std::move(chapter);
                return true;
            }
            chapter.name = line;
            header_seen = false;
            continue;
        }
        if (dialect.IsTableHeader(line))
        {
            // repeated on every page the table continues on.

            if (header_seen)
            {
                continue;
            }
            header_seen = true;
        }
        chapter.lines.push_back(line);
    }

    if (! chapter.lines.empty())
    {
        pending_name_.clear();
        chapter_ = std::move(chapter);
        return true;
    }
    return false;
}		/* -----  end of method ChaptersFromLines::chapter_itor::LoadNextChapter  ----- */

void ChaptersFromLines::chapter_itor::MakeEnd ()
{
    chapters_ = nullptr;
    next_line_ = 0;
    pending_name_.clear();
    chapter_ = {};
}		/* -----  end of method ChaptersFromLines::chapter_itor::MakeEnd  ----- */
