// =====================================================================================
//
//       Filename:  ChaptersFromLines.h
//
//    Description:  Range compatible class to split a statement's lines into chapters.
//
//        Version:  1.0
//        Created:  11/09/2025 10:02:48 AM
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

#ifndef _CHAPTERSFROMLINES_INC_
#define _CHAPTERSFROMLINES_INC_

#include <cstddef>
#include <iterator>
#include <string>
#include <vector>

#include "Statement.h"

class StatementDialect;

// page boundaries mean nothing once the boilerplate is gone so we work
// on one long list of lines.

[[nodiscard]] SX::LineList FlattenPages(const SX::PageList& pages);

/*
 * =====================================================================================
 *        Class:  ChaptersFromLines
 *  Description:  Range compatible class to iterate over the chapters in a list of
 *                sanitized lines. Lines before the first heading belong to the
 *                dialect's holder chapter. Empty chapters are never produced.
 * =====================================================================================
 */
class ChaptersFromLines
{
public:

    class chapter_itor;

    using iterator = chapter_itor;
    using const_iterator = chapter_itor;

public:
    /* ====================  LIFECYCLE     ======================================= */

    ChaptersFromLines (const SX::LineList& lines, const StatementDialect& dialect)
        : lines_{&lines}, dialect_{&dialect} { }         /* constructor */

    /* ====================  ACCESSORS     ======================================= */

    [[nodiscard]] const_iterator begin() const;
    [[nodiscard]] const_iterator end() const;

    [[nodiscard]] std::vector<SX::Chapter> AllChapters() const;

private:

    friend class chapter_itor;

    /* ====================  DATA MEMBERS  ======================================= */

    SX::LineList const * lines_;
    StatementDialect const * dialect_;

}; /* -----  end of class ChaptersFromLines  ----- */


// =====================================================================================
//        Class:  ChaptersFromLines::chapter_itor
//  Description:  Range compatible iterator from contents of ChaptersFromLines container.
// =====================================================================================
//
class ChaptersFromLines::chapter_itor
{
public:

    using iterator_category = std::forward_iterator_tag;
    using value_type = SX::Chapter;
    using difference_type = std::ptrdiff_t;
    using pointer = SX::Chapter const *;
    using reference = SX::Chapter const &;

    // ====================  LIFECYCLE     =======================================

    chapter_itor() = default;
    explicit chapter_itor(ChaptersFromLines const* chapters);

    // ====================  MUTATORS      =======================================

    chapter_itor& operator++();
    chapter_itor operator++(int) { chapter_itor retval = *this; ++(*this); return retval; }

    // ====================  OPERATORS     =======================================

    bool operator==(const chapter_itor& other) const
    {
        return chapters_ == other.chapters_ && next_line_ == other.next_line_ && chapter_ == other.chapter_;
    }
    bool operator!=(const chapter_itor& other) const { return !(*this == other); }

    reference operator*() const { return chapter_; }
    pointer operator->() const { return &chapter_; }

private:
    // ====================  METHODS       =======================================

    bool LoadNextChapter();
    void MakeEnd();

    // ====================  DATA MEMBERS  =======================================

    ChaptersFromLines const * chapters_ = nullptr;
    std::size_t next_line_ = 0;

    // the heading which closed the chapter we are showing names the next one.

    std::string pending_name_;
    SX::Chapter chapter_;

}; // -----  end of class ChaptersFromLines::chapter_itor  -----

#endif   // ----- #ifndef _CHAPTERSFROMLINES_INC_  -----
