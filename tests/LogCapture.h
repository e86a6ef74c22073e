// =====================================================================================
//
//       Filename:  LogCapture.h
//
//    Description:  Test fixture which collects what our code logs so tests can
//                  count the diagnostics.
//
//        Version:  1.0
//        Created:  11/13/2025 09:02:11 AM
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

#ifndef _LOGCAPTURE_INC_
#define _LOGCAPTURE_INC_

#include <memory>
#include <sstream>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>

// each captured line looks like 'warning|the message'

class LogCapture
{
public:
    LogCapture()
        : previous_logger_{spdlog::default_logger()}
    {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(log_stream_);
        auto logger = std::make_shared<spdlog::logger>("log_capture", sink);
        logger->set_pattern("%l|%v");
        logger->set_level(spdlog::level::debug);
        spdlog::set_default_logger(logger);
    }

    ~LogCapture()
    {
        spdlog::set_default_logger(previous_logger_);
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    [[nodiscard]] std::string Captured() const { return log_stream_.str(); }

    [[nodiscard]] int CountLines(std::string_view text) const
    {
        std::istringstream captured{log_stream_.str()};
        int count{0};
        for (std::string line; std::getline(captured, line); )
        {
            if (line.find(text) != std::string::npos)
            {
                ++count;
            }
        }
        return count;
    }

    void Clear() { log_stream_.str(""); }

private:
    std::ostringstream log_stream_;
    std::shared_ptr<spdlog::logger> previous_logger_;
};

#endif   // ----- #ifndef _LOGCAPTURE_INC_  -----
