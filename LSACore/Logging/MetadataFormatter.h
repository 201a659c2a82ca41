// PROJECT:       LSAcq
// SUBSYSTEM:     LSACore logging
//
// LICENSE:       This file is distributed under the "Lesser GPL" (LGPL) license.
//                License text is included with the source distribution.
//
//                This file is distributed in the hope that it will be useful,
//                but WITHOUT ANY WARRANTY; without even the implied warranty
//                of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//
//                IN NO EVENT SHALL THE COPYRIGHT OWNER OR
//                CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT,
//                INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES.

#pragma once

#include "Metadata.h"

#include <chrono>
#include <cstddef>
#include <cstdio>
#include <ctime>
#include <ostream>
#include <sstream>
#include <string>


namespace lsa
{
namespace logging
{
namespace internal
{


inline const char*
LevelString(LogLevel logLevel)
{
   switch (logLevel)
   {
      case LogLevelTrace: return "trc";
      case LogLevelDebug: return "dbg";
      case LogLevelInfo: return "IFO";
      case LogLevelWarning: return "WRN";
      case LogLevelError: return "ERR";
      case LogLevelFatal: return "FTL";
      default: return "???";
   }
}


// "yyyy-mm-ddThh:mm:ss.uuuuuu" in local time
inline std::string
FormatLocalTime(LogTimestamp tp)
{
   using namespace std::chrono;
   const microseconds us = duration_cast<microseconds>(tp.time_since_epoch());
   const seconds secs = duration_cast<seconds>(us);
   const int frac = static_cast<int>((us - duration_cast<microseconds>(secs)).count());

   std::time_t t(secs.count());
   std::tm tmstruct;
#ifdef _WIN32
   localtime_s(&tmstruct, &t);
#else
   localtime_r(&t, &tmstruct);
#endif

   char buf[32];
   std::size_t len = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S",
         &tmstruct);
   std::snprintf(buf + len, sizeof(buf) - len, ".%06d", frac);
   return buf;
}


// Formats the "time tidN [LVL,component]" prefix (component:run for loggers
// bound to a run) of the first line of an
// entry, and the blank prefix of the same width (keeping the brackets) for
// the remaining lines. Not thread safe; each sink owns one.
class MetadataFormatter
{
   std::string buf_;
   std::ostringstream sstrm_;
   std::size_t openBracketCol_;
   std::size_t closeBracketCol_;

public:
   MetadataFormatter() : openBracketCol_(0), closeBracketCol_(0) {}

   void FormatLinePrefix(std::ostream& stream, const Metadata& metadata)
   {
      buf_ = FormatLocalTime(metadata.GetStampData().GetTimestamp());
      buf_ += " tid";
      sstrm_.str(std::string());
      sstrm_ << metadata.GetStampData().GetThreadId();
      buf_ += sstrm_.str();
      buf_ += ' ';

      openBracketCol_ = buf_.size();
      buf_ += '[';
      buf_ += LevelString(metadata.GetEntryData().GetLevel());
      buf_ += ',';
      const LoggerData& loggerData = metadata.GetLoggerData();
      buf_ += loggerData.GetComponentLabel();
      if (loggerData.HasRunHandle())
      {
         buf_ += ':';
         buf_ += std::to_string(loggerData.GetRunHandle());
      }
      closeBracketCol_ = buf_.size();
      buf_ += ']';

      stream << buf_;
   }

   void FormatContinuationPrefix(std::ostream& stream)
   {
      buf_.assign(closeBracketCol_ + 1, ' ');
      buf_[openBracketCol_] = '[';
      buf_[closeBracketCol_] = ']';
      stream << buf_;
   }
};


} // namespace internal
} // namespace logging
} // namespace lsa
