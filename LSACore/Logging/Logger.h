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

#include <memory>
#include <sstream>
#include <string>


namespace lsa
{
namespace logging
{

class LoggingCore;


/// Handle through which a component emits log entries.
/**
 * Copyable and cheap. A logger keeps its logging core alive.
 */
class Logger
{
   std::shared_ptr<LoggingCore> core_;
   LoggerData loggerData_;

public:
   Logger(std::shared_ptr<LoggingCore> core, const LoggerData& loggerData) :
      core_(core),
      loggerData_(loggerData)
   {}

   void operator()(LogLevel level, const std::string& text) const;

   const char* GetComponentLabel() const
   { return loggerData_.GetComponentLabel(); }
   int GetRunHandle() const { return loggerData_.GetRunHandle(); }
};


// Collects stream output and sends it as a single entry on destruction.
class LogStream : public std::ostringstream
{
   const Logger& logger_;
   LogLevel level_;
   bool used_;

public:
   LogStream(const Logger& logger, LogLevel level) :
      logger_(logger),
      level_(level),
      used_(false)
   {}

   ~LogStream() { logger_(level_, str()); }

   // For the for-loop trick in the LOG_* macros
   bool Used() const { return used_; }
   void MarkUsed() { used_ = true; }
};


} // namespace logging
} // namespace lsa


// Usage: LOG_INFO(logger) << "text " << value;
// The for-loop scopes the stream to the statement, so the entry is sent when
// the full expression has been evaluated.
#define LSA_LOG_WITH_LEVEL(logger, level) \
   for (::lsa::logging::LogStream lsaLogStream_((logger), (level)); \
         !lsaLogStream_.Used(); lsaLogStream_.MarkUsed()) \
      lsaLogStream_

#define LOG_TRACE(logger) LSA_LOG_WITH_LEVEL((logger), ::lsa::logging::LogLevelTrace)
#define LOG_DEBUG(logger) LSA_LOG_WITH_LEVEL((logger), ::lsa::logging::LogLevelDebug)
#define LOG_INFO(logger) LSA_LOG_WITH_LEVEL((logger), ::lsa::logging::LogLevelInfo)
#define LOG_WARNING(logger) LSA_LOG_WITH_LEVEL((logger), ::lsa::logging::LogLevelWarning)
#define LOG_ERROR(logger) LSA_LOG_WITH_LEVEL((logger), ::lsa::logging::LogLevelError)
#define LOG_FATAL(logger) LSA_LOG_WITH_LEVEL((logger), ::lsa::logging::LogLevelFatal)
