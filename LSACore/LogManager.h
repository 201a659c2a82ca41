// PROJECT:       LSAcq
// SUBSYSTEM:     LSACore
//
// DESCRIPTION:   Facade to the logging subsystem
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

#include "Logging/Logging.h"

#include <memory>
#include <mutex>
#include <string>

namespace lsa
{

/**
 * Facade to the logging subsystem.
 *
 * Owns the logging core and the two primary sinks (stderr and the primary
 * log file), which share one level filter.
 */
class LogManager
{
   std::shared_ptr<logging::LoggingCore> loggingCore_;
   logging::Logger internalLogger_;

   mutable std::mutex mutex_;

   logging::LogLevel primaryLogLevel_;

   bool usingStdErr_;
   std::shared_ptr<logging::LogSink> stdErrSink_;

   std::string primaryFilename_;
   std::shared_ptr<logging::LogSink> primaryFileSink_;

   static const logging::SinkMode PrimarySinkMode;

public:
   LogManager();

   void SetUseStdErr(bool flag);
   bool IsUsingStdErr() const;

   // Empty filename closes the primary log file. Throws CLSAError if the
   // file cannot be opened, in which case no primary file is in use.
   void SetPrimaryLogFilename(const std::string& filename, bool truncate);
   std::string GetPrimaryLogFilename() const;
   bool IsUsingPrimaryLogFile() const;

   void SetPrimaryLogLevel(logging::LogLevel level);
   logging::LogLevel GetPrimaryLogLevel() const;

   // Wait for entries queued to asynchronous sinks
   void Flush();

   // runHandle > 0 tags every entry with the run, as "[IFO,Driver:3]"
   logging::Logger NewLogger(const std::string& label, int runHandle = 0);
};

const char* StringForLogLevel(logging::LogLevel level);

} // namespace lsa
