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
#include "MetadataFormatter.h"

#include <fstream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>


namespace lsa
{
namespace logging
{


class EntryFilter
{
public:
   virtual ~EntryFilter() {}
   virtual bool Filter(const Metadata& metadata) const = 0;
};


class LevelFilter : public EntryFilter
{
   LogLevel minLevel_;

public:
   explicit LevelFilter(LogLevel minLevel) : minLevel_(minLevel) {}

   virtual bool Filter(const Metadata& metadata) const
   { return metadata.GetEntryData().GetLevel() >= minLevel_; }
};


class CannotOpenFileException : public std::runtime_error
{
public:
   explicit CannotOpenFileException(const std::string& filename) :
      std::runtime_error("Cannot open log file: " + filename)
   {}
};


namespace internal
{

// Split entry text at line breaks. CRLF counts as a single break, CR and LF
// alone each count as one. Trailing breaks are dropped, and the result
// always contains at least one (possibly empty) line.
std::vector<std::string> SplitEntryIntoLines(const std::string& text);

} // namespace internal


/// Destination of log entries.
/**
 * Consume() is never called concurrently for the same sink: the logging
 * core serializes calls to synchronous sinks, and asynchronous sinks are
 * only called from the core's worker thread.
 */
class LogSink
{
   mutable std::mutex filterMutex_;
   std::shared_ptr<EntryFilter> filter_;

public:
   virtual ~LogSink() {}

   void SetFilter(std::shared_ptr<EntryFilter> filter);
   std::shared_ptr<EntryFilter> GetFilter() const;

   // Apply filter and forward to Write().
   void Consume(const Metadata& metadata, const std::string& text);

protected:
   virtual void Write(const Metadata& metadata, const std::string& text) = 0;
};


/// Base for sinks writing formatted lines to a std::ostream.
class StreamLogSink : public LogSink
{
   internal::MetadataFormatter formatter_;

protected:
   void WriteLines(std::ostream& stream, const Metadata& metadata,
         const std::string& text);
};


class StdErrLogSink : public StreamLogSink
{
protected:
   virtual void Write(const Metadata& metadata, const std::string& text);
};


class FileLogSink : public StreamLogSink
{
   std::string filename_;
   std::ofstream fileStream_;

public:
   // Throws CannotOpenFileException
   FileLogSink(const std::string& filename, bool append = false);
   virtual ~FileLogSink();

   const std::string& GetFilename() const { return filename_; }

protected:
   virtual void Write(const Metadata& metadata, const std::string& text);
};


} // namespace logging
} // namespace lsa
