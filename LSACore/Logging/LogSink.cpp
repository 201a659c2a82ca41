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

#include "LogSink.h"

#include <iostream>


namespace lsa
{
namespace logging
{

namespace internal
{

std::vector<std::string>
SplitEntryIntoLines(const std::string& text)
{
   std::vector<std::string> lines;
   std::string current;
   for (std::string::size_type i = 0; i < text.size(); ++i)
   {
      const char ch = text[i];
      if (ch == '\r' || ch == '\n')
      {
         if (ch == '\r' && i + 1 < text.size() && text[i + 1] == '\n')
            ++i;
         lines.push_back(current);
         current.clear();
      }
      else
      {
         current += ch;
      }
   }
   lines.push_back(current);

   while (lines.size() > 1 && lines.back().empty())
      lines.pop_back();
   return lines;
}

} // namespace internal


void
LogSink::SetFilter(std::shared_ptr<EntryFilter> filter)
{
   std::lock_guard<std::mutex> lock(filterMutex_);
   filter_ = filter;
}


std::shared_ptr<EntryFilter>
LogSink::GetFilter() const
{
   std::lock_guard<std::mutex> lock(filterMutex_);
   return filter_;
}


void
LogSink::Consume(const Metadata& metadata, const std::string& text)
{
   std::shared_ptr<EntryFilter> filter = GetFilter();
   if (filter && !filter->Filter(metadata))
      return;
   Write(metadata, text);
}


void
StreamLogSink::WriteLines(std::ostream& stream, const Metadata& metadata,
      const std::string& text)
{
   const std::vector<std::string> lines = internal::SplitEntryIntoLines(text);
   for (std::vector<std::string>::size_type i = 0; i < lines.size(); ++i)
   {
      if (i == 0)
         formatter_.FormatLinePrefix(stream, metadata);
      else
         formatter_.FormatContinuationPrefix(stream);
      stream << ' ' << lines[i] << '\n';
   }
}


void
StdErrLogSink::Write(const Metadata& metadata, const std::string& text)
{
   WriteLines(std::clog, metadata, text);
}


FileLogSink::FileLogSink(const std::string& filename, bool append) :
   filename_(filename)
{
   std::ios_base::openmode mode = std::ios_base::out;
   mode |= (append ? std::ios_base::app : std::ios_base::trunc);

   fileStream_.open(filename_.c_str(), mode);
   if (!fileStream_)
      throw CannotOpenFileException(filename_);
}


FileLogSink::~FileLogSink()
{
   fileStream_.flush();
}


void
FileLogSink::Write(const Metadata& metadata, const std::string& text)
{
   WriteLines(fileStream_, metadata, text);
   fileStream_.flush();
}


} // namespace logging
} // namespace lsa
