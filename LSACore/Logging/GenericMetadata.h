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


namespace lsa
{
namespace logging
{
namespace internal
{


// Bundles the three kinds of per-entry data. The logger data is fixed for
// the lifetime of a logger, the entry data is supplied with each entry, and
// the stamp data is captured at the moment the entry is created.
template <typename TLoggerData, typename TEntryData, typename TStampData>
class GenericMetadata
{
public:
   typedef TLoggerData LoggerDataType;
   typedef TEntryData EntryDataType;
   typedef TStampData StampDataType;

private:
   LoggerDataType loggerData_;
   EntryDataType entryData_;
   StampDataType stampData_;

public:
   GenericMetadata(const LoggerDataType& loggerData,
         const EntryDataType& entryData,
         const StampDataType& stampData) :
      loggerData_(loggerData),
      entryData_(entryData),
      stampData_(stampData)
   {}

   const LoggerDataType& GetLoggerData() const { return loggerData_; }
   const EntryDataType& GetEntryData() const { return entryData_; }
   const StampDataType& GetStampData() const { return stampData_; }
};


} // namespace internal
} // namespace logging
} // namespace lsa
