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

#include "GenericMetadata.h"

#include <chrono>
#include <string>
#include <thread>


namespace lsa
{
namespace logging
{


enum LogLevel
{
   LogLevelTrace,
   LogLevelDebug,
   LogLevelInfo,
   LogLevelWarning,
   LogLevelError,
   LogLevelFatal,
};


typedef std::chrono::system_clock::time_point LogTimestamp;


class EntryData
{
   LogLevel level_;

public:
   // Implicitly construct from LogLevel
   EntryData(LogLevel level) : level_(level) {}

   LogLevel GetLevel() const { return level_; }
};


// Taken on the emitting thread; the asynchronous sinks format it later.
class StampData
{
   LogTimestamp time_;
   std::thread::id tid_;

public:
   void Stamp()
   {
      time_ = std::chrono::system_clock::now();
      tid_ = std::this_thread::get_id();
   }

   LogTimestamp GetTimestamp() const { return time_; }
   std::thread::id GetThreadId() const { return tid_; }
};


// The component label, plus the acquisition run the logger belongs to
// (0 for components that outlive runs, such as the core itself).
class LoggerData
{
   const char* component_;
   int runHandle_;

public:
   // Construct implicitly from strings
   LoggerData(const char* componentLabel, int runHandle = 0) :
      component_(InternString(componentLabel)),
      runHandle_(runHandle)
   {}
   LoggerData(const std::string& componentLabel, int runHandle = 0) :
      component_(InternString(componentLabel)),
      runHandle_(runHandle)
   {}

   const char* GetComponentLabel() const { return component_; }
   int GetRunHandle() const { return runHandle_; }
   bool HasRunHandle() const { return runHandle_ > 0; }

private:
   static const char* InternString(const std::string& s);
};


typedef internal::GenericMetadata<LoggerData, EntryData, StampData> Metadata;


} // namespace logging
} // namespace lsa
