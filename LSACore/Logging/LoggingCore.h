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

#include "LogSink.h"
#include "Logger.h"
#include "Metadata.h"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>


namespace lsa
{
namespace logging
{


enum SinkMode
{
   SinkModeSynchronous,
   SinkModeAsynchronous,
};


/// Routes entries from loggers to sinks.
/**
 * Synchronous sinks are written on the thread that emits the entry.
 * Asynchronous sinks are written from a single background thread, in the
 * order in which entries were emitted. Must be owned by a shared_ptr.
 */
class LoggingCore : public std::enable_shared_from_this<LoggingCore>
{
public:
   typedef std::pair<std::shared_ptr<LogSink>, SinkMode> SinkModePair;

private:
   std::mutex syncSinksMutex_;
   std::vector<std::shared_ptr<LogSink>> syncSinks_;

   std::mutex asyncMutex_;
   std::condition_variable asyncCondVar_;
   std::condition_variable drainedCondVar_;
   std::vector<std::shared_ptr<LogSink>> asyncSinks_;
   std::deque<std::pair<Metadata, std::string>> asyncQueue_;
   bool workerBusy_;
   bool stopRequested_;
   std::thread worker_;

public:
   LoggingCore();
   ~LoggingCore();

   LoggingCore(const LoggingCore&) = delete;
   LoggingCore& operator=(const LoggingCore&) = delete;

   Logger NewLogger(const std::string& componentLabel, int runHandle = 0);

   void AddSink(std::shared_ptr<LogSink> sink, SinkMode mode);
   void RemoveSink(std::shared_ptr<LogSink> sink, SinkMode mode);

   // Remove and add sinks without any entry being dropped or duplicated in
   // between. Iterators dereference to SinkModePair.
   template <typename TIter>
   void AtomicSwapSinks(TIter firstToRemove, TIter lastToRemove,
         TIter firstToAdd, TIter lastToAdd);

   // Iterators dereference to pair<SinkModePair, shared_ptr<EntryFilter>>.
   template <typename TIter>
   void AtomicSetSinkFilters(TIter first, TIter last);

   void SendEntry(const Metadata& metadata, const std::string& text);

   // Block until all queued asynchronous entries have been written.
   void Flush();

private:
   void WaitForDrainLocked(std::unique_lock<std::mutex>& lock);
   void RunAsyncWorker();

   static void RemoveFrom(std::vector<std::shared_ptr<LogSink>>& sinks,
         const std::shared_ptr<LogSink>& sink)
   {
      sinks.erase(std::remove(sinks.begin(), sinks.end(), sink), sinks.end());
   }
};


template <typename TIter>
void
LoggingCore::AtomicSwapSinks(TIter firstToRemove, TIter lastToRemove,
      TIter firstToAdd, TIter lastToAdd)
{
   std::lock_guard<std::mutex> syncLock(syncSinksMutex_);
   std::unique_lock<std::mutex> asyncLock(asyncMutex_);
   WaitForDrainLocked(asyncLock);

   for (TIter it = firstToRemove; it != lastToRemove; ++it)
   {
      if (it->second == SinkModeSynchronous)
         RemoveFrom(syncSinks_, it->first);
      else
         RemoveFrom(asyncSinks_, it->first);
   }
   for (TIter it = firstToAdd; it != lastToAdd; ++it)
   {
      if (it->second == SinkModeSynchronous)
         syncSinks_.push_back(it->first);
      else
         asyncSinks_.push_back(it->first);
   }
}


template <typename TIter>
void
LoggingCore::AtomicSetSinkFilters(TIter first, TIter last)
{
   std::lock_guard<std::mutex> syncLock(syncSinksMutex_);
   std::unique_lock<std::mutex> asyncLock(asyncMutex_);
   WaitForDrainLocked(asyncLock);

   for (TIter it = first; it != last; ++it)
      it->first.first->SetFilter(it->second);
}


} // namespace logging
} // namespace lsa
