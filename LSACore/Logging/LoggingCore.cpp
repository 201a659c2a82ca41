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

#include "LoggingCore.h"


namespace lsa
{
namespace logging
{


void
Logger::operator()(LogLevel level, const std::string& text) const
{
   StampData stampData;
   stampData.Stamp();
   core_->SendEntry(Metadata(loggerData_, level, stampData), text);
}


LoggingCore::LoggingCore() :
   workerBusy_(false),
   stopRequested_(false)
{
   worker_ = std::thread(&LoggingCore::RunAsyncWorker, this);
}


LoggingCore::~LoggingCore()
{
   {
      std::lock_guard<std::mutex> lock(asyncMutex_);
      stopRequested_ = true;
   }
   asyncCondVar_.notify_all();
   worker_.join();
}


Logger
LoggingCore::NewLogger(const std::string& componentLabel, int runHandle)
{
   return Logger(shared_from_this(), LoggerData(componentLabel, runHandle));
}


void
LoggingCore::AddSink(std::shared_ptr<LogSink> sink, SinkMode mode)
{
   if (mode == SinkModeSynchronous)
   {
      std::lock_guard<std::mutex> lock(syncSinksMutex_);
      syncSinks_.push_back(sink);
   }
   else
   {
      std::unique_lock<std::mutex> lock(asyncMutex_);
      WaitForDrainLocked(lock);
      asyncSinks_.push_back(sink);
   }
}


void
LoggingCore::RemoveSink(std::shared_ptr<LogSink> sink, SinkMode mode)
{
   if (mode == SinkModeSynchronous)
   {
      std::lock_guard<std::mutex> lock(syncSinksMutex_);
      RemoveFrom(syncSinks_, sink);
   }
   else
   {
      // Entries emitted before removal still reach the sink.
      std::unique_lock<std::mutex> lock(asyncMutex_);
      WaitForDrainLocked(lock);
      RemoveFrom(asyncSinks_, sink);
   }
}


void
LoggingCore::SendEntry(const Metadata& metadata, const std::string& text)
{
   {
      std::lock_guard<std::mutex> lock(syncSinksMutex_);
      for (const std::shared_ptr<LogSink>& sink : syncSinks_)
         sink->Consume(metadata, text);
   }

   {
      std::lock_guard<std::mutex> lock(asyncMutex_);
      if (asyncSinks_.empty())
         return;
      asyncQueue_.push_back(std::make_pair(metadata, text));
   }
   asyncCondVar_.notify_one();
}


void
LoggingCore::Flush()
{
   std::unique_lock<std::mutex> lock(asyncMutex_);
   WaitForDrainLocked(lock);
}


void
LoggingCore::WaitForDrainLocked(std::unique_lock<std::mutex>& lock)
{
   drainedCondVar_.wait(lock,
         [this] { return asyncQueue_.empty() && !workerBusy_; });
}


void
LoggingCore::RunAsyncWorker()
{
   std::deque<std::pair<Metadata, std::string>> batch;
   std::vector<std::shared_ptr<LogSink>> sinks;

   for (;;)
   {
      {
         std::unique_lock<std::mutex> lock(asyncMutex_);
         workerBusy_ = false;
         drainedCondVar_.notify_all();
         asyncCondVar_.wait(lock,
               [this] { return stopRequested_ || !asyncQueue_.empty(); });
         if (asyncQueue_.empty()) // Stop requested and nothing left
            return;
         batch.swap(asyncQueue_);
         sinks = asyncSinks_;
         workerBusy_ = true;
      }

      for (const std::pair<Metadata, std::string>& entry : batch)
      {
         for (const std::shared_ptr<LogSink>& sink : sinks)
            sink->Consume(entry.first, entry.second);
      }
      batch.clear();
      sinks.clear();
   }
}


} // namespace logging
} // namespace lsa
