///////////////////////////////////////////////////////////////////////////////
// FILE:          SaveDispatcher.h
// PROJECT:       LSAcq
// SUBSYSTEM:     LSACore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Asynchronous persistence of captured frames to a primary
//                and an optional secondary destination
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

#include "CapturedFrame.h"
#include "Error.h"
#include "Logging/Logger.h"
#include "Semaphore.h"
#include "ThreadPool.h"

#include "../LSADevice/LSADevice.h"

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace lsa {

enum SaveDestination {
   SaveDestinationPrimary,
   SaveDestinationSecondary,
};

const char* SaveDestinationName(SaveDestination destination);


/// Writes each dispatched frame to every configured destination.
/**
 * Each destination has its own single worker thread, so writes to one
 * destination happen in dispatch order. At most capacity frames are in
 * flight; Dispatch() blocks until a slot is free. A frame is released once
 * all of its writes have finished, successfully or not.
 *
 * A failed primary write is recorded and reported by GetPrimaryFailure().
 * A failed secondary write becomes a warning, collected by TakeWarnings().
 */
class SaveDispatcher
{
public:
   // secondaryRunDir empty means no secondary destination.
   SaveDispatcher(LSA::FrameSink& sink, const std::string& primaryRunDir,
         const std::string& secondaryRunDir, size_t capacity,
         const logging::Logger& logger);
   ~SaveDispatcher();

   SaveDispatcher(const SaveDispatcher&) = delete;
   SaveDispatcher& operator=(const SaveDispatcher&) = delete;

   void Dispatch(std::unique_ptr<CapturedFrame> frame);

   // Blocks until every dispatched frame has been released.
   void Drain();

   bool HasSecondary() const { return !secondaryRunDir_.empty(); }
   size_t GetCapacity() const { return capacity_; }
   size_t GetInFlightCount() const;
   size_t GetWrittenCount(SaveDestination destination) const;

   bool HasPrimaryFailure() const;
   // Throws CLSAError (LSAERR_GENERIC) if there was no primary failure
   CLSAError GetPrimaryFailure() const;

   // Warnings raised since the last call, in the order they occurred
   std::vector<CLSAError> TakeWarnings();
   size_t GetWarningCount() const;

private:
   class FrameRecord;
   class WriteTask;

   void Write(FrameRecord& record, SaveDestination destination);
   void RecordFailure(FrameRecord& record, SaveDestination destination,
         const CLSAError& cause);
   void Release(FrameRecord& record);
   std::string DestinationPath(SaveDestination destination,
         const CapturedFrame& frame) const;

   LSA::FrameSink& sink_;
   const std::string primaryRunDir_;
   const std::string secondaryRunDir_;
   const size_t capacity_;
   logging::Logger logger_;

   Semaphore slots_;

   mutable std::mutex mutex_;
   std::condition_variable drainedCv_;
   size_t inFlight_;
   size_t writtenPrimary_;
   size_t writtenSecondary_;
   std::unique_ptr<CLSAError> primaryFailure_;
   std::vector<CLSAError> pendingWarnings_;
   size_t warningCount_;

   // Declared last: workers must stop before the state above goes away
   std::unique_ptr<ThreadPool> primaryPool_;
   std::unique_ptr<ThreadPool> secondaryPool_;
};

} // namespace lsa
