///////////////////////////////////////////////////////////////////////////////
// FILE:          SaveDispatcher.cpp
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

#include "SaveDispatcher.h"

#include "AcquisitionDirectory.h"
#include "CoreUtils.h"
#include "Task.h"

#include <atomic>
#include <exception>
#include <utility>

namespace lsa {

const char* SaveDestinationName(SaveDestination destination)
{
   switch (destination)
   {
      case SaveDestinationPrimary: return "primary";
      case SaveDestinationSecondary: return "secondary";
   }
   return "(invalid)";
}


// Shared by the write tasks of one frame
class SaveDispatcher::FrameRecord
{
public:
   FrameRecord(std::unique_ptr<CapturedFrame> frame, int writeCount) :
      frame_(std::move(frame)),
      metadataJson_(frame_->SerializeMetadata()),
      pendingWrites_(writeCount)
   {}

   const CapturedFrame& GetFrame() const { return *frame_; }
   const std::string& GetMetadataJson() const { return metadataJson_; }

   // Returns true for the last write
   bool FinishWrite() { return --pendingWrites_ == 0; }
   void ReleaseFrame() { frame_.reset(); }

private:
   std::unique_ptr<CapturedFrame> frame_;
   const std::string metadataJson_;
   std::atomic<int> pendingWrites_;
};


class SaveDispatcher::WriteTask : public Task
{
public:
   WriteTask(SaveDispatcher& dispatcher, std::shared_ptr<FrameRecord> record,
         SaveDestination destination) :
      dispatcher_(dispatcher),
      record_(record),
      destination_(destination)
   {}

   void Execute() override
   {
      try
      {
         dispatcher_.Write(*record_, destination_);
      }
      catch (const std::exception& e)
      {
         dispatcher_.RecordFailure(*record_, destination_,
               CLSAError(std::string("Frame sink threw: ") + e.what()));
      }
      if (record_->FinishWrite())
         dispatcher_.Release(*record_);
   }

private:
   SaveDispatcher& dispatcher_;
   std::shared_ptr<FrameRecord> record_;
   SaveDestination destination_;
};


SaveDispatcher::SaveDispatcher(LSA::FrameSink& sink,
      const std::string& primaryRunDir, const std::string& secondaryRunDir,
      size_t capacity, const logging::Logger& logger) :
   sink_(sink),
   primaryRunDir_(primaryRunDir),
   secondaryRunDir_(secondaryRunDir),
   capacity_(capacity > 0 ? capacity : 1),
   logger_(logger),
   slots_(capacity_),
   inFlight_(0),
   writtenPrimary_(0),
   writtenSecondary_(0),
   warningCount_(0)
{
   primaryPool_ = std::make_unique<ThreadPool>(1, capacity_);
   if (HasSecondary())
      secondaryPool_ = std::make_unique<ThreadPool>(1, capacity_);

   LOG_DEBUG(logger_) << "Save dispatcher ready (capacity " << capacity_ <<
      " frames, primary " << ToQuotedString(primaryRunDir_) <<
      (HasSecondary() ? ", secondary " + ToQuotedString(secondaryRunDir_) :
       std::string(", no secondary")) << ")";
}


SaveDispatcher::~SaveDispatcher()
{
   Drain();
}


void
SaveDispatcher::Dispatch(std::unique_ptr<CapturedFrame> frame)
{
   if (!frame)
      throw CLSAError("Null frame dispatched", LSAERR_NullPointer);

   // Serializes the metadata; nothing is counted in flight until it succeeds
   const int writeCount = HasSecondary() ? 2 : 1;
   std::shared_ptr<FrameRecord> record =
      std::make_shared<FrameRecord>(std::move(frame), writeCount);

   // Backpressure: wait for a free slot
   if (!slots_.TryWait())
   {
      LOG_DEBUG(logger_) << "Save queue full; waiting before step " <<
         record->GetFrame().GetMetadata().stepIndex;
      slots_.Wait();
   }

   {
      std::lock_guard<std::mutex> lock(mutex_);
      ++inFlight_;
   }

   primaryPool_->Execute(
         std::make_unique<WriteTask>(*this, record, SaveDestinationPrimary));
   if (HasSecondary())
      secondaryPool_->Execute(
            std::make_unique<WriteTask>(*this, record, SaveDestinationSecondary));
}


void
SaveDispatcher::Drain()
{
   std::unique_lock<std::mutex> lock(mutex_);
   drainedCv_.wait(lock, [this] { return inFlight_ == 0; });
}


size_t
SaveDispatcher::GetInFlightCount() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return inFlight_;
}


size_t
SaveDispatcher::GetWrittenCount(SaveDestination destination) const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return destination == SaveDestinationPrimary ?
      writtenPrimary_ : writtenSecondary_;
}


bool
SaveDispatcher::HasPrimaryFailure() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return primaryFailure_ != nullptr;
}


CLSAError
SaveDispatcher::GetPrimaryFailure() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   if (!primaryFailure_)
      throw CLSAError("No primary save failure has occurred");
   return *primaryFailure_;
}


std::vector<CLSAError>
SaveDispatcher::TakeWarnings()
{
   std::vector<CLSAError> result;
   std::lock_guard<std::mutex> lock(mutex_);
   result.swap(pendingWarnings_);
   return result;
}


size_t
SaveDispatcher::GetWarningCount() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return warningCount_;
}


std::string
SaveDispatcher::DestinationPath(SaveDestination destination,
      const CapturedFrame& frame) const
{
   const std::string& runDir = destination == SaveDestinationPrimary ?
      primaryRunDir_ : secondaryRunDir_;
   return AcquisitionDirectory::Join(runDir, frame.GetMetadata().relativePath);
}


// Runs on the destination's worker thread
void
SaveDispatcher::Write(FrameRecord& record, SaveDestination destination)
{
   const CapturedFrame& frame = record.GetFrame();
   const std::string path = DestinationPath(destination, frame);

   const int ret = sink_.WriteFrame(path.c_str(), frame.GetPixels(),
         static_cast<long>(frame.GetSizeInBytes()),
         record.GetMetadataJson().c_str());

   if (ret == DEVICE_OK)
   {
      LOG_TRACE(logger_) << "Wrote " << ToQuotedString(path);
      std::lock_guard<std::mutex> lock(mutex_);
      if (destination == SaveDestinationPrimary)
         ++writtenPrimary_;
      else
         ++writtenSecondary_;
      return;
   }

   char text[LSA::MaxStrLength];
   text[0] = '\0';
   sink_.GetErrorText(ret, text);
   RecordFailure(record, destination, CLSAError(text, ret));
}


void
SaveDispatcher::RecordFailure(FrameRecord& record, SaveDestination destination,
      const CLSAError& cause)
{
   const FrameMetadata& md = record.GetFrame().GetMetadata();
   const std::string path = DestinationPath(destination, record.GetFrame());
   const bool isPrimary = destination == SaveDestinationPrimary;
   const CLSAError error("Failed to save step " + ToString(md.stepIndex) +
         " (channel " + ToQuotedString(md.channel.GetName()) + ") to " +
         SaveDestinationName(destination) + " destination " +
         ToQuotedString(path),
         isPrimary ? LSAERR_PrimarySaveFailed : LSAERR_SecondarySaveFailed,
         cause);

   std::lock_guard<std::mutex> lock(mutex_);
   if (isPrimary)
   {
      LOG_ERROR(logger_) << error.getFullMsg();
      if (!primaryFailure_)
         primaryFailure_ = std::make_unique<CLSAError>(error);
   }
   else
   {
      LOG_WARNING(logger_) << error.getFullMsg();
      pendingWarnings_.push_back(error);
      ++warningCount_;
   }
}


void
SaveDispatcher::Release(FrameRecord& record)
{
   record.ReleaseFrame();
   {
      std::lock_guard<std::mutex> lock(mutex_);
      --inFlight_;
   }
   drainedCv_.notify_all();
   slots_.Release();
}

} // namespace lsa
