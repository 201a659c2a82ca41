///////////////////////////////////////////////////////////////////////////////
// FILE:          AcquisitionCore.cpp
// PROJECT:       LSAcq
// SUBSYSTEM:     LSACore
//-----------------------------------------------------------------------------
// DESCRIPTION:   The interface to the acquisition core services.
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

#include "AcquisitionCore.h"

#include "CoreFeatures.h"
#include "CoreUtils.h"
#include "EventRelay.h"
#include "LogManager.h"

#include <utility>

/*
 * LSACore version. Increment the major version when the public interface of
 * CAcquisitionCore changes incompatibly, the minor version when it is
 * extended, and the patch version for other changes.
 */
namespace {
   const int LSACORE_VERSION_MAJOR = 1;
   const int LSACORE_VERSION_MINOR = 2;
   const int LSACORE_VERSION_PATCH = 0;

   const unsigned DefaultSaveQueueCapacity = 16;
} // anonymous namespace


CAcquisitionCore::CAcquisitionCore(LSA::StageControl* stage,
      LSA::CameraControl* camera, LSA::FilterControl* filter,
      LSA::FrameSink* sink) :
   logManager_(std::make_shared<lsa::LogManager>()),
   coreLogger_(logManager_->NewLogger("Core")),
   eventRelay_(std::make_unique<lsa::EventRelay>()),
   nextHandle_(1),
   saveQueueCapacity_(DefaultSaveQueueCapacity)
{
   if (!stage || !camera || !filter || !sink)
      throw CLSAError("Null device given to acquisition core",
            LSAERR_NullPointer);
   devices_.stage = stage;
   devices_.camera = camera;
   devices_.filter = filter;
   devices_.sink = sink;

   LOG_INFO(coreLogger_) << getVersionInfo() << " created";
}


CAcquisitionCore::~CAcquisitionCore()
{
   std::vector<RunRecord*> records;
   {
      std::lock_guard<std::mutex> lock(runsMutex_);
      for (auto& entry : runs_)
      {
         if (!entry.second->finished)
            entry.second->driver->Cancel();
         records.push_back(entry.second.get());
      }
   }
   for (RunRecord* record : records)
   {
      if (record->thread.joinable())
         record->thread.join();
   }

   LOG_INFO(coreLogger_) << "Acquisition core destroyed";
   logManager_->Flush();
}


void
CAcquisitionCore::enableFeature(const char* name, bool enable)
{
   if (!name)
      throw CLSAError("Null feature name", LSAERR_NullPointer);
   lsa::features::enableFeature(name, enable);
}


bool
CAcquisitionCore::isFeatureEnabled(const char* name)
{
   if (!name)
      throw CLSAError("Null feature name", LSAERR_NullPointer);
   return lsa::features::isFeatureEnabled(name);
}


std::string
CAcquisitionCore::getVersionInfo() const
{
   return "LSACore version " + ToString(getLSACoreVersionMajor()) + "." +
      ToString(getLSACoreVersionMinor()) + "." +
      ToString(getLSACoreVersionPatch()) +
      " (device interface " + ToString(getLSADeviceInterfaceVersion()) + ")";
}

int CAcquisitionCore::getLSACoreVersionMajor() { return LSACORE_VERSION_MAJOR; }
int CAcquisitionCore::getLSACoreVersionMinor() { return LSACORE_VERSION_MINOR; }
int CAcquisitionCore::getLSACoreVersionPatch() { return LSACORE_VERSION_PATCH; }
int CAcquisitionCore::getLSADeviceInterfaceVersion() { return LSA_DEVICE_INTERFACE_VERSION; }


void
CAcquisitionCore::registerCallback(AcqEventCallback* cb)
{
   eventRelay_->SetTarget(cb);
}


void
CAcquisitionCore::setPrimaryLogFile(const char* filename, bool truncate)
{
   logManager_->SetPrimaryLogFilename(filename ? filename : "", truncate);
}


std::string
CAcquisitionCore::getPrimaryLogFile() const
{
   return logManager_->GetPrimaryLogFilename();
}


void
CAcquisitionCore::logMessage(const char* msg)
{
   LOG_INFO(coreLogger_) << "App: " << ToString(msg);
}


void
CAcquisitionCore::logMessage(const char* msg, bool debugOnly)
{
   if (debugOnly)
   {
      LOG_DEBUG(coreLogger_) << "App: " << ToString(msg);
   }
   else
   {
      LOG_INFO(coreLogger_) << "App: " << ToString(msg);
   }
}


void
CAcquisitionCore::enableDebugLog(bool enable)
{
   logManager_->SetPrimaryLogLevel(enable ?
         lsa::logging::LogLevelDebug : lsa::logging::LogLevelInfo);
}


bool
CAcquisitionCore::debugLogEnabled() const
{
   return logManager_->GetPrimaryLogLevel() < lsa::logging::LogLevelInfo;
}


void
CAcquisitionCore::enableStderrLog(bool enable)
{
   logManager_->SetUseStdErr(enable);
}


bool
CAcquisitionCore::stderrLogEnabled() const
{
   return logManager_->IsUsingStdErr();
}


void
CAcquisitionCore::setSaveQueueCapacity(unsigned capacity)
{
   std::lock_guard<std::mutex> lock(runsMutex_);
   saveQueueCapacity_ = capacity > 0 ? capacity : 1;
   LOG_DEBUG(coreLogger_) << "Save queue capacity set to " << saveQueueCapacity_;
}


unsigned
CAcquisitionCore::getSaveQueueCapacity() const
{
   std::lock_guard<std::mutex> lock(runsMutex_);
   return saveQueueCapacity_;
}


CAcquisitionCore::RunHandle
CAcquisitionCore::startAcquisition(const lsa::AcquisitionSettings& settings,
      const std::vector<lsa::Sample>& samples, unsigned timePointCount,
      unsigned zPlaneCount)
{
   std::lock_guard<std::mutex> lock(runsMutex_);

   for (auto& entry : runs_)
   {
      if (!entry.second->finished)
         throw CLSAError("Acquisition " + ToString(entry.first) +
               " is still in progress", LSAERR_RunInProgress);
   }

   // Reap threads of finished runs; their records stay queryable
   for (auto& entry : runs_)
   {
      if (entry.second->thread.joinable())
         entry.second->thread.join();
   }

   const RunHandle handle = nextHandle_++;
   std::unique_ptr<RunRecord> record = std::make_unique<RunRecord>();
   record->driver = std::make_unique<lsa::AcquisitionDriver>(handle, devices_,
         saveQueueCapacity_, logManager_->NewLogger("Driver", handle),
         logManager_->NewLogger("Save", handle), eventRelay_.get());

   RunRecord* rec = record.get();
   runs_[handle] = std::move(record);

   LOG_INFO(coreLogger_) << "Starting acquisition " << handle << ": " <<
      timePointCount << " time point(s), " << samples.size() <<
      " sample(s), " << zPlaneCount << " plane(s)";

   rec->thread = std::thread([this, rec, settings, samples, timePointCount,
         zPlaneCount]()
   {
      try
      {
         rec->driver->Run(settings, samples, timePointCount, zPlaneCount);
      }
      catch (const CLSAError& e)
      {
         LOG_ERROR(coreLogger_) << "Acquisition " <<
            rec->driver->GetRunHandle() << " could not run: " <<
            e.getFullMsg();
      }

      {
         std::lock_guard<std::mutex> finishedLock(runsMutex_);
         rec->finished = true;
      }
      runFinishedCv_.notify_all();
   });

   return handle;
}


void
CAcquisitionCore::cancelAcquisition(RunHandle handle)
{
   std::lock_guard<std::mutex> lock(runsMutex_);
   RunRecord& record = FindRun(handle);
   if (record.finished)
   {
      LOG_DEBUG(coreLogger_) << "Cancel ignored; acquisition " << handle <<
         " has already ended";
      return;
   }
   record.driver->Cancel();
}


lsa::AcquisitionState
CAcquisitionCore::waitForAcquisition(RunHandle handle)
{
   std::unique_lock<std::mutex> lock(runsMutex_);
   RunRecord& record = FindRun(handle);
   runFinishedCv_.wait(lock, [&record] { return record.finished; });
   return record.driver->GetState();
}


lsa::AcquisitionState
CAcquisitionCore::getAcquisitionState(RunHandle handle) const
{
   std::lock_guard<std::mutex> lock(runsMutex_);
   return FindRun(handle).driver->GetState();
}


bool
CAcquisitionCore::isAcquisitionRunning() const
{
   std::lock_guard<std::mutex> lock(runsMutex_);
   for (const auto& entry : runs_)
   {
      if (!entry.second->finished)
         return true;
   }
   return false;
}


bool
CAcquisitionCore::hasAcquisitionError(RunHandle handle) const
{
   std::lock_guard<std::mutex> lock(runsMutex_);
   return FindRun(handle).driver->HasError();
}


CLSAError
CAcquisitionCore::getAcquisitionError(RunHandle handle) const
{
   std::lock_guard<std::mutex> lock(runsMutex_);
   return FindRun(handle).driver->GetError();
}


unsigned long
CAcquisitionCore::getCompletedStepCount(RunHandle handle) const
{
   std::lock_guard<std::mutex> lock(runsMutex_);
   return static_cast<unsigned long>(
         FindRun(handle).driver->GetCompletedStepCount());
}


unsigned long
CAcquisitionCore::getPlannedStepCount(RunHandle handle) const
{
   std::lock_guard<std::mutex> lock(runsMutex_);
   return static_cast<unsigned long>(
         FindRun(handle).driver->GetPlannedStepCount());
}


unsigned long
CAcquisitionCore::getWarningCount(RunHandle handle) const
{
   std::lock_guard<std::mutex> lock(runsMutex_);
   return static_cast<unsigned long>(
         FindRun(handle).driver->GetWarningCount());
}


std::string
CAcquisitionCore::getAcquisitionDirectory(RunHandle handle) const
{
   std::lock_guard<std::mutex> lock(runsMutex_);
   return FindRun(handle).driver->GetPrimaryRunDirectory();
}


CAcquisitionCore::RunRecord&
CAcquisitionCore::FindRun(RunHandle handle)
{
   auto it = runs_.find(handle);
   if (it == runs_.end())
      throw CLSAError("No such acquisition: " + ToString(handle),
            LSAERR_UnknownRunHandle);
   return *it->second;
}


const CAcquisitionCore::RunRecord&
CAcquisitionCore::FindRun(RunHandle handle) const
{
   auto it = runs_.find(handle);
   if (it == runs_.end())
      throw CLSAError("No such acquisition: " + ToString(handle),
            LSAERR_UnknownRunHandle);
   return *it->second;
}
