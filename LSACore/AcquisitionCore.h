///////////////////////////////////////////////////////////////////////////////
// FILE:          AcquisitionCore.h
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
//
// NOTES:         Public methods use lowercase names (startAcquisition())
//                rather than the GetName() convention of the rest of the
//                code, so that they read naturally when wrapped for other
//                languages.

#pragma once

#include "AcquisitionDriver.h"
#include "AcquisitionSettings.h"
#include "Error.h"
#include "Logging/Logger.h"

#include "../LSADevice/LSADevice.h"

#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

class AcqEventCallback;

namespace lsa {
   class LogManager;
   class EventRelay;
} // namespace lsa


/// The light-sheet acquisition core.
/**
 * Runs acquisitions on a control thread of its own, one at a time, using the
 * hardware given at construction. Devices are not owned and must outlive
 * the core.
 */
class CAcquisitionCore
{
public:
   typedef int RunHandle;

   // Throws CLSAError if any device is null
   CAcquisitionCore(LSA::StageControl* stage, LSA::CameraControl* camera,
         LSA::FilterControl* filter, LSA::FrameSink* sink);
   // Cancels a run in progress and waits for it to end
   ~CAcquisitionCore();

   CAcquisitionCore(const CAcquisitionCore&) = delete;
   CAcquisitionCore& operator=(const CAcquisitionCore&) = delete;

   /** \name Core feature control. */
   ///@{
   static void enableFeature(const char* name, bool enable);
   static bool isFeatureEnabled(const char* name);
   ///@}

   /** \name Version information. */
   ///@{
   std::string getVersionInfo() const;
   static int getLSACoreVersionMajor();
   static int getLSACoreVersionMinor();
   static int getLSACoreVersionPatch();
   static int getLSADeviceInterfaceVersion();
   ///@}

   /** \name Logging and notification. */
   ///@{
   void registerCallback(AcqEventCallback* cb);

   void setPrimaryLogFile(const char* filename, bool truncate = false);
   std::string getPrimaryLogFile() const;
   void logMessage(const char* msg);
   void logMessage(const char* msg, bool debugOnly);
   void enableDebugLog(bool enable);
   bool debugLogEnabled() const;
   void enableStderrLog(bool enable);
   bool stderrLogEnabled() const;
   ///@}

   /** \name Settings. */
   ///@{
   // Applies to runs started afterwards. Zero is treated as one.
   void setSaveQueueCapacity(unsigned capacity);
   unsigned getSaveQueueCapacity() const;
   ///@}

   /** \name Acquisition. */
   ///@{
   /**
    * Starts a run and returns immediately. Settings and samples are copied.
    * Configuration errors do not throw here; they end the run in the Failed
    * state. Throws CLSAError (LSAERR_RunInProgress) if another run has not
    * reached a terminal state.
    */
   RunHandle startAcquisition(const lsa::AcquisitionSettings& settings,
         const std::vector<lsa::Sample>& samples, unsigned timePointCount,
         unsigned zPlaneCount);
   void cancelAcquisition(RunHandle handle);
   // Blocks until the run is in a terminal state, and returns that state
   lsa::AcquisitionState waitForAcquisition(RunHandle handle);
   lsa::AcquisitionState getAcquisitionState(RunHandle handle) const;
   bool isAcquisitionRunning() const;
   bool hasAcquisitionError(RunHandle handle) const;
   // Throws CLSAError if the run has no error
   CLSAError getAcquisitionError(RunHandle handle) const;
   unsigned long getCompletedStepCount(RunHandle handle) const;
   unsigned long getPlannedStepCount(RunHandle handle) const;
   unsigned long getWarningCount(RunHandle handle) const;
   std::string getAcquisitionDirectory(RunHandle handle) const;
   ///@}

private:
   struct RunRecord
   {
      std::unique_ptr<lsa::AcquisitionDriver> driver;
      std::thread thread;
      bool finished = false;
   };

   RunRecord& FindRun(RunHandle handle);
   const RunRecord& FindRun(RunHandle handle) const;

   // Declared first so that logging outlives the run threads
   std::shared_ptr<lsa::LogManager> logManager_;
   lsa::logging::Logger coreLogger_;
   std::unique_ptr<lsa::EventRelay> eventRelay_;

   lsa::AcquisitionDevices devices_;

   mutable std::mutex runsMutex_;
   std::condition_variable runFinishedCv_;
   std::map<RunHandle, std::unique_ptr<RunRecord>> runs_;
   RunHandle nextHandle_;
   unsigned saveQueueCapacity_;
};
