///////////////////////////////////////////////////////////////////////////////
// FILE:          AcquisitionDriver.h
// PROJECT:       LSAcq
// SUBSYSTEM:     LSACore
//-----------------------------------------------------------------------------
// DESCRIPTION:   State machine executing one acquisition run
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

#include "AcquisitionPlan.h"
#include "AcquisitionSettings.h"
#include "CapturedFrame.h"
#include "Error.h"
#include "Logging/Logger.h"

#include "../LSADevice/LSADevice.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class AcqEventCallback;

namespace lsa {

class SaveDispatcher;

enum AcquisitionState {
   AcquisitionStateIdle,
   AcquisitionStateValidating,
   AcquisitionStatePlanning,
   AcquisitionStateRunning,
   AcquisitionStateCompleted,
   AcquisitionStateAborted,
   AcquisitionStateFailed,
};

const char* AcquisitionStateName(AcquisitionState state);
bool IsTerminalState(AcquisitionState state);

// Required free space at the primary destination beyond the run's own data
const unsigned long DiskSpaceMarginMB = 5000;


struct AcquisitionDevices
{
   LSA::StageControl* stage;
   LSA::CameraControl* camera;
   LSA::FilterControl* filter;
   LSA::FrameSink* sink;
};


/// Executes one run: Idle -> Validating -> Planning -> Running, ending in
/// Completed, Aborted or Failed.
/**
 * One instance per run. Run() executes the whole state machine on the
 * calling thread; Cancel() and the getters may be called from any thread.
 * Events are delivered to the callback from the thread executing Run().
 */
class AcquisitionDriver
{
public:
   // Throws CLSAError if a device is null. callback may be null.
   AcquisitionDriver(int runHandle, const AcquisitionDevices& devices,
         size_t saveQueueCapacity, const logging::Logger& logger,
         const logging::Logger& saveLogger, AcqEventCallback* callback);
   ~AcquisitionDriver();

   AcquisitionDriver(const AcquisitionDriver&) = delete;
   AcquisitionDriver& operator=(const AcquisitionDriver&) = delete;

   /**
    * Returns the terminal state. Errors of the run are reported through the
    * Failed state and GetError(), not thrown. Throws CLSAError
    * (LSAERR_InvalidRunState) if the driver is not Idle.
    */
   AcquisitionState Run(const AcquisitionSettings& settings,
         const std::vector<Sample>& samples, size_t timePointCount,
         size_t zPlaneCount);

   // Takes effect at the next step boundary, or ends a time point wait.
   void Cancel();
   bool IsCancelRequested() const { return cancelRequested_; }

   int GetRunHandle() const { return runHandle_; }
   AcquisitionState GetState() const;
   bool HasError() const;
   // Throws CLSAError (LSAERR_GENERIC) if the run has no error
   CLSAError GetError() const;

   size_t GetCompletedStepCount() const { return completedSteps_; }
   size_t GetPlannedStepCount() const { return plannedSteps_; }
   size_t GetWarningCount() const { return warningCount_; }
   std::string GetPrimaryRunDirectory() const;
   std::string GetSecondaryRunDirectory() const;

private:
   void SetState(AcquisitionState state);
   void Fail(const CLSAError& error);

   void PrepareDestinations(const AcquisitionSettings& settings,
         const AcquisitionPlan& plan);
   void CheckFreeSpace(const AcquisitionPlan& plan);
   void ArmCamera(const AcquisitionSettings& settings);

   // Returns false if cancelled
   bool ExecuteSteps(const AcquisitionPlan& plan,
         const AcquisitionSettings& settings,
         const std::vector<Sample>& samples, SaveDispatcher& dispatcher);
   bool WaitUntil(std::chrono::steady_clock::time_point deadline);
   std::unique_ptr<CapturedFrame> CaptureFrame(const AcquisitionStep& step,
         size_t stepIndex, size_t stepCount,
         const AcquisitionSettings& settings, const std::string& sampleLabel);
   void EmitWarnings(SaveDispatcher& dispatcher);

   // Throws CLSAError chaining the device's error text
   void ThrowIfDeviceError(int ret, const LSA::Device& device, int code,
         const std::string& action) const;

   const int runHandle_;
   const AcquisitionDevices devices_;
   const size_t saveQueueCapacity_;
   logging::Logger logger_;
   logging::Logger saveLogger_;
   AcqEventCallback* callback_;

   mutable std::mutex mutex_;
   std::condition_variable cancelCv_;
   std::atomic<bool> cancelRequested_;
   AcquisitionState state_;
   std::unique_ptr<CLSAError> error_;
   std::string primaryRunDir_;
   std::string secondaryRunDir_;

   std::atomic<size_t> completedSteps_;
   std::atomic<size_t> plannedSteps_;
   std::atomic<size_t> warningCount_;
};

} // namespace lsa
