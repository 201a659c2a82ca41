///////////////////////////////////////////////////////////////////////////////
// FILE:          AcquisitionDriver.cpp
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

#include "AcquisitionDriver.h"

#include "AcqEventCallback.h"
#include "AcquisitionDirectory.h"
#include "CoreFeatures.h"
#include "CoreUtils.h"
#include "LoopOrderPlanner.h"
#include "SaveDispatcher.h"
#include "TimingValidator.h"

#include <algorithm>
#include <cmath>
#include <exception>

namespace lsa {

const char* AcquisitionStateName(AcquisitionState state)
{
   switch (state)
   {
      case AcquisitionStateIdle: return "Idle";
      case AcquisitionStateValidating: return "Validating";
      case AcquisitionStatePlanning: return "Planning";
      case AcquisitionStateRunning: return "Running";
      case AcquisitionStateCompleted: return "Completed";
      case AcquisitionStateAborted: return "Aborted";
      case AcquisitionStateFailed: return "Failed";
   }
   return "(invalid)";
}

bool IsTerminalState(AcquisitionState state)
{
   return state == AcquisitionStateCompleted ||
      state == AcquisitionStateAborted ||
      state == AcquisitionStateFailed;
}


namespace {

std::string DescribeStep(const AcquisitionStep& step, size_t stepIndex)
{
   return "Step " + ToString(stepIndex) +
      " (time point " + ToString(step.GetTimePointIndex()) +
      ", sample " + ToString(step.GetSampleIndex()) +
      ", plane " + ToString(step.GetZPlaneIndex()) +
      ", channel " + ToQuotedString(step.GetChannel().GetName()) + ")";
}

// Settings bound the interval; clamp again so the conversion cannot overflow
std::chrono::milliseconds IntervalDuration(double minutes)
{
   if (!(minutes > 0.0))
      return std::chrono::milliseconds(0);
   const double ms = std::min(minutes, MaxTimePointIntervalMin) * 60000.0;
   return std::chrono::milliseconds(static_cast<long long>(std::llround(ms)));
}

} // anonymous namespace


AcquisitionDriver::AcquisitionDriver(int runHandle,
      const AcquisitionDevices& devices, size_t saveQueueCapacity,
      const logging::Logger& logger, const logging::Logger& saveLogger,
      AcqEventCallback* callback) :
   runHandle_(runHandle),
   devices_(devices),
   saveQueueCapacity_(saveQueueCapacity),
   logger_(logger),
   saveLogger_(saveLogger),
   callback_(callback),
   cancelRequested_(false),
   state_(AcquisitionStateIdle),
   completedSteps_(0),
   plannedSteps_(0),
   warningCount_(0)
{
   if (!devices_.stage || !devices_.camera || !devices_.filter ||
         !devices_.sink)
      throw CLSAError("Acquisition requires stage, camera, filter and frame "
            "sink devices", LSAERR_NullPointer);
}


AcquisitionDriver::~AcquisitionDriver()
{
}


AcquisitionState
AcquisitionDriver::Run(const AcquisitionSettings& settings,
      const std::vector<Sample>& samples, size_t timePointCount,
      size_t zPlaneCount)
{
   {
      std::lock_guard<std::mutex> lock(mutex_);
      if (state_ != AcquisitionStateIdle)
         throw CLSAError("Run " + ToString(runHandle_) + " cannot start from "
               "state " + AcquisitionStateName(state_) +
               "; use a new driver for each run", LSAERR_InvalidRunState);
   }

   try
   {
      SetState(AcquisitionStateValidating);
      LOG_INFO(logger_) << "Run " << runHandle_ << " settings: " <<
         settings.Describe();
      ValidateSettings(settings);

      SetState(AcquisitionStatePlanning);
      const AcquisitionPlan plan = LoopOrderPlanner(settings).Plan(samples,
            timePointCount, zPlaneCount);
      if (plan.IsEmpty())
         throw CLSAError("Nothing to acquire: " + ToString(timePointCount) +
               " time point(s), " + ToString(zPlaneCount) + " plane(s), " +
               ToString(plan.GetDimensions().sampleCount) + " of " +
               ToString(samples.size()) + " sample(s) enabled",
               LSAERR_EmptyPlan);
      plannedSteps_ = plan.Size();
      LOG_INFO(logger_) << "Run " << runHandle_ << " plan: " << plan.Describe();

      PrepareDestinations(settings, plan);

      SetState(AcquisitionStateRunning);
      ArmCamera(settings);

      bool finished = false;
      {
         SaveDispatcher dispatcher(*devices_.sink, GetPrimaryRunDirectory(),
               GetSecondaryRunDirectory(), saveQueueCapacity_, saveLogger_);
         try
         {
            finished = ExecuteSteps(plan, settings, samples, dispatcher);
         }
         catch (const std::exception&)
         {
            LOG_INFO(logger_) << "Halting run " << runHandle_ <<
               "; waiting for " << dispatcher.GetInFlightCount() <<
               " dispatched frame(s) to be saved";
            dispatcher.Drain();
            EmitWarnings(dispatcher);
            throw;
         }

         LOG_DEBUG(logger_) << "Waiting for " << dispatcher.GetInFlightCount() <<
            " frame(s) to be saved";
         dispatcher.Drain();
         EmitWarnings(dispatcher);
         if (dispatcher.HasPrimaryFailure())
            throw dispatcher.GetPrimaryFailure();
      }

      SetState(finished ? AcquisitionStateCompleted : AcquisitionStateAborted);
   }
   catch (const CLSAError& e)
   {
      Fail(e);
   }
   catch (const std::exception& e)
   {
      Fail(CLSAError(std::string("Unexpected error: ") + e.what()));
   }

   return GetState();
}


void
AcquisitionDriver::Cancel()
{
   {
      std::lock_guard<std::mutex> lock(mutex_);
      cancelRequested_ = true;
   }
   cancelCv_.notify_all();
   LOG_INFO(logger_) << "Cancel requested for run " << runHandle_;
}


AcquisitionState
AcquisitionDriver::GetState() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return state_;
}


bool
AcquisitionDriver::HasError() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return error_ != nullptr;
}


CLSAError
AcquisitionDriver::GetError() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   if (!error_)
      throw CLSAError("Run " + ToString(runHandle_) + " has no error");
   return *error_;
}


std::string
AcquisitionDriver::GetPrimaryRunDirectory() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return primaryRunDir_;
}


std::string
AcquisitionDriver::GetSecondaryRunDirectory() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return secondaryRunDir_;
}


void
AcquisitionDriver::SetState(AcquisitionState state)
{
   AcquisitionState oldState;
   {
      std::lock_guard<std::mutex> lock(mutex_);
      oldState = state_;
      state_ = state;
   }

   LOG_INFO(logger_) << "Run " << runHandle_ << ": " <<
      AcquisitionStateName(oldState) << " -> " << AcquisitionStateName(state);

   if (!callback_)
      return;
   callback_->onAcquisitionStateChanged(runHandle_, AcquisitionStateName(state));
   if (state == AcquisitionStateCompleted)
      callback_->onAcquisitionCompleted(runHandle_);
   else if (state == AcquisitionStateAborted)
      callback_->onAcquisitionAborted(runHandle_);
}


void
AcquisitionDriver::Fail(const CLSAError& error)
{
   LOG_ERROR(logger_) << "Run " << runHandle_ << " failed (" <<
      ErrorClassName(ClassifyError(error.getCode())) << "): " <<
      error.getFullMsg();
   {
      std::lock_guard<std::mutex> lock(mutex_);
      error_ = std::make_unique<CLSAError>(error);
   }
   SetState(AcquisitionStateFailed);
   if (callback_)
      callback_->onAcquisitionFailed(runHandle_, error.getCode(),
            error.getFullMsg().c_str());
}


void
AcquisitionDriver::PrepareDestinations(const AcquisitionSettings& settings,
      const AcquisitionPlan& plan)
{
   const features::Flags flags = features::flags();

   const std::string primaryDir =
      AcquisitionDirectory::UniqueRunPath(settings.GetPrimarySavePath());
   int ret = devices_.sink->PrepareDestination(primaryDir.c_str());
   if (ret != DEVICE_OK)
   {
      char text[LSA::MaxStrLength];
      text[0] = '\0';
      devices_.sink->GetErrorText(ret, text);
      throw CLSAError("Primary save path " + ToQuotedString(primaryDir) +
            " is not usable", LSAERR_SavePathUnreachable, CLSAError(text, ret));
   }
   {
      std::lock_guard<std::mutex> lock(mutex_);
      primaryRunDir_ = primaryDir;
   }
   LOG_INFO(logger_) << "Saving to " << ToQuotedString(primaryDir);

   if (settings.IsSecondSavePathEnabled())
   {
      const std::string secondaryDir =
         AcquisitionDirectory::UniqueRunPath(settings.GetSecondSavePath());
      if (flags.secondSavePathReachabilityCheck)
      {
         ret = devices_.sink->PrepareDestination(secondaryDir.c_str());
         if (ret != DEVICE_OK)
         {
            char text[LSA::MaxStrLength];
            text[0] = '\0';
            devices_.sink->GetErrorText(ret, text);
            throw CLSAError("Second save path " +
                  ToQuotedString(secondaryDir) + " is not reachable",
                  LSAERR_SecondSavePathUnreachable, CLSAError(text, ret));
         }
      }
      {
         std::lock_guard<std::mutex> lock(mutex_);
         secondaryRunDir_ = secondaryDir;
      }
      LOG_INFO(logger_) << "Also saving to " << ToQuotedString(secondaryDir);
   }

   if (flags.diskSpaceCheck)
      CheckFreeSpace(plan);
}


void
AcquisitionDriver::CheckFreeSpace(const AcquisitionPlan& plan)
{
   const double frameBytes =
      static_cast<double>(devices_.camera->GetImageBufferSize());
   const double runMB = std::ceil(frameBytes * plan.Size() / (1024.0 * 1024.0));
   const double requiredMB = runMB + DiskSpaceMarginMB;

   const std::string primaryDir = GetPrimaryRunDirectory();
   const double freeMB =
      static_cast<double>(AcquisitionDirectory::GetFreeMegabytes(primaryDir));
   LOG_DEBUG(logger_) << "Disk space at " << ToQuotedString(primaryDir) <<
      ": " << freeMB << " MB free, " << requiredMB << " MB required";
   if (freeMB < requiredMB)
      throw CLSAError("Not enough disk space at " + ToQuotedString(primaryDir) +
            ": " + ToString(freeMB) + " MB free, " + ToString(requiredMB) +
            " MB required (including " + ToString(DiskSpaceMarginMB) +
            " MB margin)", LSAERR_InsufficientDiskSpace);
}


void
AcquisitionDriver::ArmCamera(const AcquisitionSettings& settings)
{
   LSA::CameraControl& camera = *devices_.camera;

   int ret = camera.SetLightSheetReadout(settings.IsLsrmEnabled());
   ThrowIfDeviceError(ret, camera, LSAERR_CameraCommandFailed,
         std::string(settings.IsLsrmEnabled() ? "Enabling" : "Disabling") +
         " light-sheet readout");

   const double exposureMs = settings.GetCaptureExposureMs();
   const LSA::TriggerMode mode = settings.GetTriggerMode();
   ret = camera.Arm(exposureMs, mode);
   ThrowIfDeviceError(ret, camera, LSAERR_CameraCommandFailed,
         "Arming camera (" + ToString(exposureMs) + " ms, " +
         ToString(mode) + " trigger)");

   LOG_DEBUG(logger_) << "Camera armed: " << exposureMs << " ms, " <<
      ToString(mode) << " trigger, LSRM " <<
      (settings.IsLsrmEnabled() ? "on" : "off");
}


bool
AcquisitionDriver::ExecuteSteps(const AcquisitionPlan& plan,
      const AcquisitionSettings& settings, const std::vector<Sample>& samples,
      SaveDispatcher& dispatcher)
{
   const size_t stepCount = plan.Size();
   const bool isZStack = settings.GetCaptureKind() == CaptureKindZStack;
   const std::chrono::milliseconds interval =
      IntervalDuration(settings.GetTimePointIntervalMin());

   bool haveStep = false;
   size_t lastSample = 0;
   size_t lastPlane = 0;
   size_t lastTimePoint = 0;
   std::chrono::steady_clock::time_point timePointStart;
   bool haveChannel = false;
   Channel activeChannel;

   for (size_t i = 0; i < stepCount; ++i)
   {
      const AcquisitionStep& step = plan.At(i);

      EmitWarnings(dispatcher);
      if (cancelRequested_)
      {
         LOG_INFO(logger_) << "Run " << runHandle_ << " cancelled before step " <<
            i << " of " << stepCount;
         return false;
      }
      if (dispatcher.HasPrimaryFailure())
         throw dispatcher.GetPrimaryFailure();

      // A series is the run for TIME_SAMP and one sample for SAMP_TIME
      const bool sameSeries = haveStep &&
         (plan.GetOrder() == AcquisitionOrderTimeSamp ||
          step.GetSampleIndex() == lastSample);
      const bool newTimePoint = !haveStep ||
         step.GetTimePointIndex() != lastTimePoint || !sameSeries;
      if (newTimePoint)
      {
         if (sameSeries && interval.count() > 0)
         {
            const std::chrono::steady_clock::time_point deadline =
               timePointStart + interval;
            if (deadline > std::chrono::steady_clock::now())
            {
               LOG_INFO(logger_) << "Waiting for time point " <<
                  step.GetTimePointIndex();
               if (!WaitUntil(deadline))
               {
                  LOG_INFO(logger_) << "Run " << runHandle_ <<
                     " cancelled while waiting for time point " <<
                     step.GetTimePointIndex();
                  return false;
               }
            }
         }
         timePointStart = std::chrono::steady_clock::now();
         LOG_DEBUG(logger_) << "Starting time point " <<
            step.GetTimePointIndex() << " (sample " << step.GetSampleIndex() << ")";
      }

      const bool move = !haveStep || step.GetSampleIndex() != lastSample ||
         (isZStack && step.GetZPlaneIndex() != lastPlane);
      if (move)
      {
         int ret = devices_.stage->MoveTo(step.GetPosition());
         ThrowIfDeviceError(ret, *devices_.stage, LSAERR_StageCommandFailed,
               DescribeStep(step, i) + ": moving stage to " +
               ToString(step.GetPosition()));
      }

      if (!haveChannel || step.GetChannel() != activeChannel)
      {
         int ret = devices_.filter->Select(step.GetChannel().GetPreset().c_str());
         ThrowIfDeviceError(ret, *devices_.filter, LSAERR_FilterCommandFailed,
               DescribeStep(step, i) + ": selecting preset " +
               ToQuotedString(step.GetChannel().GetPreset()));
         activeChannel = step.GetChannel();
         haveChannel = true;
      }

      haveStep = true;
      lastSample = step.GetSampleIndex();
      lastPlane = step.GetZPlaneIndex();
      lastTimePoint = step.GetTimePointIndex();

      std::unique_ptr<CapturedFrame> frame = CaptureFrame(step, i, stepCount,
            settings, samples[step.GetSampleIndex()].label);
      dispatcher.Dispatch(std::move(frame));

      ++completedSteps_;
      if (callback_)
         callback_->onStepCompleted(runHandle_, static_cast<long>(i),
               static_cast<long>(stepCount));
   }
   return true;
}


bool
AcquisitionDriver::WaitUntil(std::chrono::steady_clock::time_point deadline)
{
   std::unique_lock<std::mutex> lock(mutex_);
   return !cancelCv_.wait_until(lock, deadline,
         [this] { return cancelRequested_.load(); });
}


std::unique_ptr<CapturedFrame>
AcquisitionDriver::CaptureFrame(const AcquisitionStep& step, size_t stepIndex,
      size_t stepCount, const AcquisitionSettings& settings,
      const std::string& sampleLabel)
{
   LSA::CameraControl& camera = *devices_.camera;

   int ret = camera.Capture();
   ThrowIfDeviceError(ret, camera, LSAERR_CameraCommandFailed,
         DescribeStep(step, stepIndex) + ": capturing frame");

   const unsigned char* pixels = camera.GetImageBuffer();
   const long size = camera.GetImageBufferSize();
   if (!pixels || size <= 0)
      throw CLSAError(DescribeStep(step, stepIndex) +
            ": camera returned no image data", LSAERR_CameraCommandFailed);

   FrameMetadata md;
   md.stepIndex = stepIndex;
   md.stepCount = stepCount;
   md.timePointIndex = step.GetTimePointIndex();
   md.sampleIndex = step.GetSampleIndex();
   md.zPlaneIndex = step.GetZPlaneIndex();
   md.sampleLabel = sampleLabel;
   md.channel = step.GetChannel();
   md.position = step.GetPosition();
   md.captureKind = settings.GetCaptureKind();
   md.exposureMs = settings.GetCaptureExposureMs();
   md.triggerMode = settings.GetTriggerMode();
   md.lsrmEnabled = settings.IsLsrmEnabled();
   md.timestamp = std::chrono::system_clock::now();
   md.relativePath = AcquisitionDirectory::RelativeFramePath(
         step.GetSampleIndex(), settings.GetCaptureKind(),
         step.GetTimePointIndex(), step.GetChannel(), step.GetZPlaneIndex());

   return std::make_unique<CapturedFrame>(pixels, static_cast<size_t>(size),
         camera.GetImageWidth(), camera.GetImageHeight(),
         camera.GetImageBytesPerPixel(), md);
}


void
AcquisitionDriver::EmitWarnings(SaveDispatcher& dispatcher)
{
   const std::vector<CLSAError> warnings = dispatcher.TakeWarnings();
   for (const CLSAError& warning : warnings)
   {
      ++warningCount_;
      if (callback_)
         callback_->onWarning(runHandle_, warning.getCode(),
               warning.getFullMsg().c_str());
   }
}


void
AcquisitionDriver::ThrowIfDeviceError(int ret, const LSA::Device& device,
      int code, const std::string& action) const
{
   if (ret == DEVICE_OK)
      return;

   char text[LSA::MaxStrLength];
   text[0] = '\0';
   device.GetErrorText(ret, text);
   char name[LSA::MaxStrLength];
   name[0] = '\0';
   device.GetName(name);

   throw CLSAError(action + " failed on device " + ToQuotedString(name),
         code, CLSAError(text, ret));
}

} // namespace lsa
