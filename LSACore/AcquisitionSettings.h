///////////////////////////////////////////////////////////////////////////////
// FILE:          AcquisitionSettings.h
// PROJECT:       LSAcq
// SUBSYSTEM:     LSACore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Immutable per-run acquisition settings, and the builder that
//                produces them from raw operator input.
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

#include "../LSADevice/LSADeviceConstants.h"

#include <string>
#include <vector>

namespace lsa {

enum StageSpeed {
   StageSpeed15UmPerSec = 15,
   StageSpeed30UmPerSec = 30,
};

// Nesting priority between the time point loop and the sample loop.
enum AcquisitionOrder {
   AcquisitionOrderTimeSamp, // all samples per time point
   AcquisitionOrderSampTime, // full time series per sample
};

enum CaptureKind {
   CaptureKindZStack,
   CaptureKindVideo,
};

// One week
const double MaxTimePointIntervalMin = 7 * 24 * 60.0;

bool IsSupportedStageSpeed(int umPerSec);
const char* AcquisitionOrderName(AcquisitionOrder order);
const char* CaptureKindName(CaptureKind kind);


/// Imaging channel.
/**
 * The name identifies the channel in file names and metadata; the preset is
 * what the filter device is asked to select.
 */
class Channel
{
public:
   Channel() {}
   explicit Channel(const std::string& name) : name_(name), preset_(name) {}
   Channel(const std::string& name, const std::string& preset) :
      name_(name), preset_(preset)
   {}

   const std::string& GetName() const { return name_; }
   const std::string& GetPreset() const { return preset_; }

   bool operator==(const Channel& rhs) const
   { return name_ == rhs.name_ && preset_ == rhs.preset_; }
   bool operator!=(const Channel& rhs) const { return !(*this == rhs); }

private:
   std::string name_;
   std::string preset_;
};


struct Sample
{
   std::string label;
   LSA::StagePosition position; // first Z-plane
   bool imagingEnabled;

   Sample(const std::string& sampleLabel, const LSA::StagePosition& pos,
         bool enabled = true) :
      label(sampleLabel),
      position(pos),
      imagingEnabled(enabled)
   {}
};


class AcquisitionSettingsBuilder;

/// Settings snapshot for one run. Immutable once built.
class AcquisitionSettings
{
public:
   double GetZStackExposureMs() const { return zStackExposureMs_; }
   double GetVideoExposureMs() const { return videoExposureMs_; }
   StageSpeed GetStageSpeed() const { return stageSpeed_; }
   int GetStageSpeedUmPerSec() const { return static_cast<int>(stageSpeed_); }
   AcquisitionOrder GetAcquisitionOrder() const { return acquisitionOrder_; }
   CaptureKind GetCaptureKind() const { return captureKind_; }
   bool IsSpectralVideo() const { return spectralVideo_; }
   bool IsSpectralZStack() const { return spectralZStack_; }
   bool IsEdgeTrigger() const { return edgeTrigger_; }
   bool IsLsrmEnabled() const { return lsrmEnabled_; }
   const std::string& GetPrimarySavePath() const { return primarySavePath_; }
   bool IsSecondSavePathEnabled() const { return secondSavePathEnabled_; }
   const std::string& GetSecondSavePath() const { return secondSavePath_; }
   const std::vector<Channel>& GetChannelOrder() const { return channelOrder_; }
   const Channel& GetDefaultChannel() const { return defaultChannel_; }
   double GetZStepUm() const { return zStepUm_; }
   double GetTimePointIntervalMin() const { return timePointIntervalMin_; }

   // Exposure the camera is armed with for this run's capture kind
   double GetCaptureExposureMs() const;
   LSA::TriggerMode GetTriggerMode() const;

   std::string Describe() const;

private:
   friend class AcquisitionSettingsBuilder;
   AcquisitionSettings();

   double zStackExposureMs_;
   double videoExposureMs_;
   StageSpeed stageSpeed_;
   AcquisitionOrder acquisitionOrder_;
   CaptureKind captureKind_;
   bool spectralVideo_;
   bool spectralZStack_;
   bool edgeTrigger_;
   bool lsrmEnabled_;
   std::string primarySavePath_;
   bool secondSavePathEnabled_;
   std::string secondSavePath_;
   std::vector<Channel> channelOrder_;
   Channel defaultChannel_;
   double zStepUm_;
   double timePointIntervalMin_;
};


/// Collects raw operator input and produces a settings snapshot.
/**
 * Build() enforces the structural invariants (supported stage speed, second
 * save path present iff enabled). Feasibility of the combination is checked
 * separately by ValidateSettings().
 */
class AcquisitionSettingsBuilder
{
public:
   AcquisitionSettingsBuilder();

   AcquisitionSettingsBuilder& ZStackExposureMs(double ms);
   AcquisitionSettingsBuilder& VideoExposureMs(double ms);
   AcquisitionSettingsBuilder& StageSpeedUmPerSec(int umPerSec);
   AcquisitionSettingsBuilder& Order(AcquisitionOrder order);
   AcquisitionSettingsBuilder& Capture(CaptureKind kind);
   AcquisitionSettingsBuilder& SpectralVideo(bool enable);
   AcquisitionSettingsBuilder& SpectralZStack(bool enable);
   AcquisitionSettingsBuilder& EdgeTrigger(bool enable);
   AcquisitionSettingsBuilder& Lsrm(bool enable);
   AcquisitionSettingsBuilder& PrimarySavePath(const std::string& path);
   AcquisitionSettingsBuilder& SecondSavePathEnabled(bool enable);
   AcquisitionSettingsBuilder& SecondSavePath(const std::string& path);
   AcquisitionSettingsBuilder& AddChannel(const Channel& channel);
   AcquisitionSettingsBuilder& ChannelOrder(const std::vector<Channel>& channels);
   AcquisitionSettingsBuilder& DefaultChannel(const Channel& channel);
   AcquisitionSettingsBuilder& ZStepUm(double um);
   AcquisitionSettingsBuilder& TimePointIntervalMin(double minutes);

   // Throws CLSAError
   AcquisitionSettings Build() const;

private:
   AcquisitionSettings settings_;
   int stageSpeedUmPerSec_;
   bool hasDefaultChannel_;
};

} // namespace lsa
