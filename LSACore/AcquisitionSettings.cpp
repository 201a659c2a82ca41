///////////////////////////////////////////////////////////////////////////////
// FILE:          AcquisitionSettings.cpp
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

#include "AcquisitionSettings.h"

#include "CoreUtils.h"
#include "Error.h"

#include <sstream>

namespace lsa {

namespace {

const double DefaultZStackExposureMs = 33.0;
const double DefaultVideoExposureMs = 20.0;
const double DefaultZStepUm = 1.0;
const char* const FallbackChannelName = "Default";

} // anonymous namespace

bool IsSupportedStageSpeed(int umPerSec)
{
   return umPerSec == StageSpeed15UmPerSec || umPerSec == StageSpeed30UmPerSec;
}

const char* AcquisitionOrderName(AcquisitionOrder order)
{
   switch (order)
   {
      case AcquisitionOrderTimeSamp: return "TIME_SAMP";
      case AcquisitionOrderSampTime: return "SAMP_TIME";
   }
   return "(invalid)";
}

const char* CaptureKindName(CaptureKind kind)
{
   switch (kind)
   {
      case CaptureKindZStack: return "zstack";
      case CaptureKindVideo: return "video";
   }
   return "(invalid)";
}


AcquisitionSettings::AcquisitionSettings() :
   zStackExposureMs_(DefaultZStackExposureMs),
   videoExposureMs_(DefaultVideoExposureMs),
   stageSpeed_(StageSpeed30UmPerSec),
   acquisitionOrder_(AcquisitionOrderTimeSamp),
   captureKind_(CaptureKindZStack),
   spectralVideo_(false),
   spectralZStack_(false),
   edgeTrigger_(false),
   lsrmEnabled_(false),
   secondSavePathEnabled_(false),
   zStepUm_(DefaultZStepUm),
   timePointIntervalMin_(0.0)
{}


double
AcquisitionSettings::GetCaptureExposureMs() const
{
   return captureKind_ == CaptureKindVideo ? videoExposureMs_ : zStackExposureMs_;
}


LSA::TriggerMode
AcquisitionSettings::GetTriggerMode() const
{
   return edgeTrigger_ ? LSA::EdgeTrigger : LSA::SyncReadoutTrigger;
}


std::string
AcquisitionSettings::Describe() const
{
   std::ostringstream oss;
   oss << CaptureKindName(captureKind_) <<
      ", order " << AcquisitionOrderName(acquisitionOrder_) <<
      ", exposure " << GetCaptureExposureMs() << " ms" <<
      ", stage speed " << GetStageSpeedUmPerSec() << " um/s" <<
      ", trigger " << ToString(GetTriggerMode()) <<
      ", LSRM " << (lsrmEnabled_ ? "on" : "off") <<
      ", spectral video " << (spectralVideo_ ? "on" : "off") <<
      ", spectral Z-stack " << (spectralZStack_ ? "on" : "off") <<
      ", " << channelOrder_.size() << " channel(s)";
   if (secondSavePathEnabled_)
      oss << ", second save path " << ToQuotedString(secondSavePath_);
   return oss.str();
}


AcquisitionSettingsBuilder::AcquisitionSettingsBuilder() :
   stageSpeedUmPerSec_(StageSpeed30UmPerSec),
   hasDefaultChannel_(false)
{}

AcquisitionSettingsBuilder&
AcquisitionSettingsBuilder::ZStackExposureMs(double ms)
{ settings_.zStackExposureMs_ = ms; return *this; }

AcquisitionSettingsBuilder&
AcquisitionSettingsBuilder::VideoExposureMs(double ms)
{ settings_.videoExposureMs_ = ms; return *this; }

AcquisitionSettingsBuilder&
AcquisitionSettingsBuilder::StageSpeedUmPerSec(int umPerSec)
{ stageSpeedUmPerSec_ = umPerSec; return *this; }

AcquisitionSettingsBuilder&
AcquisitionSettingsBuilder::Order(AcquisitionOrder order)
{ settings_.acquisitionOrder_ = order; return *this; }

AcquisitionSettingsBuilder&
AcquisitionSettingsBuilder::Capture(CaptureKind kind)
{ settings_.captureKind_ = kind; return *this; }

AcquisitionSettingsBuilder&
AcquisitionSettingsBuilder::SpectralVideo(bool enable)
{ settings_.spectralVideo_ = enable; return *this; }

AcquisitionSettingsBuilder&
AcquisitionSettingsBuilder::SpectralZStack(bool enable)
{ settings_.spectralZStack_ = enable; return *this; }

AcquisitionSettingsBuilder&
AcquisitionSettingsBuilder::EdgeTrigger(bool enable)
{ settings_.edgeTrigger_ = enable; return *this; }

AcquisitionSettingsBuilder&
AcquisitionSettingsBuilder::Lsrm(bool enable)
{ settings_.lsrmEnabled_ = enable; return *this; }

AcquisitionSettingsBuilder&
AcquisitionSettingsBuilder::PrimarySavePath(const std::string& path)
{ settings_.primarySavePath_ = path; return *this; }

AcquisitionSettingsBuilder&
AcquisitionSettingsBuilder::SecondSavePathEnabled(bool enable)
{ settings_.secondSavePathEnabled_ = enable; return *this; }

AcquisitionSettingsBuilder&
AcquisitionSettingsBuilder::SecondSavePath(const std::string& path)
{ settings_.secondSavePath_ = path; return *this; }

AcquisitionSettingsBuilder&
AcquisitionSettingsBuilder::AddChannel(const Channel& channel)
{ settings_.channelOrder_.push_back(channel); return *this; }

AcquisitionSettingsBuilder&
AcquisitionSettingsBuilder::ChannelOrder(const std::vector<Channel>& channels)
{ settings_.channelOrder_ = channels; return *this; }

AcquisitionSettingsBuilder&
AcquisitionSettingsBuilder::DefaultChannel(const Channel& channel)
{
   settings_.defaultChannel_ = channel;
   hasDefaultChannel_ = true;
   return *this;
}

AcquisitionSettingsBuilder&
AcquisitionSettingsBuilder::ZStepUm(double um)
{ settings_.zStepUm_ = um; return *this; }

AcquisitionSettingsBuilder&
AcquisitionSettingsBuilder::TimePointIntervalMin(double minutes)
{ settings_.timePointIntervalMin_ = minutes; return *this; }


AcquisitionSettings
AcquisitionSettingsBuilder::Build() const
{
   if (!IsSupportedStageSpeed(stageSpeedUmPerSec_))
      throw CLSAError("Unsupported stage speed " +
            ToString(stageSpeedUmPerSec_) + " um/s (supported: 15, 30)",
            LSAERR_InvalidStageSpeed);
   if (settings_.secondSavePathEnabled_ && settings_.secondSavePath_.empty())
      throw CLSAError("Second save path is enabled but no path was given",
            LSAERR_MissingSavePath);
   // Also rejects NaN and infinity
   if (!(settings_.timePointIntervalMin_ >= 0.0 &&
            settings_.timePointIntervalMin_ <= MaxTimePointIntervalMin))
      throw CLSAError("Time point interval " +
            ToString(settings_.timePointIntervalMin_) + " min is out of range "
            "(0 to " + ToString(MaxTimePointIntervalMin) + " min)",
            LSAERR_InvalidInterval);

   AcquisitionSettings result(settings_);
   result.stageSpeed_ = static_cast<StageSpeed>(stageSpeedUmPerSec_);
   if (!result.secondSavePathEnabled_)
      result.secondSavePath_.clear();
   if (!hasDefaultChannel_)
   {
      result.defaultChannel_ = result.channelOrder_.empty() ?
         Channel(FallbackChannelName) : result.channelOrder_.front();
   }
   return result;
}

} // namespace lsa
