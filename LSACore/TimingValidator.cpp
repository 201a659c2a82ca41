///////////////////////////////////////////////////////////////////////////////
// FILE:          TimingValidator.cpp
// PROJECT:       LSAcq
// SUBSYSTEM:     LSACore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Checks that a settings snapshot can be executed, in
//                particular exposure time against stage speed during
//                continuous scans.
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

#include "TimingValidator.h"

#include "AcquisitionDirectory.h"
#include "ChannelSequencer.h"
#include "CoreUtils.h"
#include "Error.h"

#include <set>

namespace lsa {

namespace {

bool IsValidExposure(double ms)
{
   return ms > 0.0; // also false for NaN
}

std::string DescribeError(int code, const AcquisitionSettings& settings)
{
   switch (code)
   {
      case LSAERR_InvalidExposure:
         return "Exposure must be positive (Z-stack " +
            ToString(settings.GetZStackExposureMs()) + " ms, video " +
            ToString(settings.GetVideoExposureMs()) + " ms)";
      case LSAERR_MissingSavePath:
         return "No primary save path given";
      case LSAERR_ConflictingSpectralModes:
         return "Spectral video and spectral Z-stack cannot both be enabled";
      case LSAERR_EmptyChannelOrder:
         return std::string("Spectral ") +
            (settings.IsSpectralZStack() ? "Z-stack" : "video") +
            " is enabled but the channel order is empty";
      case LSAERR_DuplicateChannel:
      {
         std::string names;
         for (const Channel& channel : settings.GetChannelOrder())
            names += (names.empty() ? "" : ", ") +
               ToQuotedString(channel.GetName());
         return "Channel names must be distinct in file names (" + names + ")";
      }
      case LSAERR_ExceedsStageSpeedLimit:
         return "Z-stack exposure " + ToString(settings.GetZStackExposureMs()) +
            " ms is too long for continuous scan at " +
            ToString(settings.GetStageSpeedUmPerSec()) +
            " um/s (maximum " +
            ToString(MaxContinuousScanExposureMs(settings.GetStageSpeedUmPerSec())) +
            " ms); use edge trigger or a lower stage speed";
      default:
         return "Invalid acquisition settings";
   }
}

} // anonymous namespace


bool IsContinuousScan(const AcquisitionSettings& settings)
{
   return !settings.IsSpectralZStack() && !settings.IsEdgeTrigger();
}


bool IsWithinStageSpeedLimit(double exposureMs, int stageSpeedUmPerSec)
{
   // Multiply rather than divide so that the boundary is exact
   return exposureMs * stageSpeedUmPerSec <= MaxContinuousScanTravelProduct;
}


double MaxContinuousScanExposureMs(int stageSpeedUmPerSec)
{
   return MaxContinuousScanTravelProduct / stageSpeedUmPerSec;
}


bool HasDistinctChannelNames(const std::vector<Channel>& channels)
{
   std::set<std::string> seen;
   for (const Channel& channel : channels)
   {
      if (!seen.insert(
               AcquisitionDirectory::SanitizePathComponent(channel.GetName())).second)
         return false;
   }
   return true;
}


int CheckTiming(const AcquisitionSettings& settings)
{
   if (!IsContinuousScan(settings))
      return LSAERR_OK;
   if (!IsWithinStageSpeedLimit(settings.GetZStackExposureMs(),
            settings.GetStageSpeedUmPerSec()))
      return LSAERR_ExceedsStageSpeedLimit;
   return LSAERR_OK;
}


int CheckSettings(const AcquisitionSettings& settings)
{
   if (!IsValidExposure(settings.GetZStackExposureMs()) ||
         !IsValidExposure(settings.GetVideoExposureMs()))
      return LSAERR_InvalidExposure;
   if (settings.GetPrimarySavePath().empty())
      return LSAERR_MissingSavePath;
   if (settings.IsSpectralVideo() && settings.IsSpectralZStack())
      return LSAERR_ConflictingSpectralModes;
   if (settings.IsSpectralVideo() || settings.IsSpectralZStack())
   {
      if (settings.GetChannelOrder().empty())
         return LSAERR_EmptyChannelOrder;
      if (!HasDistinctChannelNames(settings.GetChannelOrder()))
         return LSAERR_DuplicateChannel;
   }
   return CheckTiming(settings);
}


void ValidateSettings(const AcquisitionSettings& settings)
{
   int code = CheckSettings(settings);
   if (code != LSAERR_OK)
      throw CLSAError(DescribeError(code, settings), code);
}

} // namespace lsa
