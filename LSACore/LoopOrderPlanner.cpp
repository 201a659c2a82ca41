///////////////////////////////////////////////////////////////////////////////
// FILE:          LoopOrderPlanner.cpp
// PROJECT:       LSAcq
// SUBSYSTEM:     LSACore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Expands time points, samples, Z-planes and channels into the
//                ordered step list of a run
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

#include "LoopOrderPlanner.h"

#include "ChannelSequencer.h"

namespace lsa {

LoopOrderPlanner::LoopOrderPlanner(const AcquisitionSettings& settings) :
   settings_(settings)
{}


LSA::StagePosition
LoopOrderPlanner::PlanePosition(const Sample& sample, size_t zPlaneIndex) const
{
   LSA::StagePosition pos = sample.position;
   if (settings_.GetCaptureKind() == CaptureKindZStack)
      pos.zUm += static_cast<double>(zPlaneIndex) * settings_.GetZStepUm();
   return pos;
}


void
LoopOrderPlanner::AppendSampleTimePoint(std::vector<AcquisitionStep>& steps,
      size_t timePointIndex, size_t sampleIndex, const Sample& sample,
      size_t zPlaneCount) const
{
   ChannelSequencer sequencer(settings_);
   const size_t channelsPerPlane = sequencer.GetChannelsPerStep();
   for (size_t z = 0; z < zPlaneCount; ++z)
   {
      const LSA::StagePosition pos = PlanePosition(sample, z);
      sequencer.Reset();
      for (size_t c = 0; c < channelsPerPlane; ++c)
      {
         const size_t channelIndex = sequencer.GetCurrentIndex();
         ChannelStep next = sequencer.Next();
         steps.push_back(AcquisitionStep(timePointIndex, sampleIndex, z,
                  next.channel, channelIndex, pos));
      }
   }
}


AcquisitionPlan
LoopOrderPlanner::Plan(const std::vector<Sample>& samples,
      size_t timePointCount, size_t zPlaneCount) const
{
   std::vector<size_t> enabled;
   for (size_t i = 0; i < samples.size(); ++i)
   {
      if (samples[i].imagingEnabled)
         enabled.push_back(i);
   }

   AcquisitionPlan::Dimensions dims;
   dims.timePointCount = timePointCount;
   dims.sampleCount = enabled.size();
   dims.zPlaneCount = zPlaneCount;
   dims.channelsPerPlane = ChannelSequencer(settings_).GetChannelsPerStep();

   std::vector<AcquisitionStep> steps;
   steps.reserve(dims.timePointCount * dims.sampleCount * dims.zPlaneCount *
         dims.channelsPerPlane);

   if (settings_.GetAcquisitionOrder() == AcquisitionOrderTimeSamp)
   {
      for (size_t t = 0; t < timePointCount; ++t)
         for (size_t s : enabled)
            AppendSampleTimePoint(steps, t, s, samples[s], zPlaneCount);
   }
   else
   {
      for (size_t s : enabled)
         for (size_t t = 0; t < timePointCount; ++t)
            AppendSampleTimePoint(steps, t, s, samples[s], zPlaneCount);
   }

   return AcquisitionPlan(steps, dims, settings_.GetAcquisitionOrder(),
         settings_.GetCaptureExposureMs(), settings_.GetTimePointIntervalMin());
}

} // namespace lsa
