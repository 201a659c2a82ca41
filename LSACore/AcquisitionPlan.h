///////////////////////////////////////////////////////////////////////////////
// FILE:          AcquisitionPlan.h
// PROJECT:       LSAcq
// SUBSYSTEM:     LSACore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Fully materialized, ordered list of acquisition steps
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

#include "AcquisitionSettings.h"

#include <cstddef>
#include <vector>

namespace lsa {

/// One unit of work: a single frame at one time point, sample, Z-plane and
/// channel.
class AcquisitionStep
{
public:
   AcquisitionStep(size_t timePointIndex, size_t sampleIndex,
         size_t zPlaneIndex, const Channel& channel, size_t channelIndex,
         const LSA::StagePosition& position) :
      timePointIndex_(timePointIndex),
      sampleIndex_(sampleIndex),
      zPlaneIndex_(zPlaneIndex),
      channel_(channel),
      channelIndex_(channelIndex),
      position_(position)
   {}

   size_t GetTimePointIndex() const { return timePointIndex_; }
   // Index into the sample list given to the planner
   size_t GetSampleIndex() const { return sampleIndex_; }
   // Z-plane for Z-stacks, frame index for video
   size_t GetZPlaneIndex() const { return zPlaneIndex_; }
   const Channel& GetChannel() const { return channel_; }
   size_t GetChannelIndex() const { return channelIndex_; }
   const LSA::StagePosition& GetPosition() const { return position_; }

private:
   size_t timePointIndex_;
   size_t sampleIndex_;
   size_t zPlaneIndex_;
   Channel channel_;
   size_t channelIndex_;
   LSA::StagePosition position_;
};


class AcquisitionPlan
{
public:
   typedef std::vector<AcquisitionStep>::const_iterator const_iterator;

   struct Dimensions
   {
      size_t timePointCount;
      size_t sampleCount; // enabled samples only
      size_t zPlaneCount;
      size_t channelsPerPlane;
   };

   AcquisitionPlan(const std::vector<AcquisitionStep>& steps,
         const Dimensions& dims, AcquisitionOrder order,
         double exposureMs, double timePointIntervalMin);

   size_t Size() const { return steps_.size(); }
   bool IsEmpty() const { return steps_.empty(); }
   // Throws CLSAError if out of range
   const AcquisitionStep& At(size_t index) const;
   const_iterator begin() const { return steps_.begin(); }
   const_iterator end() const { return steps_.end(); }

   AcquisitionOrder GetOrder() const { return order_; }
   const Dimensions& GetDimensions() const { return dims_; }
   size_t GetImagesPerTimePoint() const;

   // Lower bound on run duration from exposures and time point intervals;
   // stage and filter motion are not included.
   double EstimateDurationMs() const;

   std::string Describe() const;

private:
   std::vector<AcquisitionStep> steps_;
   Dimensions dims_;
   AcquisitionOrder order_;
   double exposureMs_;
   double timePointIntervalMin_;
};

} // namespace lsa
