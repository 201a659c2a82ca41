///////////////////////////////////////////////////////////////////////////////
// FILE:          AcquisitionPlan.cpp
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

#include "AcquisitionPlan.h"

#include "CoreUtils.h"
#include "Error.h"

#include <algorithm>
#include <sstream>

namespace lsa {

AcquisitionPlan::AcquisitionPlan(const std::vector<AcquisitionStep>& steps,
      const Dimensions& dims, AcquisitionOrder order,
      double exposureMs, double timePointIntervalMin) :
   steps_(steps),
   dims_(dims),
   order_(order),
   exposureMs_(exposureMs),
   timePointIntervalMin_(timePointIntervalMin)
{}


const AcquisitionStep&
AcquisitionPlan::At(size_t index) const
{
   if (index >= steps_.size())
      throw CLSAError("Step index " + ToString(index) +
            " out of range (plan has " + ToString(steps_.size()) + " steps)");
   return steps_[index];
}


size_t
AcquisitionPlan::GetImagesPerTimePoint() const
{
   return dims_.sampleCount * dims_.zPlaneCount * dims_.channelsPerPlane;
}


double
AcquisitionPlan::EstimateDurationMs() const
{
   if (IsEmpty())
      return 0.0;

   // A series is the sequence of time points separated by the interval: the
   // whole run for TIME_SAMP, one per sample for SAMP_TIME.
   size_t seriesCount = 1;
   size_t imagesPerBlock = GetImagesPerTimePoint();
   if (order_ == AcquisitionOrderSampTime)
   {
      seriesCount = dims_.sampleCount;
      imagesPerBlock = dims_.zPlaneCount * dims_.channelsPerPlane;
   }

   const double blockMs = imagesPerBlock * exposureMs_;
   const double intervalMs = timePointIntervalMin_ * 60000.0;
   const double perSeriesMs =
      (dims_.timePointCount - 1) * std::max(blockMs, intervalMs) + blockMs;
   return seriesCount * perSeriesMs;
}


std::string
AcquisitionPlan::Describe() const
{
   std::ostringstream oss;
   oss << steps_.size() << " steps (" << AcquisitionOrderName(order_) <<
      ": " << dims_.timePointCount << " time point(s) x " <<
      dims_.sampleCount << " sample(s) x " << dims_.zPlaneCount <<
      " plane(s) x " << dims_.channelsPerPlane << " channel(s)), " <<
      "estimated at least " << EstimateDurationMs() / 1000.0 << " s";
   return oss.str();
}

} // namespace lsa
