///////////////////////////////////////////////////////////////////////////////
// FILE:          LoopOrderPlanner.h
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

#pragma once

#include "AcquisitionPlan.h"
#include "AcquisitionSettings.h"

#include <cstddef>
#include <vector>

namespace lsa {

/// Builds the step sequence of a run.
/**
 * TIME_SAMP nests samples inside time points; SAMP_TIME nests time points
 * inside samples. Within one sample and time point, Z-planes (or video
 * frames) are the outer loop and channels the inner loop, in channel order.
 * Samples with imaging disabled are skipped.
 */
class LoopOrderPlanner
{
public:
   explicit LoopOrderPlanner(const AcquisitionSettings& settings);

   // Throws CLSAError if the channel configuration cannot be sequenced.
   // Zero counts or no enabled sample yield an empty plan.
   AcquisitionPlan Plan(const std::vector<Sample>& samples,
         size_t timePointCount, size_t zPlaneCount) const;

   // Stage target for a Z-plane of a sample
   LSA::StagePosition PlanePosition(const Sample& sample,
         size_t zPlaneIndex) const;

private:
   void AppendSampleTimePoint(std::vector<AcquisitionStep>& steps,
         size_t timePointIndex, size_t sampleIndex, const Sample& sample,
         size_t zPlaneCount) const;

   AcquisitionSettings settings_;
};

} // namespace lsa
