///////////////////////////////////////////////////////////////////////////////
// FILE:          TimingValidator.h
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

#pragma once

#include "AcquisitionSettings.h"

namespace lsa {

// Exposure times stage speed must not exceed this (ms * um/s, i.e. 1 um of
// travel per exposure).
const double MaxContinuousScanTravelProduct = 1000.0;

// The stage moves continuously while the camera exposes: neither spectral
// Z-stack (which stops per slice) nor edge trigger (hardware synchronized)
// is in use.
bool IsContinuousScan(const AcquisitionSettings& settings);

bool IsWithinStageSpeedLimit(double exposureMs, int stageSpeedUmPerSec);
double MaxContinuousScanExposureMs(int stageSpeedUmPerSec);

// Frame file names carry the sanitized channel name, so two channels that
// sanitize to the same name would write to the same file.
bool HasDistinctChannelNames(const std::vector<Channel>& channels);

// Returns LSAERR_OK or LSAERR_ExceedsStageSpeedLimit.
int CheckTiming(const AcquisitionSettings& settings);

// Returns LSAERR_OK or the code of the first configuration error found.
int CheckSettings(const AcquisitionSettings& settings);

// Throws CLSAError carrying the code from CheckSettings() and a message
// naming the offending values.
void ValidateSettings(const AcquisitionSettings& settings);

} // namespace lsa
