///////////////////////////////////////////////////////////////////////////////
// FILE:          ChannelSequencer.h
// PROJECT:       LSAcq
// SUBSYSTEM:     LSACore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Order of filter/channel changes for the spectral modes
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

enum SpectralMode {
   SpectralModeNone,   // fixed default channel
   SpectralModeVideo,  // switch every video frame
   SpectralModeZStack, // switch every Z-step
};

const char* SpectralModeName(SpectralMode mode);

// The mode that applies to the run's capture kind. A spectral flag for the
// other capture kind has no effect on channel switching.
SpectralMode SpectralModeForRun(const AcquisitionSettings& settings);

struct ChannelStep
{
   Channel channel;
   size_t nextIndex;
};

// Channel for currentIndex and the index that follows it. With
// SpectralModeNone, always the default channel and index 0. Throws
// CLSAError (LSAERR_EmptyChannelOrder) when asked to cycle an empty order.
ChannelStep NextChannel(SpectralMode mode,
      const std::vector<Channel>& channelOrder,
      const Channel& defaultChannel, size_t currentIndex);


class ChannelSequencer
{
public:
   // Throws CLSAError if mode switches channels and channelOrder is empty.
   ChannelSequencer(SpectralMode mode, const std::vector<Channel>& channelOrder,
         const Channel& defaultChannel);
   explicit ChannelSequencer(const AcquisitionSettings& settings);

   SpectralMode GetMode() const { return mode_; }
   bool IsSwitching() const { return mode_ != SpectralModeNone; }

   // Number of channels imaged per Z-plane (or per video frame position)
   size_t GetChannelsPerStep() const;

   size_t GetCurrentIndex() const { return index_; }

   ChannelStep Next();
   void Reset() { index_ = 0; }

private:
   SpectralMode mode_;
   std::vector<Channel> channelOrder_;
   Channel defaultChannel_;
   size_t index_;
};

} // namespace lsa
