///////////////////////////////////////////////////////////////////////////////
// FILE:          ChannelSequencer.cpp
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

#include "ChannelSequencer.h"

#include "Error.h"

namespace lsa {

const char* SpectralModeName(SpectralMode mode)
{
   switch (mode)
   {
      case SpectralModeNone: return "none";
      case SpectralModeVideo: return "video";
      case SpectralModeZStack: return "Z-stack";
   }
   return "(invalid)";
}


SpectralMode SpectralModeForRun(const AcquisitionSettings& settings)
{
   if (settings.GetCaptureKind() == CaptureKindVideo)
      return settings.IsSpectralVideo() ? SpectralModeVideo : SpectralModeNone;
   return settings.IsSpectralZStack() ? SpectralModeZStack : SpectralModeNone;
}


ChannelStep NextChannel(SpectralMode mode,
      const std::vector<Channel>& channelOrder,
      const Channel& defaultChannel, size_t currentIndex)
{
   if (mode == SpectralModeNone)
      return ChannelStep{ defaultChannel, 0 };

   if (channelOrder.empty())
      throw CLSAError(std::string("Cannot cycle channels for spectral ") +
            SpectralModeName(mode) + ": channel order is empty",
            LSAERR_EmptyChannelOrder);

   const size_t index = currentIndex % channelOrder.size();
   return ChannelStep{ channelOrder[index], (index + 1) % channelOrder.size() };
}


ChannelSequencer::ChannelSequencer(SpectralMode mode,
      const std::vector<Channel>& channelOrder, const Channel& defaultChannel) :
   mode_(mode),
   channelOrder_(channelOrder),
   defaultChannel_(defaultChannel),
   index_(0)
{
   if (IsSwitching() && channelOrder_.empty())
      throw CLSAError(std::string("Spectral ") + SpectralModeName(mode_) +
            " requires a non-empty channel order", LSAERR_EmptyChannelOrder);
}


ChannelSequencer::ChannelSequencer(const AcquisitionSettings& settings) :
   ChannelSequencer(SpectralModeForRun(settings), settings.GetChannelOrder(),
         settings.GetDefaultChannel())
{}


size_t
ChannelSequencer::GetChannelsPerStep() const
{
   return IsSwitching() ? channelOrder_.size() : 1;
}


ChannelStep
ChannelSequencer::Next()
{
   ChannelStep step = NextChannel(mode_, channelOrder_, defaultChannel_, index_);
   index_ = step.nextIndex;
   return step;
}

} // namespace lsa
