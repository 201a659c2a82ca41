///////////////////////////////////////////////////////////////////////////////
// FILE:          CapturedFrame.cpp
// PROJECT:       LSAcq
// SUBSYSTEM:     LSACore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Pixel buffer of one captured frame with its metadata
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

#include "CapturedFrame.h"

#include "CoreUtils.h"
#include "Logging/MetadataFormatter.h"

#include <nlohmann/json.hpp>

namespace lsa {

CapturedFrame::CapturedFrame(const unsigned char* pixels, size_t sizeInBytes,
      unsigned width, unsigned height, unsigned bytesPerPixel,
      const FrameMetadata& metadata) :
   pixels_(pixels, pixels + sizeInBytes),
   width_(width),
   height_(height),
   bytesPerPixel_(bytesPerPixel),
   metadata_(metadata)
{}


std::string
CapturedFrame::SerializeMetadata() const
{
   using json = nlohmann::json;

   const FrameMetadata& md = metadata_;
   json j;
   j["Step"] = md.stepIndex;
   j["StepCount"] = md.stepCount;
   j["TimePoint"] = md.timePointIndex;
   j["Sample"] = md.sampleIndex;
   j["SampleLabel"] = md.sampleLabel;
   j[md.captureKind == CaptureKindVideo ? "Frame" : "ZPlane"] = md.zPlaneIndex;
   j["CaptureKind"] = CaptureKindName(md.captureKind);
   j["Channel"] = md.channel.GetName();
   j["ChannelPreset"] = md.channel.GetPreset();
   j["Position-X-um"] = md.position.xUm;
   j["Position-Y-um"] = md.position.yUm;
   j["Position-Z-um"] = md.position.zUm;
   j["Exposure-ms"] = md.exposureMs;
   j["TriggerMode"] = ToString(md.triggerMode);
   j["LSRM"] = md.lsrmEnabled;
   j["Time"] = logging::internal::FormatLocalTime(md.timestamp);
   j["Width"] = width_;
   j["Height"] = height_;
   j["BytesPerPixel"] = bytesPerPixel_;
   // Labels and channel names are user text; invalid UTF-8 becomes U+FFFD
   return j.dump(2, ' ', false, json::error_handler_t::replace);
}

} // namespace lsa
