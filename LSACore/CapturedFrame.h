///////////////////////////////////////////////////////////////////////////////
// FILE:          CapturedFrame.h
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

#pragma once

#include "AcquisitionSettings.h"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace lsa {

struct FrameMetadata
{
   size_t stepIndex = 0;
   size_t stepCount = 0;
   size_t timePointIndex = 0;
   size_t sampleIndex = 0;
   size_t zPlaneIndex = 0;
   std::string sampleLabel;
   Channel channel;
   LSA::StagePosition position;
   CaptureKind captureKind = CaptureKindZStack;
   double exposureMs = 0.0;
   LSA::TriggerMode triggerMode = LSA::SyncReadoutTrigger;
   bool lsrmEnabled = false;
   std::chrono::system_clock::time_point timestamp;
   // Frame path relative to a destination's run directory, no extension
   std::string relativePath;
};


/// Owns a copy of the camera buffer so that the camera can capture the next
/// frame while this one is being saved.
class CapturedFrame
{
public:
   CapturedFrame(const unsigned char* pixels, size_t sizeInBytes,
         unsigned width, unsigned height, unsigned bytesPerPixel,
         const FrameMetadata& metadata);

   CapturedFrame(const CapturedFrame&) = delete;
   CapturedFrame& operator=(const CapturedFrame&) = delete;

   const unsigned char* GetPixels() const { return pixels_.data(); }
   size_t GetSizeInBytes() const { return pixels_.size(); }
   unsigned GetWidth() const { return width_; }
   unsigned GetHeight() const { return height_; }
   unsigned GetBytesPerPixel() const { return bytesPerPixel_; }
   const FrameMetadata& GetMetadata() const { return metadata_; }

   // JSON document describing the frame and the instrument state
   std::string SerializeMetadata() const;

private:
   std::vector<unsigned char> pixels_;
   unsigned width_;
   unsigned height_;
   unsigned bytesPerPixel_;
   FrameMetadata metadata_;
};

} // namespace lsa
