///////////////////////////////////////////////////////////////////////////////
// FILE:          FileFrameSink.h
// PROJECT:       LSAcq
// SUBSYSTEM:     LSACore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Frame sink writing raw pixel files with a JSON sidecar
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

#include "../LSADevice/LSADevice.h"

namespace lsa {

/// Writes <path>.raw (pixels as captured) and <path>.json (metadata),
/// creating directories as needed.
class FileFrameSink : public LSA::FrameSink
{
public:
   FileFrameSink() {}

   void GetName(char* name) const override;
   bool GetErrorText(int errorCode, char* errMessage) const override;

   int PrepareDestination(const char* rootPath) override;
   int WriteFrame(const char* destinationPath, const unsigned char* pixels,
         long sizeInBytes, const char* imageMeta) override;
};

} // namespace lsa
