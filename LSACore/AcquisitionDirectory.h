///////////////////////////////////////////////////////////////////////////////
// FILE:          AcquisitionDirectory.h
// PROJECT:       LSAcq
// SUBSYSTEM:     LSACore
//-----------------------------------------------------------------------------
// DESCRIPTION:   On-disk layout of a run under a destination root
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

#include <cstdint>
#include <string>

namespace lsa {

// Layout under a destination root:
//
//   <root>/Acquisition[_N]/sample<S>/<kind>/timepoint<T>/
//      sample<S>_<kind>_timepoint<T>_<channel>_<plane>
//
// S and T are one-based; <plane> is the zero-based Z-plane or frame index,
// zero padded to five digits.
class AcquisitionDirectory
{
public:
   static const char* const RunFolderName;

   // Returns root/Acquisition, or root/Acquisition_N with the smallest N
   // such that the directory does not exist yet. Does not create it.
   static std::string UniqueRunPath(const std::string& root);

   static std::string RelativeFramePath(size_t sampleIndex,
         CaptureKind kind, size_t timePointIndex, const Channel& channel,
         size_t zPlaneIndex);

   // Channel names are used in paths; anything other than alphanumerics,
   // '-' and '_' becomes '_'.
   static std::string SanitizePathComponent(const std::string& name);

   // Joins with the platform separator
   static std::string Join(const std::string& parent, const std::string& child);

   // Free space at path in MB. Throws CLSAError if it cannot be determined.
   static std::uintmax_t GetFreeMegabytes(const std::string& path);
};

} // namespace lsa
