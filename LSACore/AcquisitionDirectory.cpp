///////////////////////////////////////////////////////////////////////////////
// FILE:          AcquisitionDirectory.cpp
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

#include "AcquisitionDirectory.h"

#include "CoreUtils.h"
#include "Error.h"

#include <cctype>
#include <cstdio>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace lsa {

const char* const AcquisitionDirectory::RunFolderName = "Acquisition";


std::string
AcquisitionDirectory::UniqueRunPath(const std::string& root)
{
   const fs::path base = fs::path(root) / RunFolderName;
   fs::path candidate = base;
   for (unsigned n = 1; ; ++n)
   {
      std::error_code ec;
      if (!fs::exists(candidate, ec))
      {
         if (ec)
            throw CLSAError("Cannot access " + ToQuotedString(candidate.string()) +
                  ": " + ec.message(), LSAERR_SavePathUnreachable);
         return candidate.string();
      }
      candidate = base;
      candidate += "_" + std::to_string(n);
   }
}


std::string
AcquisitionDirectory::RelativeFramePath(size_t sampleIndex, CaptureKind kind,
      size_t timePointIndex, const Channel& channel, size_t zPlaneIndex)
{
   const std::string sample = "sample" + ToString(sampleIndex + 1);
   const std::string acqType = CaptureKindName(kind);
   const std::string timePoint = "timepoint" + ToString(timePointIndex + 1);

   char plane[16];
   std::snprintf(plane, sizeof(plane), "%05lu",
         static_cast<unsigned long>(zPlaneIndex));

   const std::string fileName = sample + "_" + acqType + "_" + timePoint +
      "_" + SanitizePathComponent(channel.GetName()) + "_" + plane;

   return (fs::path(sample) / acqType / timePoint / fileName).string();
}


std::string
AcquisitionDirectory::SanitizePathComponent(const std::string& name)
{
   if (name.empty())
      return "_";
   std::string result(name);
   for (char& ch : result)
   {
      const unsigned char uch = static_cast<unsigned char>(ch);
      if (!std::isalnum(uch) && ch != '-' && ch != '_')
         ch = '_';
   }
   return result;
}


std::string
AcquisitionDirectory::Join(const std::string& parent, const std::string& child)
{
   return (fs::path(parent) / child).string();
}


std::uintmax_t
AcquisitionDirectory::GetFreeMegabytes(const std::string& path)
{
   std::error_code ec;
   const fs::space_info info = fs::space(path, ec);
   if (ec)
      throw CLSAError("Cannot determine free space at " +
            ToQuotedString(path) + ": " + ec.message(),
            LSAERR_SavePathUnreachable);
   return info.available / (1024 * 1024);
}

} // namespace lsa
