///////////////////////////////////////////////////////////////////////////////
// FILE:          FileFrameSink.cpp
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

#include "FileFrameSink.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace lsa {

namespace {

const char* const ProbeFileName = ".lsacq-write-probe";

bool WriteFile(const fs::path& path, const char* data, long size)
{
   std::ofstream ofs(path, std::ios_base::out | std::ios_base::binary |
         std::ios_base::trunc);
   if (!ofs)
      return false;
   if (size > 0)
      ofs.write(data, size);
   ofs.close();
   return !ofs.fail();
}

} // anonymous namespace


void
FileFrameSink::GetName(char* name) const
{
   CDeviceUtils::CopyLimitedString(name, "FileFrameSink");
}


bool
FileFrameSink::GetErrorText(int errorCode, char* errMessage) const
{
   switch (errorCode)
   {
      case DEVICE_PATH_UNREACHABLE:
         return CDeviceUtils::CopyLimitedString(errMessage,
               "Destination directory cannot be created or is not writable");
      case DEVICE_WRITE_FAILED:
         return CDeviceUtils::CopyLimitedString(errMessage,
               "Failed to write frame file");
      default:
         return LSA::FrameSink::GetErrorText(errorCode, errMessage);
   }
}


int
FileFrameSink::PrepareDestination(const char* rootPath)
{
   if (!rootPath || !*rootPath)
      return DEVICE_INVALID_INPUT_PARAM;

   const fs::path root(rootPath);
   std::error_code ec;
   fs::create_directories(root, ec);
   if (ec || !fs::is_directory(root, ec))
      return DEVICE_PATH_UNREACHABLE;

   const fs::path probe = root / ProbeFileName;
   if (!WriteFile(probe, "", 0))
      return DEVICE_PATH_UNREACHABLE;
   if (!fs::remove(probe, ec) || ec)
      return DEVICE_PATH_UNREACHABLE;
   return DEVICE_OK;
}


int
FileFrameSink::WriteFrame(const char* destinationPath,
      const unsigned char* pixels, long sizeInBytes, const char* imageMeta)
{
   if (!destinationPath || !*destinationPath || !pixels || sizeInBytes < 0)
      return DEVICE_INVALID_INPUT_PARAM;

   const fs::path base(destinationPath);
   std::error_code ec;
   if (base.has_parent_path())
   {
      fs::create_directories(base.parent_path(), ec);
      if (ec)
         return DEVICE_PATH_UNREACHABLE;
   }

   fs::path rawPath = base;
   rawPath += ".raw";
   if (!WriteFile(rawPath, reinterpret_cast<const char*>(pixels), sizeInBytes))
      return DEVICE_WRITE_FAILED;

   if (imageMeta)
   {
      fs::path metaPath = base;
      metaPath += ".json";
      const std::string meta(imageMeta);
      if (!WriteFile(metaPath, meta.data(), static_cast<long>(meta.size())))
         return DEVICE_WRITE_FAILED;
   }
   return DEVICE_OK;
}

} // namespace lsa
