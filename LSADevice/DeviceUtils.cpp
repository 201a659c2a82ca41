///////////////////////////////////////////////////////////////////////////////
// FILE:          DeviceUtils.cpp
// PROJECT:       LSAcq
// SUBSYSTEM:     LSADevice - Hardware capability kit
//-----------------------------------------------------------------------------
// DESCRIPTION:   Utility functions for hardware capability implementations
// LICENSE:       This file is distributed under the BSD license.
//                License text is included with the source distribution.
//
//                This file is distributed in the hope that it will be useful,
//                but WITHOUT ANY WARRANTY; without even the implied warranty
//                of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//
//                IN NO EVENT SHALL THE COPYRIGHT OWNER OR
//                CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT,
//                INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES.
//

#include "DeviceUtils.h"

#include <cstring>

bool CDeviceUtils::CopyLimitedString(char* target, const char* source)
{
   std::strncpy(target, source, LSA::MaxStrLength - 1);
   if ((LSA::MaxStrLength - 1) < std::strlen(source))
   {
      target[LSA::MaxStrLength - 1] = 0;
      return false;
   }
   return true;
}

unsigned CDeviceUtils::GetMaxStringLength()
{
   return LSA::MaxStrLength;
}

const char* CDeviceUtils::DefaultErrorText(int errorCode)
{
   switch (errorCode)
   {
      case DEVICE_OK: return "No error";
      case DEVICE_ERR: return "Unspecified device error";
      case DEVICE_NOT_CONNECTED: return "Device not connected";
      case DEVICE_INVALID_INPUT_PARAM: return "Invalid input parameter";
      case DEVICE_NOT_SUPPORTED: return "Operation not supported by device";
      case DEVICE_CAMERA_NOT_ARMED: return "Camera has not been armed";
      case DEVICE_CAMERA_TIMEOUT: return "Timed out waiting for camera frame";
      case DEVICE_POSITION_OUT_OF_RANGE: return "Requested position out of range";
      case DEVICE_UNKNOWN_PRESET: return "Unknown channel preset";
      case DEVICE_WRITE_FAILED: return "Write failed";
      case DEVICE_PATH_UNREACHABLE: return "Destination path unreachable";
      case DEVICE_BUFFER_OVERFLOW: return "Buffer overflow";
      default: return "Unknown device error";
   }
}
