///////////////////////////////////////////////////////////////////////////////
// FILE:          LSADeviceConstants.h
// PROJECT:       LSAcq
// SUBSYSTEM:     LSADevice - Hardware capability kit
//-----------------------------------------------------------------------------
// DESCRIPTION:   Global-level constants shared by the acquisition core and
//                the hardware capability implementations.
//
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

#pragma once

///////////////////////////////////////////////////////////////////////////////
// Global error codes
//
#define DEVICE_OK                      0
#define DEVICE_ERR                     1 // generic, undefined error
#define DEVICE_NOT_CONNECTED           2
#define DEVICE_INVALID_INPUT_PARAM     3
#define DEVICE_NOT_SUPPORTED           4
#define DEVICE_CAMERA_NOT_ARMED        5
#define DEVICE_CAMERA_TIMEOUT          6
#define DEVICE_POSITION_OUT_OF_RANGE   7
#define DEVICE_UNKNOWN_PRESET          8
#define DEVICE_WRITE_FAILED            9
#define DEVICE_PATH_UNREACHABLE        10
#define DEVICE_BUFFER_OVERFLOW         11

namespace LSA {

   const int MaxStrLength = 1024;

   // Camera trigger modes relevant to light-sheet scanning. In synchronous
   // readout the camera free-runs while the stage moves continuously; in edge
   // trigger mode each exposure starts on a stage position edge.
   enum TriggerMode {
      SyncReadoutTrigger,
      EdgeTrigger
   };

   // Stage position in micrometers.
   struct StagePosition {
      double xUm;
      double yUm;
      double zUm;

      StagePosition() : xUm(0.0), yUm(0.0), zUm(0.0) {}
      StagePosition(double x, double y, double z) : xUm(x), yUm(y), zUm(z) {}

      bool operator==(const StagePosition& rhs) const
      { return xUm == rhs.xUm && yUm == rhs.yUm && zUm == rhs.zUm; }
      bool operator!=(const StagePosition& rhs) const
      { return !(*this == rhs); }
   };

} // namespace LSA
