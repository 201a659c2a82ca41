///////////////////////////////////////////////////////////////////////////////
// FILE:          LSADevice.h
// PROJECT:       LSAcq
// SUBSYSTEM:     LSADevice - Hardware capability kit
//-----------------------------------------------------------------------------
// DESCRIPTION:   Capability interfaces through which the acquisition core
//                drives the stage, camera, filter and persistence hardware.
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
// Header version
// If any of the class definitions changes, the interface version
// must be incremented
#define LSA_DEVICE_INTERFACE_VERSION 3
///////////////////////////////////////////////////////////////////////////////

// N.B.
//
// All methods return an integer status code (DEVICE_OK on success) and pass
// strings as const char* or caller-provided buffers of LSA::MaxStrLength.
// Implementations wrap vendor SDKs and must never throw across this
// interface.

#include "DeviceUtils.h"
#include "LSADeviceConstants.h"

namespace LSA {

   /**
    * Common base of all hardware capabilities.
    */
   class Device {
   public:
      Device() {}
      virtual ~Device() {}

      virtual void GetName(char* name) const = 0;

      /**
       * Returns the text for an error code returned by this device. The
       * default covers the global codes in LSADeviceConstants.h; devices
       * with private codes should override it.
       */
      virtual bool GetErrorText(int errorCode, char* errMessage) const
      {
         return CDeviceUtils::CopyLimitedString(errMessage,
               CDeviceUtils::DefaultErrorText(errorCode));
      }
   };

   /**
    * Sample stage (X, Y and scan axis Z).
    */
   class StageControl : public Device {
   public:
      StageControl() {}
      virtual ~StageControl() {}

      /**
       * Moves to the absolute position and blocks until the move has been
       * acknowledged by the controller.
       */
      virtual int MoveTo(const StagePosition& position) = 0;
      virtual int GetCurrentPosition(StagePosition& position) = 0;
   };

   /**
    * Camera with externally selectable trigger mode.
    */
   class CameraControl : public Device {
   public:
      CameraControl() {}
      virtual ~CameraControl() {}

      /**
       * Prepares the camera for a series of captures with the given exposure
       * and trigger mode. Must succeed before Capture() is called.
       */
      virtual int Arm(double exposureMs, TriggerMode mode) = 0;

      /**
       * Enables or disables light-sheet readout mode. Takes effect at the
       * next Arm().
       */
      virtual int SetLightSheetReadout(bool enable) = 0;

      /**
       * Triggers one exposure and blocks until the frame is in memory. The
       * pixel data is then available through GetImageBuffer() until the next
       * call to Capture().
       */
      virtual int Capture() = 0;

      virtual const unsigned char* GetImageBuffer() = 0;
      virtual unsigned GetImageWidth() const = 0;
      virtual unsigned GetImageHeight() const = 0;
      virtual unsigned GetImageBytesPerPixel() const = 0;
      virtual long GetImageBufferSize() const = 0;
   };

   /**
    * Filter wheel and laser line selection. A preset names the combination
    * of filter position and illumination for one channel.
    */
   class FilterControl : public Device {
   public:
      FilterControl() {}
      virtual ~FilterControl() {}

      virtual int Select(const char* preset) = 0;
   };

   /**
    * Persistence of captured frames. Called concurrently from save workers,
    * at most one call at a time per destination root.
    */
   class FrameSink : public Device {
   public:
      FrameSink() {}
      virtual ~FrameSink() {}

      /**
       * Makes sure a destination root exists and is writable.
       */
      virtual int PrepareDestination(const char* rootPath) = 0;

      /**
       * Writes one frame. destinationPath is the full path of the frame
       * without extension; imageMeta is a JSON document.
       */
      virtual int WriteFrame(const char* destinationPath,
            const unsigned char* pixels, long sizeInBytes,
            const char* imageMeta) = 0;
   };

} // namespace LSA
