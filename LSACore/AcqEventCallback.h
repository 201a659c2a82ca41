///////////////////////////////////////////////////////////////////////////////
// FILE:          AcqEventCallback.h
// PROJECT:       LSAcq
// SUBSYSTEM:     LSACore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Callback class used to send acquisition notifications from
//                the core to higher levels (such as the settings dialog)
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
//
#pragma once
#include <iostream>

/**
 * Receiver of acquisition events. All methods are called from the run's
 * control thread, one at a time. The default implementations print to
 * stdout; override the ones of interest.
 */
class AcqEventCallback
{
public:
   AcqEventCallback() {}
   virtual ~AcqEventCallback() {}

   virtual void onAcquisitionStateChanged(int runHandle, const char* state)
   {
      std::cout << "onAcquisitionStateChanged() " << runHandle << " " << state << '\n';
   }

   /**
    * \brief Called after a step's frame has been handed to the save
    * dispatcher.
    *
    * stepIndex is zero-based; stepCount is the size of the plan.
    */
   virtual void onStepCompleted(int runHandle, long stepIndex, long stepCount)
   {
      std::cout << "onStepCompleted() " << runHandle << " " << stepIndex << "/" << stepCount << '\n';
   }

   /**
    * \brief Called for non-fatal errors, such as a failed write to the
    * secondary save destination. The run continues.
    */
   virtual void onWarning(int runHandle, int code, const char* message)
   {
      std::cout << "onWarning() " << runHandle << " " << code << " " << message << '\n';
   }

   virtual void onAcquisitionCompleted(int runHandle)
   {
      std::cout << "onAcquisitionCompleted() " << runHandle << '\n';
   }

   virtual void onAcquisitionAborted(int runHandle)
   {
      std::cout << "onAcquisitionAborted() " << runHandle << '\n';
   }

   virtual void onAcquisitionFailed(int runHandle, int code, const char* message)
   {
      std::cout << "onAcquisitionFailed() " << runHandle << " " << code << " " << message << '\n';
   }
};
