///////////////////////////////////////////////////////////////////////////////
// FILE:          EventRelay.h
// PROJECT:       LSAcq
// SUBSYSTEM:     LSACore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Forwards acquisition events to the registered callback
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

#include "AcqEventCallback.h"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

namespace lsa {

// Lets the registered callback be replaced while a run is delivering events.
// The lock is not held while the target runs, so a target may call
// SetTarget() from inside an event. When SetTarget() returns, no other thread
// is still delivering to the previous target.
class EventRelay : public AcqEventCallback
{
   std::mutex mutex_;
   std::condition_variable idleCv_;
   AcqEventCallback* target_;
   std::vector<std::thread::id> delivering_;

   class Delivery
   {
      EventRelay& relay_;
      AcqEventCallback* target_;

   public:
      explicit Delivery(EventRelay& relay) : relay_(relay), target_(nullptr)
      {
         std::lock_guard<std::mutex> lock(relay_.mutex_);
         target_ = relay_.target_;
         if (target_)
            relay_.delivering_.push_back(std::this_thread::get_id());
      }

      ~Delivery()
      {
         if (!target_)
            return;
         {
            std::lock_guard<std::mutex> lock(relay_.mutex_);
            std::vector<std::thread::id>& ids = relay_.delivering_;
            ids.erase(std::find(ids.begin(), ids.end(),
                     std::this_thread::get_id()));
         }
         relay_.idleCv_.notify_all();
      }

      Delivery(const Delivery&) = delete;
      Delivery& operator=(const Delivery&) = delete;

      AcqEventCallback* Target() const { return target_; }
   };

public:
   EventRelay() : target_(nullptr) {}

   void SetTarget(AcqEventCallback* target)
   {
      std::unique_lock<std::mutex> lock(mutex_);
      target_ = target;
      const std::thread::id self = std::this_thread::get_id();
      idleCv_.wait(lock, [this, self] {
         return std::all_of(delivering_.begin(), delivering_.end(),
               [self](std::thread::id id) { return id == self; });
      });
   }

   void onAcquisitionStateChanged(int runHandle, const char* state) override
   {
      Delivery delivery(*this);
      if (delivery.Target())
         delivery.Target()->onAcquisitionStateChanged(runHandle, state);
   }

   void onStepCompleted(int runHandle, long stepIndex, long stepCount) override
   {
      Delivery delivery(*this);
      if (delivery.Target())
         delivery.Target()->onStepCompleted(runHandle, stepIndex, stepCount);
   }

   void onWarning(int runHandle, int code, const char* message) override
   {
      Delivery delivery(*this);
      if (delivery.Target())
         delivery.Target()->onWarning(runHandle, code, message);
   }

   void onAcquisitionCompleted(int runHandle) override
   {
      Delivery delivery(*this);
      if (delivery.Target())
         delivery.Target()->onAcquisitionCompleted(runHandle);
   }

   void onAcquisitionAborted(int runHandle) override
   {
      Delivery delivery(*this);
      if (delivery.Target())
         delivery.Target()->onAcquisitionAborted(runHandle);
   }

   void onAcquisitionFailed(int runHandle, int code, const char* message) override
   {
      Delivery delivery(*this);
      if (delivery.Target())
         delivery.Target()->onAcquisitionFailed(runHandle, code, message);
   }
};

} // namespace lsa
