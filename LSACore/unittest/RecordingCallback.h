// Event receiver for LSACore unit tests. Events may arrive on a run thread
// while the test thread inspects them, so all state is guarded.

#pragma once

#include "AcqEventCallback.h"

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

class RecordingCallback : public AcqEventCallback {
public:
   struct Warning {
      int code;
      std::string message;
   };

   // Called from onStepCompleted(), e.g. to cancel at a given step
   std::function<void(long)> onStep;

   void onAcquisitionStateChanged(int, const char* state) override {
      std::lock_guard<std::mutex> lock(mutex_);
      states_.push_back(state);
   }

   void onStepCompleted(int, long stepIndex, long stepCount) override {
      {
         std::lock_guard<std::mutex> lock(mutex_);
         steps_.push_back(stepIndex);
         stepCount_ = stepCount;
      }
      if (onStep)
         onStep(stepIndex);
   }

   void onWarning(int, int code, const char* message) override {
      std::lock_guard<std::mutex> lock(mutex_);
      warnings_.push_back(Warning{ code, message });
   }

   void onAcquisitionCompleted(int) override {
      std::lock_guard<std::mutex> lock(mutex_);
      ++completed_;
   }

   void onAcquisitionAborted(int) override {
      std::lock_guard<std::mutex> lock(mutex_);
      ++aborted_;
   }

   void onAcquisitionFailed(int, int code, const char* message) override {
      std::lock_guard<std::mutex> lock(mutex_);
      failures_.push_back(Warning{ code, message });
   }

   std::vector<std::string> States() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return states_;
   }
   std::vector<long> Steps() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return steps_;
   }
   long StepCount() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return stepCount_;
   }
   std::vector<Warning> Warnings() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return warnings_;
   }
   std::vector<Warning> Failures() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return failures_;
   }
   int Completed() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return completed_;
   }
   int Aborted() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return aborted_;
   }

private:
   mutable std::mutex mutex_;
   std::vector<std::string> states_;
   std::vector<long> steps_;
   long stepCount_ = 0;
   std::vector<Warning> warnings_;
   std::vector<Warning> failures_;
   int completed_ = 0;
   int aborted_ = 0;
};
