// Stub hardware for LSACore unit tests. Each stub records the commands it
// receives and can be told to fail after a number of successful calls.
// Public fields configure behavior; set them before starting a run.

#pragma once

#include "DeviceUtils.h"
#include "LSADevice.h"

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace stub {

// Fails every call once `successes` calls have succeeded; -1 never fails.
// With `throws` set, a failing call throws std::runtime_error instead of
// returning errorCode.
struct FailurePolicy {
   long successes = -1;
   int errorCode = DEVICE_ERR;
   bool throws = false;

   int Fail() const {
      if (throws)
         throw std::runtime_error("device threw");
      return errorCode;
   }

   bool ShouldFail(std::size_t callsSoFar) const {
      return successes >= 0 && static_cast<long>(callsSoFar) >= successes;
   }
};

inline void Delay(std::chrono::milliseconds latency) {
   if (latency.count() > 0)
      std::this_thread::sleep_for(latency);
}

} // namespace stub

struct StubStage : LSA::StageControl {
   std::string name = "StubStage";
   std::chrono::milliseconds latency{0};
   stub::FailurePolicy failure;

   std::vector<LSA::StagePosition> moves;
   std::size_t calls = 0;
   LSA::StagePosition current;

   void GetName(char* buf) const override {
      CDeviceUtils::CopyLimitedString(buf, name.c_str());
   }

   int MoveTo(const LSA::StagePosition& position) override {
      if (failure.ShouldFail(calls++))
         return failure.Fail();
      stub::Delay(latency);
      moves.push_back(position);
      current = position;
      return DEVICE_OK;
   }

   int GetCurrentPosition(LSA::StagePosition& position) override {
      position = current;
      return DEVICE_OK;
   }
};

struct StubCamera : LSA::CameraControl {
   std::string name = "StubCamera";
   unsigned width = 8;
   unsigned height = 4;
   unsigned bytesPerPixel = 2;
   std::chrono::milliseconds latency{0};
   stub::FailurePolicy failure;
   stub::FailurePolicy armFailure;

   std::vector<std::pair<double, LSA::TriggerMode>> arms;
   std::vector<bool> lightSheetReadout;
   std::size_t captures = 0;
   std::size_t captureCalls = 0;

   void GetName(char* buf) const override {
      CDeviceUtils::CopyLimitedString(buf, name.c_str());
   }

   int Arm(double exposureMs, LSA::TriggerMode mode) override {
      if (armFailure.ShouldFail(arms.size()))
         return armFailure.Fail();
      arms.push_back(std::make_pair(exposureMs, mode));
      return DEVICE_OK;
   }

   int SetLightSheetReadout(bool enable) override {
      lightSheetReadout.push_back(enable);
      return DEVICE_OK;
   }

   // Fills the frame with the capture count (mod 256) so that frames can be
   // told apart after saving.
   int Capture() override {
      if (arms.empty())
         return DEVICE_CAMERA_NOT_ARMED;
      if (failure.ShouldFail(captureCalls++))
         return failure.Fail();
      stub::Delay(latency);
      imgBuf_.assign(static_cast<std::size_t>(GetImageBufferSize()),
            static_cast<unsigned char>(captures & 0xff));
      ++captures;
      return DEVICE_OK;
   }

   const unsigned char* GetImageBuffer() override {
      return imgBuf_.empty() ? nullptr : imgBuf_.data();
   }
   unsigned GetImageWidth() const override { return width; }
   unsigned GetImageHeight() const override { return height; }
   unsigned GetImageBytesPerPixel() const override { return bytesPerPixel; }
   long GetImageBufferSize() const override {
      return static_cast<long>(width) * height * bytesPerPixel;
   }

private:
   std::vector<unsigned char> imgBuf_;
};

struct StubFilter : LSA::FilterControl {
   std::string name = "StubFilter";
   std::chrono::milliseconds latency{0};
   stub::FailurePolicy failure;

   std::vector<std::string> selections;
   std::size_t calls = 0;

   void GetName(char* buf) const override {
      CDeviceUtils::CopyLimitedString(buf, name.c_str());
   }

   int Select(const char* preset) override {
      if (failure.ShouldFail(calls++))
         return failure.Fail();
      stub::Delay(latency);
      selections.push_back(preset);
      return DEVICE_OK;
   }
};

// Records writes instead of touching the file system. Called from save
// worker threads, so all state is guarded.
struct StubFrameSink : LSA::FrameSink {
   struct Write {
      std::string path;
      unsigned char firstByte;
      long size;
      std::string meta;
   };

   std::chrono::milliseconds writeLatency{0};

   void GetName(char* buf) const override {
      CDeviceUtils::CopyLimitedString(buf, "StubFrameSink");
   }

   // Writes under a root starting with prefix fail `count` times (-1:
   // always), then succeed.
   void FailWritesUnder(const std::string& prefix, int count = -1) {
      std::lock_guard<std::mutex> lock(mutex_);
      writeFailures_[prefix] = count;
   }

   // Writes under a root starting with prefix throw std::runtime_error
   void ThrowOnWritesUnder(const std::string& prefix) {
      std::lock_guard<std::mutex> lock(mutex_);
      throwPrefixes_.push_back(prefix);
   }

   void FailPrepareUnder(const std::string& prefix) {
      std::lock_guard<std::mutex> lock(mutex_);
      prepareFailures_.push_back(prefix);
   }

   int PrepareDestination(const char* rootPath) override {
      std::lock_guard<std::mutex> lock(mutex_);
      const std::string root(rootPath);
      for (const std::string& prefix : prepareFailures_) {
         if (root.compare(0, prefix.size(), prefix) == 0)
            return DEVICE_PATH_UNREACHABLE;
      }
      prepared_.push_back(root);
      return DEVICE_OK;
   }

   int WriteFrame(const char* destinationPath, const unsigned char* pixels,
         long sizeInBytes, const char* imageMeta) override {
      stub::Delay(writeLatency);
      std::lock_guard<std::mutex> lock(mutex_);
      const std::string path(destinationPath);
      for (const std::string& prefix : throwPrefixes_) {
         if (path.compare(0, prefix.size(), prefix) == 0)
            throw std::runtime_error("sink exploded");
      }
      for (auto& failure : writeFailures_) {
         if (path.compare(0, failure.first.size(), failure.first) != 0)
            continue;
         if (failure.second != 0) {
            if (failure.second > 0)
               --failure.second;
            ++failedWrites_;
            return DEVICE_WRITE_FAILED;
         }
      }
      writes_.push_back(Write{ path, sizeInBytes > 0 ? pixels[0] : 0,
            sizeInBytes, imageMeta ? imageMeta : "" });
      return DEVICE_OK;
   }

   std::vector<Write> WritesUnder(const std::string& prefix) const {
      std::lock_guard<std::mutex> lock(mutex_);
      std::vector<Write> result;
      for (const Write& w : writes_) {
         if (w.path.compare(0, prefix.size(), prefix) == 0)
            result.push_back(w);
      }
      return result;
   }

   std::vector<std::string> Prepared() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return prepared_;
   }

   std::size_t FailedWrites() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return failedWrites_;
   }

private:
   mutable std::mutex mutex_;
   std::map<std::string, int> writeFailures_;
   std::vector<std::string> prepareFailures_;
   std::vector<std::string> throwPrefixes_;
   std::vector<std::string> prepared_;
   std::vector<Write> writes_;
   std::size_t failedWrites_ = 0;
};
