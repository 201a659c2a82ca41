#include <catch2/catch_all.hpp>

#include "AcquisitionCore.h"
#include "RecordingCallback.h"
#include "StubDevices.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace {

const std::string PrimaryRoot = "/nonexistent-lsacq/core";

std::vector<lsa::Sample> MakeSamples(size_t count)
{
   std::vector<lsa::Sample> samples;
   for (size_t i = 0; i < count; ++i)
   {
      LSA::StagePosition pos;
      pos.xUm = 100.0 * static_cast<double>(i);
      samples.push_back(lsa::Sample("fish" + std::to_string(i + 1), pos));
   }
   return samples;
}

lsa::AcquisitionSettings MakeSettings()
{
   return lsa::AcquisitionSettingsBuilder()
      .PrimarySavePath(PrimaryRoot)
      .Build();
}

struct CoreRig
{
   StubStage stage;
   StubCamera camera;
   StubFilter filter;
   StubFrameSink sink;
};

} // anonymous namespace


TEST_CASE("start and wait for an acquisition", "[AcquisitionCore]")
{
   CoreRig rig;
   RecordingCallback callback;
   CAcquisitionCore core(&rig.stage, &rig.camera, &rig.filter, &rig.sink);
   core.registerCallback(&callback);

   CAcquisitionCore::RunHandle handle =
      core.startAcquisition(MakeSettings(), MakeSamples(2), 3, 2);
   CHECK(core.waitForAcquisition(handle) == lsa::AcquisitionStateCompleted);

   CHECK_FALSE(core.isAcquisitionRunning());
   CHECK(core.getAcquisitionState(handle) == lsa::AcquisitionStateCompleted);
   CHECK_FALSE(core.hasAcquisitionError(handle));
   CHECK(core.getPlannedStepCount(handle) == 12);
   CHECK(core.getCompletedStepCount(handle) == 12);
   CHECK(core.getWarningCount(handle) == 0);
   CHECK(std::filesystem::path(core.getAcquisitionDirectory(handle)) ==
         std::filesystem::path(PrimaryRoot) / "Acquisition");
   CHECK(rig.sink.WritesUnder(core.getAcquisitionDirectory(handle)).size() == 12);

   CHECK(callback.Steps().size() == 12);
   CHECK(callback.Completed() == 1);
   CHECK(callback.States().back() == "Completed");
}


TEST_CASE("callbacks can be replaced from inside an event", "[AcquisitionCore]")
{
   CoreRig rig;
   CAcquisitionCore core(&rig.stage, &rig.camera, &rig.filter, &rig.sink);
   RecordingCallback first;
   RecordingCallback second;
   first.onStep = [&](long step) {
      if (step == 3)
         core.registerCallback(&second);
   };
   second.onStep = [&](long step) {
      if (step == 7)
         core.registerCallback(nullptr);
   };
   core.registerCallback(&first);

   CAcquisitionCore::RunHandle handle =
      core.startAcquisition(MakeSettings(), MakeSamples(2), 3, 2);
   CHECK(core.waitForAcquisition(handle) == lsa::AcquisitionStateCompleted);

   CHECK(first.Steps() == std::vector<long>{ 0, 1, 2, 3 });
   CHECK(second.Steps() == std::vector<long>{ 4, 5, 6, 7 });
   CHECK(first.Completed() == 0);
   CHECK(second.Completed() == 0);
   CHECK(core.getCompletedStepCount(handle) == 12);
}


TEST_CASE("configuration errors end the run in Failed", "[AcquisitionCore]")
{
   CoreRig rig;
   RecordingCallback callback;
   CAcquisitionCore core(&rig.stage, &rig.camera, &rig.filter, &rig.sink);
   core.registerCallback(&callback);

   lsa::AcquisitionSettings s = lsa::AcquisitionSettingsBuilder()
      .PrimarySavePath(PrimaryRoot)
      .SpectralZStack(true)
      .Build();
   CAcquisitionCore::RunHandle handle =
      core.startAcquisition(s, MakeSamples(1), 1, 1);
   CHECK(core.waitForAcquisition(handle) == lsa::AcquisitionStateFailed);
   REQUIRE(core.hasAcquisitionError(handle));
   CHECK(core.getAcquisitionError(handle).getCode() == LSAERR_EmptyChannelOrder);

   const auto failures = callback.Failures();
   REQUIRE(failures.size() == 1);
   CHECK(failures[0].code == LSAERR_EmptyChannelOrder);
}


TEST_CASE("one acquisition at a time", "[AcquisitionCore]")
{
   CoreRig rig;
   rig.camera.latency = std::chrono::milliseconds(20);
   CAcquisitionCore core(&rig.stage, &rig.camera, &rig.filter, &rig.sink);
   RecordingCallback callback;
   core.registerCallback(&callback);

   CAcquisitionCore::RunHandle first =
      core.startAcquisition(MakeSettings(), MakeSamples(1), 1, 500);
   CHECK(core.isAcquisitionRunning());
   try
   {
      core.startAcquisition(MakeSettings(), MakeSamples(1), 1, 1);
      FAIL("expected CLSAError");
   }
   catch (const CLSAError& e)
   {
      CHECK(e.getCode() == LSAERR_RunInProgress);
   }

   core.cancelAcquisition(first);
   CHECK(core.waitForAcquisition(first) == lsa::AcquisitionStateAborted);
   CHECK(core.getCompletedStepCount(first) < 500);
   CHECK(callback.Aborted() == 1);

   // Cancelling an ended run is harmless
   core.cancelAcquisition(first);

   CAcquisitionCore::RunHandle second =
      core.startAcquisition(MakeSettings(), MakeSamples(1), 1, 2);
   CHECK(second != first);
   CHECK(core.waitForAcquisition(second) == lsa::AcquisitionStateCompleted);
   CHECK(core.getAcquisitionState(first) == lsa::AcquisitionStateAborted);
   CHECK(core.getCompletedStepCount(second) == 2);
}


TEST_CASE("unknown run handle", "[AcquisitionCore]")
{
   CoreRig rig;
   CAcquisitionCore core(&rig.stage, &rig.camera, &rig.filter, &rig.sink);
   try
   {
      core.getAcquisitionState(42);
      FAIL("expected CLSAError");
   }
   catch (const CLSAError& e)
   {
      CHECK(e.getCode() == LSAERR_UnknownRunHandle);
   }
   CHECK_THROWS_AS(core.cancelAcquisition(42), CLSAError);
   CHECK_THROWS_AS(core.waitForAcquisition(42), CLSAError);
}


TEST_CASE("null devices are rejected", "[AcquisitionCore]")
{
   CoreRig rig;
   CHECK_THROWS_AS(CAcquisitionCore(&rig.stage, nullptr, &rig.filter,
            &rig.sink), CLSAError);
}


TEST_CASE("save queue capacity", "[AcquisitionCore]")
{
   CoreRig rig;
   CAcquisitionCore core(&rig.stage, &rig.camera, &rig.filter, &rig.sink);
   CHECK(core.getSaveQueueCapacity() == 16);
   core.setSaveQueueCapacity(3);
   CHECK(core.getSaveQueueCapacity() == 3);
   core.setSaveQueueCapacity(0);
   CHECK(core.getSaveQueueCapacity() == 1);

   CAcquisitionCore::RunHandle handle =
      core.startAcquisition(MakeSettings(), MakeSamples(2), 2, 3);
   CHECK(core.waitForAcquisition(handle) == lsa::AcquisitionStateCompleted);
}


TEST_CASE("core features and version", "[AcquisitionCore]")
{
   CHECK(CAcquisitionCore::isFeatureEnabled("SecondSavePathReachabilityCheck"));
   CAcquisitionCore::enableFeature("DiskSpaceCheck", true);
   CHECK(CAcquisitionCore::isFeatureEnabled("DiskSpaceCheck"));
   CAcquisitionCore::enableFeature("DiskSpaceCheck", false);
   CHECK_THROWS_AS(CAcquisitionCore::enableFeature("Bogus", true), CLSAError);
   CHECK_THROWS_AS(CAcquisitionCore::isFeatureEnabled(nullptr), CLSAError);

   CoreRig rig;
   CAcquisitionCore core(&rig.stage, &rig.camera, &rig.filter, &rig.sink);
   CHECK(core.getVersionInfo() == "LSACore version 1.2.0 (device interface 3)");
   CHECK(CAcquisitionCore::getLSADeviceInterfaceVersion() ==
         LSA_DEVICE_INTERFACE_VERSION);
}


TEST_CASE("core log file", "[AcquisitionCore]")
{
   namespace fs = std::filesystem;
   const fs::path dir = fs::temp_directory_path() / "lsacq-core-log-test";
   fs::create_directories(dir);
   const fs::path file = dir / "core.log";

   {
      CoreRig rig;
      CAcquisitionCore core(&rig.stage, &rig.camera, &rig.filter, &rig.sink);
      core.setPrimaryLogFile(file.string().c_str(), true);
      CHECK(core.getPrimaryLogFile() == file.string());

      CHECK_FALSE(core.debugLogEnabled());
      core.logMessage("info message");
      core.logMessage("debug message hidden", true);
      core.enableDebugLog(true);
      CHECK(core.debugLogEnabled());
      core.logMessage("debug message shown", true);

      CHECK_FALSE(core.stderrLogEnabled());

      CAcquisitionCore::RunHandle handle =
         core.startAcquisition(MakeSettings(), MakeSamples(1), 1, 1);
      core.waitForAcquisition(handle);

      CHECK_THROWS_AS(core.setPrimaryLogFile(
               "/nonexistent-lsacq-dir/sub/core.log"), CLSAError);
      CHECK(core.getPrimaryLogFile().empty());
   }

   std::ifstream ifs(file);
   std::ostringstream oss;
   oss << ifs.rdbuf();
   const std::string contents = oss.str();
   CHECK(contents.find("App: info message") != std::string::npos);
   CHECK(contents.find("debug message shown") != std::string::npos);
   CHECK(contents.find("Run 1: Running -> Completed") != std::string::npos);
   CHECK(contents.find("[IFO,Driver:1] Run 1: Running -> Completed") !=
         std::string::npos);

   fs::remove_all(dir);
}
