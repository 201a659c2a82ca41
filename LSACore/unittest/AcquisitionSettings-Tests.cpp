#include <catch2/catch_all.hpp>

#include "AcquisitionSettings.h"
#include "Error.h"

#include <limits>

namespace lsa {

namespace {

int BuildErrorCode(const AcquisitionSettingsBuilder& builder)
{
   try
   {
      builder.Build();
   }
   catch (const CLSAError& e)
   {
      return e.getCode();
   }
   return LSAERR_OK;
}

} // anonymous namespace


TEST_CASE("builder defaults", "[AcquisitionSettings]")
{
   AcquisitionSettings s = AcquisitionSettingsBuilder()
      .PrimarySavePath("/data")
      .Build();

   CHECK(s.GetZStackExposureMs() == 33.0);
   CHECK(s.GetVideoExposureMs() == 20.0);
   CHECK(s.GetStageSpeed() == StageSpeed30UmPerSec);
   CHECK(s.GetStageSpeedUmPerSec() == 30);
   CHECK(s.GetAcquisitionOrder() == AcquisitionOrderTimeSamp);
   CHECK(s.GetCaptureKind() == CaptureKindZStack);
   CHECK_FALSE(s.IsSpectralVideo());
   CHECK_FALSE(s.IsSpectralZStack());
   CHECK_FALSE(s.IsEdgeTrigger());
   CHECK_FALSE(s.IsLsrmEnabled());
   CHECK_FALSE(s.IsSecondSavePathEnabled());
   CHECK(s.GetSecondSavePath().empty());
   CHECK(s.GetChannelOrder().empty());
   CHECK(s.GetDefaultChannel().GetName() == "Default");
   CHECK(s.GetTimePointIntervalMin() == 0.0);
   CHECK(s.GetTriggerMode() == LSA::SyncReadoutTrigger);
}


TEST_CASE("builder applies every field", "[AcquisitionSettings]")
{
   AcquisitionSettings s = AcquisitionSettingsBuilder()
      .ZStackExposureMs(50.0)
      .VideoExposureMs(10.0)
      .StageSpeedUmPerSec(15)
      .Order(AcquisitionOrderSampTime)
      .Capture(CaptureKindVideo)
      .SpectralVideo(true)
      .EdgeTrigger(true)
      .Lsrm(true)
      .PrimarySavePath("/data")
      .SecondSavePathEnabled(true)
      .SecondSavePath("/mnt/share")
      .AddChannel(Channel("GFP", "Filter-488"))
      .AddChannel(Channel("RFP", "Filter-561"))
      .ZStepUm(2.5)
      .TimePointIntervalMin(1.5)
      .Build();

   CHECK(s.GetZStackExposureMs() == 50.0);
   CHECK(s.GetVideoExposureMs() == 10.0);
   CHECK(s.GetStageSpeed() == StageSpeed15UmPerSec);
   CHECK(s.GetAcquisitionOrder() == AcquisitionOrderSampTime);
   CHECK(s.GetCaptureKind() == CaptureKindVideo);
   CHECK(s.GetCaptureExposureMs() == 10.0);
   CHECK(s.IsSpectralVideo());
   CHECK(s.IsEdgeTrigger());
   CHECK(s.GetTriggerMode() == LSA::EdgeTrigger);
   CHECK(s.IsLsrmEnabled());
   CHECK(s.IsSecondSavePathEnabled());
   CHECK(s.GetSecondSavePath() == "/mnt/share");
   REQUIRE(s.GetChannelOrder().size() == 2);
   CHECK(s.GetChannelOrder()[1].GetPreset() == "Filter-561");
   CHECK(s.GetDefaultChannel() == Channel("GFP", "Filter-488"));
   CHECK(s.GetZStepUm() == 2.5);
   CHECK(s.GetTimePointIntervalMin() == 1.5);

   const std::string description = s.Describe();
   CHECK(description.find("video") != std::string::npos);
   CHECK(description.find("SAMP_TIME") != std::string::npos);
   CHECK(description.find("Edge") != std::string::npos);
}


TEST_CASE("explicit default channel is kept", "[AcquisitionSettings]")
{
   AcquisitionSettings s = AcquisitionSettingsBuilder()
      .PrimarySavePath("/data")
      .AddChannel(Channel("GFP"))
      .DefaultChannel(Channel("BF", "Brightfield"))
      .Build();
   CHECK(s.GetDefaultChannel().GetName() == "BF");
   CHECK(s.GetDefaultChannel().GetPreset() == "Brightfield");
}


TEST_CASE("unsupported stage speed is rejected", "[AcquisitionSettings]")
{
   CHECK(IsSupportedStageSpeed(15));
   CHECK(IsSupportedStageSpeed(30));
   CHECK_FALSE(IsSupportedStageSpeed(20));
   CHECK(BuildErrorCode(AcquisitionSettingsBuilder()
            .PrimarySavePath("/data")
            .StageSpeedUmPerSec(20)) == LSAERR_InvalidStageSpeed);
}


TEST_CASE("second save path present iff enabled", "[AcquisitionSettings]")
{
   CHECK(BuildErrorCode(AcquisitionSettingsBuilder()
            .PrimarySavePath("/data")
            .SecondSavePathEnabled(true)) == LSAERR_MissingSavePath);

   AcquisitionSettings s = AcquisitionSettingsBuilder()
      .PrimarySavePath("/data")
      .SecondSavePath("/mnt/share")
      .Build();
   CHECK_FALSE(s.IsSecondSavePathEnabled());
   CHECK(s.GetSecondSavePath().empty());
}


TEST_CASE("time point interval must be finite and in range", "[AcquisitionSettings]")
{
   const double interval = GENERATE(-1.0, 1e12,
         std::numeric_limits<double>::infinity(),
         std::numeric_limits<double>::quiet_NaN(),
         MaxTimePointIntervalMin + 1.0);
   CHECK(BuildErrorCode(AcquisitionSettingsBuilder()
            .PrimarySavePath("/data")
            .TimePointIntervalMin(interval)) == LSAERR_InvalidInterval);

   AcquisitionSettings longest = AcquisitionSettingsBuilder()
      .PrimarySavePath("/data")
      .TimePointIntervalMin(MaxTimePointIntervalMin)
      .Build();
   CHECK(longest.GetTimePointIntervalMin() == MaxTimePointIntervalMin);
}


TEST_CASE("enum names", "[AcquisitionSettings]")
{
   CHECK(std::string(AcquisitionOrderName(AcquisitionOrderTimeSamp)) == "TIME_SAMP");
   CHECK(std::string(AcquisitionOrderName(AcquisitionOrderSampTime)) == "SAMP_TIME");
   CHECK(std::string(CaptureKindName(CaptureKindZStack)) == "zstack");
   CHECK(std::string(CaptureKindName(CaptureKindVideo)) == "video");
}

} // namespace lsa
