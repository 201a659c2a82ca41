#include <catch2/catch_all.hpp>

#include "Error.h"
#include "TimingValidator.h"

namespace lsa {

namespace {

AcquisitionSettingsBuilder BaseBuilder()
{
   AcquisitionSettingsBuilder builder;
   builder.PrimarySavePath("/data");
   return builder;
}

int ValidationErrorCode(const AcquisitionSettings& settings)
{
   try
   {
      ValidateSettings(settings);
   }
   catch (const CLSAError& e)
   {
      return e.getCode();
   }
   return LSAERR_OK;
}

} // anonymous namespace


TEST_CASE("continuous scan boundary at 30 um/s", "[TimingValidator]")
{
   AcquisitionSettings ok = BaseBuilder()
      .ZStackExposureMs(33.0).StageSpeedUmPerSec(30).Build();
   CHECK(IsContinuousScan(ok));
   CHECK(CheckTiming(ok) == LSAERR_OK);
   CHECK(CheckSettings(ok) == LSAERR_OK);
   CHECK_NOTHROW(ValidateSettings(ok));

   AcquisitionSettings tooLong = BaseBuilder()
      .ZStackExposureMs(34.0).StageSpeedUmPerSec(30).Build();
   CHECK(CheckTiming(tooLong) == LSAERR_ExceedsStageSpeedLimit);
   CHECK(ValidationErrorCode(tooLong) == LSAERR_ExceedsStageSpeedLimit);
}


TEST_CASE("limit holds iff product does not exceed 1000", "[TimingValidator]")
{
   const int speed = GENERATE(15, 30);
   const double exposure = GENERATE(1.0, 33.0, 33.4, 34.0, 50.0, 66.0, 66.7, 67.0, 200.0);

   AcquisitionSettings s = BaseBuilder()
      .ZStackExposureMs(exposure).StageSpeedUmPerSec(speed).Build();
   const bool expectedOk = exposure * speed <= 1000.0;
   CHECK((CheckTiming(s) == LSAERR_OK) == expectedOk);
   CHECK(IsWithinStageSpeedLimit(exposure, speed) == expectedOk);
}


TEST_CASE("exact boundary is accepted", "[TimingValidator]")
{
   CHECK(IsWithinStageSpeedLimit(50.0, 20));
   CHECK_FALSE(IsWithinStageSpeedLimit(50.5, 20));
   CHECK(MaxContinuousScanExposureMs(30) == Catch::Approx(33.333333));
}


TEST_CASE("edge trigger is exempt from the limit", "[TimingValidator]")
{
   const double exposure = GENERATE(34.0, 500.0, 10000.0);
   AcquisitionSettings s = BaseBuilder()
      .ZStackExposureMs(exposure).StageSpeedUmPerSec(30).EdgeTrigger(true)
      .Build();
   CHECK_FALSE(IsContinuousScan(s));
   CHECK(CheckSettings(s) == LSAERR_OK);
}


TEST_CASE("spectral Z-stack is exempt from the limit", "[TimingValidator]")
{
   AcquisitionSettings s = BaseBuilder()
      .ZStackExposureMs(100.0).StageSpeedUmPerSec(30).SpectralZStack(true)
      .AddChannel(Channel("GFP"))
      .Build();
   CHECK_FALSE(IsContinuousScan(s));
   CHECK(CheckSettings(s) == LSAERR_OK);
}


TEST_CASE("both spectral modes are rejected", "[TimingValidator]")
{
   AcquisitionSettings s = BaseBuilder()
      .SpectralVideo(true).SpectralZStack(true)
      .AddChannel(Channel("GFP"))
      .Build();
   CHECK(ValidationErrorCode(s) == LSAERR_ConflictingSpectralModes);
}


TEST_CASE("spectral mode needs channels", "[TimingValidator]")
{
   AcquisitionSettings zstack = BaseBuilder().SpectralZStack(true).Build();
   CHECK(ValidationErrorCode(zstack) == LSAERR_EmptyChannelOrder);

   AcquisitionSettings video = BaseBuilder()
      .Capture(CaptureKindVideo).SpectralVideo(true).Build();
   CHECK(ValidationErrorCode(video) == LSAERR_EmptyChannelOrder);

   // Either flag needs channels, whatever the capture kind
   AcquisitionSettings videoFlagOnZStack = BaseBuilder().SpectralVideo(true).Build();
   CHECK(ValidationErrorCode(videoFlagOnZStack) == LSAERR_EmptyChannelOrder);

   AcquisitionSettings zstackFlagOnVideo = BaseBuilder()
      .Capture(CaptureKindVideo).SpectralZStack(true).Build();
   CHECK(ValidationErrorCode(zstackFlagOnVideo) == LSAERR_EmptyChannelOrder);
}


TEST_CASE("channel names must stay distinct in file names", "[TimingValidator]")
{
   CHECK(HasDistinctChannelNames({ Channel("GFP"), Channel("RFP") }));
   CHECK(HasDistinctChannelNames({}));
   CHECK_FALSE(HasDistinctChannelNames({ Channel("GFP 1"), Channel("GFP/1") }));
   CHECK_FALSE(HasDistinctChannelNames(
            { Channel("GFP", "Filter-488"), Channel("GFP", "Filter-405") }));

   AcquisitionSettings collides = BaseBuilder()
      .SpectralZStack(true)
      .AddChannel(Channel("GFP 1")).AddChannel(Channel("GFP/1"))
      .Build();
   CHECK(ValidationErrorCode(collides) == LSAERR_DuplicateChannel);

   AcquisitionSettings repeated = BaseBuilder()
      .Capture(CaptureKindVideo).SpectralVideo(true)
      .AddChannel(Channel("GFP")).AddChannel(Channel("RFP"))
      .AddChannel(Channel("GFP"))
      .Build();
   CHECK(ValidationErrorCode(repeated) == LSAERR_DuplicateChannel);

   // Without a spectral mode the order is not iterated
   AcquisitionSettings fixed = BaseBuilder()
      .AddChannel(Channel("GFP")).AddChannel(Channel("GFP"))
      .Build();
   CHECK(ValidationErrorCode(fixed) == LSAERR_OK);

   try
   {
      ValidateSettings(collides);
      FAIL("expected CLSAError");
   }
   catch (const CLSAError& e)
   {
      CHECK(e.getMsg().find("\"GFP/1\"") != std::string::npos);
      CHECK(ClassifyError(e.getCode()) == ErrorClassConfiguration);
   }
}


TEST_CASE("exposure and save path are checked", "[TimingValidator]")
{
   CHECK(ValidationErrorCode(BaseBuilder().ZStackExposureMs(0.0).Build()) ==
         LSAERR_InvalidExposure);
   CHECK(ValidationErrorCode(BaseBuilder().VideoExposureMs(-5.0).Build()) ==
         LSAERR_InvalidExposure);
   CHECK(ValidationErrorCode(AcquisitionSettingsBuilder().Build()) ==
         LSAERR_MissingSavePath);
}


TEST_CASE("validation message names the values", "[TimingValidator]")
{
   AcquisitionSettings s = BaseBuilder()
      .ZStackExposureMs(34.0).StageSpeedUmPerSec(30).Build();
   try
   {
      ValidateSettings(s);
      FAIL("expected CLSAError");
   }
   catch (const CLSAError& e)
   {
      const std::string msg = e.getMsg();
      CHECK(msg.find("34") != std::string::npos);
      CHECK(msg.find("30 um/s") != std::string::npos);
      CHECK(ClassifyError(e.getCode()) == ErrorClassConfiguration);
   }
}

} // namespace lsa
