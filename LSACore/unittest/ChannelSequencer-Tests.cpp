#include <catch2/catch_all.hpp>

#include "ChannelSequencer.h"
#include "Error.h"

#include <vector>

namespace lsa {

namespace {

std::vector<Channel> ThreeChannels()
{
   std::vector<Channel> order;
   order.push_back(Channel("GFP"));
   order.push_back(Channel("RFP"));
   order.push_back(Channel("CFP"));
   return order;
}

} // anonymous namespace


TEST_CASE("next channel cycles through the order", "[ChannelSequencer]")
{
   const std::vector<Channel> order = ThreeChannels();
   const Channel def("BF");

   ChannelStep step = NextChannel(SpectralModeZStack, order, def, 0);
   CHECK(step.channel.GetName() == "GFP");
   CHECK(step.nextIndex == 1);
   step = NextChannel(SpectralModeZStack, order, def, step.nextIndex);
   CHECK(step.channel.GetName() == "RFP");
   step = NextChannel(SpectralModeZStack, order, def, step.nextIndex);
   CHECK(step.channel.GetName() == "CFP");
   CHECK(step.nextIndex == 0);

   // Out-of-range index wraps
   step = NextChannel(SpectralModeVideo, order, def, 4);
   CHECK(step.channel.GetName() == "RFP");
   CHECK(step.nextIndex == 2);
}


TEST_CASE("no spectral mode returns the fixed default", "[ChannelSequencer]")
{
   const std::vector<Channel> order = ThreeChannels();
   const Channel def("BF");
   for (size_t i = 0; i < 7; ++i)
   {
      ChannelStep step = NextChannel(SpectralModeNone, order, def, i);
      CHECK(step.channel == def);
      CHECK(step.nextIndex == 0);
   }

   // An empty order is fine when not switching
   ChannelStep step = NextChannel(SpectralModeNone, std::vector<Channel>(), def, 0);
   CHECK(step.channel == def);
}


TEST_CASE("cycling an empty order throws", "[ChannelSequencer]")
{
   try
   {
      NextChannel(SpectralModeVideo, std::vector<Channel>(), Channel("BF"), 0);
      FAIL("expected CLSAError");
   }
   catch (const CLSAError& e)
   {
      CHECK(e.getCode() == LSAERR_EmptyChannelOrder);
   }

   CHECK_THROWS_AS(ChannelSequencer(SpectralModeZStack,
            std::vector<Channel>(), Channel("BF")), CLSAError);
}


TEST_CASE("sequencer object advances and resets", "[ChannelSequencer]")
{
   ChannelSequencer seq(SpectralModeZStack, ThreeChannels(), Channel("BF"));
   CHECK(seq.IsSwitching());
   CHECK(seq.GetChannelsPerStep() == 3);
   CHECK(seq.Next().channel.GetName() == "GFP");
   CHECK(seq.Next().channel.GetName() == "RFP");
   CHECK(seq.GetCurrentIndex() == 2);
   seq.Reset();
   CHECK(seq.GetCurrentIndex() == 0);
   CHECK(seq.Next().channel.GetName() == "GFP");
}


TEST_CASE("mode follows the capture kind", "[ChannelSequencer]")
{
   AcquisitionSettingsBuilder builder;
   builder.PrimarySavePath("/data").AddChannel(Channel("GFP"))
      .AddChannel(Channel("RFP"));

   SECTION("spectral Z-stack with Z-stack capture")
   {
      AcquisitionSettings s = builder.SpectralZStack(true).Build();
      CHECK(SpectralModeForRun(s) == SpectralModeZStack);
      CHECK(ChannelSequencer(s).GetChannelsPerStep() == 2);
   }
   SECTION("spectral video with video capture")
   {
      AcquisitionSettings s = builder.SpectralVideo(true)
         .Capture(CaptureKindVideo).Build();
      CHECK(SpectralModeForRun(s) == SpectralModeVideo);
   }
   SECTION("spectral video with Z-stack capture")
   {
      AcquisitionSettings s = builder.SpectralVideo(true).Build();
      CHECK(SpectralModeForRun(s) == SpectralModeNone);
      ChannelSequencer seq(s);
      CHECK_FALSE(seq.IsSwitching());
      CHECK(seq.GetChannelsPerStep() == 1);
      CHECK(seq.Next().channel.GetName() == "GFP");
      CHECK(seq.Next().channel.GetName() == "GFP");
   }
}

} // namespace lsa
