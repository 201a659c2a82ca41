#include <catch2/catch_all.hpp>

#include "CoreFeatures.h"
#include "Error.h"

namespace lsa {
namespace features {

TEST_CASE("default feature flags", "[CoreFeatures]")
{
   CHECK(isFeatureEnabled("SecondSavePathReachabilityCheck"));
   CHECK_FALSE(isFeatureEnabled("DiskSpaceCheck"));
   CHECK(flags().secondSavePathReachabilityCheck);
   CHECK_FALSE(flags().diskSpaceCheck);
}

TEST_CASE("enable and disable feature", "[CoreFeatures]")
{
   enableFeature("DiskSpaceCheck", true);
   CHECK(isFeatureEnabled("DiskSpaceCheck"));
   CHECK(flags().diskSpaceCheck);
   enableFeature("DiskSpaceCheck", false);
   CHECK_FALSE(flags().diskSpaceCheck);

   enableFeature("SecondSavePathReachabilityCheck", false);
   CHECK_FALSE(flags().secondSavePathReachabilityCheck);
   enableFeature("SecondSavePathReachabilityCheck", true);
   CHECK(flags().secondSavePathReachabilityCheck);
}

TEST_CASE("unknown feature name", "[CoreFeatures]")
{
   try
   {
      enableFeature("NoSuchThing", true);
      FAIL("expected CLSAError");
   }
   catch (const CLSAError& e)
   {
      CHECK(e.getCode() == LSAERR_NoSuchFeature);
   }
   CHECK_THROWS_AS(isFeatureEnabled(""), CLSAError);
}

} // namespace features
} // namespace lsa
