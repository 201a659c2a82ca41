#include <catch2/catch_all.hpp>

#include "Error.h"

#include <string>

TEST_CASE("error carries message and code", "[Error]")
{
   CLSAError e("Stage did not respond", LSAERR_StageCommandFailed);
   CHECK(e.getMsg() == "Stage did not respond");
   CHECK(std::string(e.what()) == "Stage did not respond");
   CHECK(e.getCode() == LSAERR_StageCommandFailed);
   CHECK(e.getUnderlyingError() == nullptr);
   CHECK(e.getFullMsg() == e.getMsg());
}

TEST_CASE("empty message falls back to code", "[Error]")
{
   CHECK(CLSAError("", LSAERR_EmptyPlan).getMsg() == "Error (code 109)");
   CHECK(CLSAError(std::string()).getMsg() == "Unspecified error");
   CHECK(CLSAError(static_cast<const char*>(nullptr)).getMsg() ==
         "(null message)");
}

TEST_CASE("chained errors", "[Error]")
{
   CLSAError device("Position out of range", 7);
   CLSAError outer("Moving stage failed", LSAERR_StageCommandFailed, device);

   REQUIRE(outer.getUnderlyingError() != nullptr);
   CHECK(outer.getUnderlyingError()->getCode() == 7);
   CHECK(outer.getFullMsg() ==
         "Moving stage failed [ Position out of range ]");

   SECTION("copies are deep")
   {
      CLSAError copy(outer);
      CLSAError assigned("x");
      assigned = outer;
      CHECK(copy.getFullMsg() == outer.getFullMsg());
      CHECK(assigned.getFullMsg() == outer.getFullMsg());
      CHECK(copy.getUnderlyingError() != outer.getUnderlyingError());
   }

   SECTION("specific code skips generic wrappers")
   {
      CLSAError wrapper("Run failed", outer);
      CHECK(wrapper.getCode() == LSAERR_GENERIC);
      CHECK(wrapper.getSpecificCode() == LSAERR_StageCommandFailed);
   }
}

TEST_CASE("error classification", "[Error]")
{
   using namespace lsa;
   CHECK(ClassifyError(LSAERR_OK) == ErrorClassNone);
   CHECK(ClassifyError(LSAERR_ExceedsStageSpeedLimit) == ErrorClassConfiguration);
   CHECK(ClassifyError(LSAERR_EmptyPlan) == ErrorClassConfiguration);
   CHECK(ClassifyError(LSAERR_CameraCommandFailed) == ErrorClassHardwareCommand);
   CHECK(ClassifyError(LSAERR_SecondarySaveFailed) == ErrorClassSave);
   CHECK(ClassifyError(LSAERR_UnknownRunHandle) == ErrorClassUsage);
   CHECK(ClassifyError(LSAERR_GENERIC) == ErrorClassOther);
   CHECK(std::string(ErrorClassName(ErrorClassConfiguration)) ==
         "ConfigurationError");

   CHECK(IsFatalError(LSAERR_PrimarySaveFailed));
   CHECK_FALSE(IsFatalError(LSAERR_SecondarySaveFailed));
   CHECK_FALSE(IsFatalError(LSAERR_OK));
}
