#include <catch2/catch_all.hpp>

#include "Logging/Logging.h"

#include <string>
#include <vector>

namespace lsa {
namespace logging {

TEST_CASE("split entry into lines", "[Logging]")
{
   using internal::SplitEntryIntoLines;

   SECTION("empty result")
   {
      const char *testStr = GENERATE(
         "", "\r", "\n", "\r\r", "\r\n", "\n\n",
         "\r\r\r", "\r\r\n", "\r\n\r", "\r\n\n",
         "\n\r\r", "\n\r\n", "\n\n\r", "\n\n\n");
      std::vector<std::string> lines = SplitEntryIntoLines(testStr);
      REQUIRE(lines.size() == 1);
      CHECK(lines[0].empty());
   }

   SECTION("single line")
   {
      const char *testStr = GENERATE("abc", "abc\n", "abc\r\n", "abc\r\r");
      std::vector<std::string> lines = SplitEntryIntoLines(testStr);
      REQUIRE(lines.size() == 1);
      CHECK(lines[0] == "abc");
   }

   SECTION("CRLF is one break")
   {
      std::vector<std::string> lines = SplitEntryIntoLines("abc\r\ndef");
      REQUIRE(lines.size() == 2);
      CHECK(lines[0] == "abc");
      CHECK(lines[1] == "def");
   }

   SECTION("LFCR is two breaks")
   {
      std::vector<std::string> lines = SplitEntryIntoLines("abc\n\rdef");
      REQUIRE(lines.size() == 3);
      CHECK(lines[1].empty());
   }

   SECTION("inner empty lines are kept")
   {
      std::vector<std::string> lines = SplitEntryIntoLines("\nabc\n\ndef\n\n");
      REQUIRE(lines.size() == 4);
      CHECK(lines[0].empty());
      CHECK(lines[1] == "abc");
      CHECK(lines[2].empty());
      CHECK(lines[3] == "def");
   }
}

} // namespace logging
} // namespace lsa
