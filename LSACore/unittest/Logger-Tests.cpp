#include <catch2/catch_all.hpp>

#include "Error.h"
#include "LogManager.h"
#include "Logging/Logging.h"

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace lsa {
namespace logging {

namespace {

class CollectingSink : public LogSink
{
   mutable std::mutex mutex_;
   std::vector<std::string> entries_;
   std::vector<LogLevel> levels_;

public:
   std::vector<std::string> Entries() const
   {
      std::lock_guard<std::mutex> lock(mutex_);
      return entries_;
   }

   std::vector<LogLevel> Levels() const
   {
      std::lock_guard<std::mutex> lock(mutex_);
      return levels_;
   }

protected:
   void Write(const Metadata& metadata, const std::string& text) override
   {
      std::lock_guard<std::mutex> lock(mutex_);
      entries_.push_back(std::string(
               metadata.GetLoggerData().GetComponentLabel()) + ":" + text);
      levels_.push_back(metadata.GetEntryData().GetLevel());
   }
};

std::string ReadFile(const std::filesystem::path& path)
{
   std::ifstream ifs(path);
   std::ostringstream oss;
   oss << ifs.rdbuf();
   return oss.str();
}

} // anonymous namespace


TEST_CASE("synchronous logger basics", "[Logger]")
{
   std::shared_ptr<LoggingCore> c = std::make_shared<LoggingCore>();
   c->AddSink(std::make_shared<StdErrLogSink>(), SinkModeSynchronous);

   Logger lgr = c->NewLogger("mylabel");

   lgr(LogLevelDebug, "My entry text\nMy second line");
   for (unsigned i = 0; i < 100; ++i)
      lgr(LogLevelDebug, "More lines!\n\n\n");
}


TEST_CASE("log stream sends one entry per statement", "[Logger]")
{
   std::shared_ptr<LoggingCore> c = std::make_shared<LoggingCore>();
   auto sink = std::make_shared<CollectingSink>();
   c->AddSink(sink, SinkModeSynchronous);

   Logger lgr = c->NewLogger("Driver");
   LOG_INFO(lgr) << 123 << "ABC" << 456;
   LOG_WARNING(lgr) << "second";

   std::vector<std::string> entries = sink->Entries();
   REQUIRE(entries.size() == 2);
   CHECK(entries[0] == "Driver:123ABC456");
   CHECK(entries[1] == "Driver:second");
   CHECK(sink->Levels()[1] == LogLevelWarning);
}


TEST_CASE("level filter drops lower levels", "[Logger]")
{
   std::shared_ptr<LoggingCore> c = std::make_shared<LoggingCore>();
   auto sink = std::make_shared<CollectingSink>();
   sink->SetFilter(std::make_shared<LevelFilter>(LogLevelInfo));
   c->AddSink(sink, SinkModeSynchronous);

   Logger lgr = c->NewLogger("Save");
   LOG_TRACE(lgr) << "trace";
   LOG_DEBUG(lgr) << "debug";
   LOG_INFO(lgr) << "info";
   LOG_ERROR(lgr) << "error";

   std::vector<std::string> entries = sink->Entries();
   REQUIRE(entries.size() == 2);
   CHECK(entries[0] == "Save:info");
   CHECK(entries[1] == "Save:error");
}


TEST_CASE("asynchronous sink receives entries in order after flush", "[Logger]")
{
   std::shared_ptr<LoggingCore> c = std::make_shared<LoggingCore>();
   auto sink = std::make_shared<CollectingSink>();
   c->AddSink(sink, SinkModeAsynchronous);

   Logger lgr = c->NewLogger("async");
   for (int i = 0; i < 200; ++i)
      LOG_INFO(lgr) << i;
   c->Flush();

   std::vector<std::string> entries = sink->Entries();
   REQUIRE(entries.size() == 200);
   CHECK(entries.front() == "async:0");
   CHECK(entries.back() == "async:199");

   c->RemoveSink(sink, SinkModeAsynchronous);
   LOG_INFO(lgr) << "not delivered";
   c->Flush();
   CHECK(sink->Entries().size() == 200);
}


class LoggerTestThreadFunc
{
   unsigned n_;
   std::shared_ptr<LoggingCore> c_;

public:
   LoggerTestThreadFunc(unsigned n, std::shared_ptr<LoggingCore> c) :
      n_(n), c_(c)
   {}

   void Run()
   {
      Logger lgr = c_->NewLogger("thread" + std::to_string(n_));
      for (size_t j = 0; j < 50; ++j)
      {
         LOG_TRACE(lgr) << j << ' ' << std::string(n_ * j, 'x');
      }
   }
};


TEST_CASE("async logger on thread", "[Logger]")
{
   std::shared_ptr<LoggingCore> c = std::make_shared<LoggingCore>();
   auto sink = std::make_shared<CollectingSink>();
   c->AddSink(sink, SinkModeAsynchronous);

   std::vector< std::shared_ptr<std::thread> > threads;
   std::vector< std::shared_ptr<LoggerTestThreadFunc> > funcs;
   for (unsigned i = 0; i < 10; ++i)
   {
      funcs.push_back(std::make_shared<LoggerTestThreadFunc>(i, c));
      threads.push_back(std::make_shared<std::thread>(
               &LoggerTestThreadFunc::Run, funcs[i].get()));
   }
   for (unsigned i = 0; i < threads.size(); ++i)
      threads[i]->join();
   c->Flush();

   CHECK(sink->Entries().size() == 500);
}


TEST_CASE("metadata formatter prefix and continuation", "[Logger]")
{
   StampData stamp;
   stamp.Stamp();
   Metadata md(LoggerData("Core"), LogLevelWarning, stamp);

   internal::MetadataFormatter formatter;
   std::ostringstream first;
   formatter.FormatLinePrefix(first, md);
   std::ostringstream cont;
   formatter.FormatContinuationPrefix(cont);

   const std::string prefix = first.str();
   CHECK(prefix.find(" tid") != std::string::npos);
   CHECK(prefix.size() >= 10);
   CHECK(prefix.substr(prefix.size() - 10) == "[WRN,Core]");
   CHECK(cont.str().size() == prefix.size());
   CHECK(cont.str().back() == ']');
}


TEST_CASE("run loggers carry the run handle", "[Logger]")
{
   auto c = std::make_shared<LoggingCore>();
   Logger driverLogger = c->NewLogger("Driver", 3);
   CHECK(driverLogger.GetRunHandle() == 3);
   CHECK(c->NewLogger("Core").GetRunHandle() == 0);

   StampData stamp;
   stamp.Stamp();
   CHECK(stamp.GetThreadId() == std::this_thread::get_id());

   internal::MetadataFormatter formatter;
   std::ostringstream line;
   formatter.FormatLinePrefix(line,
         Metadata(LoggerData("Driver", 3), LogLevelInfo, stamp));
   const std::string prefix = line.str();
   CHECK(prefix.substr(prefix.size() - 14) == "[IFO,Driver:3]");
}


TEST_CASE("log manager writes primary log file", "[LogManager]")
{
   namespace fs = std::filesystem;
   const fs::path dir = fs::temp_directory_path() / "lsacq-logmanager-test";
   fs::create_directories(dir);
   const fs::path file = dir / "primary.log";

   {
      LogManager mgr;
      mgr.SetPrimaryLogFilename(file.string(), true);
      CHECK(mgr.IsUsingPrimaryLogFile());
      CHECK(mgr.GetPrimaryLogFilename() == file.string());

      Logger lgr = mgr.NewLogger("Test");
      LOG_DEBUG(lgr) << "hidden at info level";
      LOG_INFO(lgr) << "visible line";
      mgr.Flush();

      mgr.SetPrimaryLogLevel(LogLevelDebug);
      CHECK(mgr.GetPrimaryLogLevel() == LogLevelDebug);
      LOG_DEBUG(lgr) << "debug now visible";
      mgr.Flush();
   }

   const std::string contents = ReadFile(file);
   CHECK(contents.find("[IFO,Test] visible line") != std::string::npos);
   CHECK(contents.find("hidden at info level") == std::string::npos);
   CHECK(contents.find("[dbg,Test] debug now visible") != std::string::npos);

   fs::remove_all(dir);
}


TEST_CASE("log manager rejects unopenable file", "[LogManager]")
{
   LogManager mgr;
   const std::string bad = "/nonexistent-lsacq-dir/sub/primary.log";
   try
   {
      mgr.SetPrimaryLogFilename(bad, true);
      FAIL("expected CLSAError");
   }
   catch (const CLSAError& e)
   {
      CHECK(e.getCode() == LSAERR_FileOpenFailed);
   }
   CHECK_FALSE(mgr.IsUsingPrimaryLogFile());
}

} // namespace logging
} // namespace lsa
