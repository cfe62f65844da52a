#include <catch2/catch_test_macros.hpp>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include "OutputUtils.h"

using namespace ledgerinsights;

TEST_CASE ("Buffered diagnostics reach the target on destruction", "[OutputUtils]")
{
  std::ostringstream target;
  std::mutex targetMutex;

  {
    utils::BufferedDiagnosticStream os (target, targetMutex);
    os << "   [TrendAnalyzer] 3 trend(s)" << std::endl;
    os << "   [AnomalyDetector] 0 anomalies" << std::endl;
    REQUIRE (target.str().empty());
  }

  REQUIRE (target.str() == "   [TrendAnalyzer] 3 trend(s)\n   [AnomalyDetector] 0 anomalies\n");

  {
    utils::BufferedDiagnosticStream silent (target, targetMutex);
  }
  REQUIRE (target.str() == "   [TrendAnalyzer] 3 trend(s)\n   [AnomalyDetector] 0 anomalies\n");
}

TEST_CASE ("Concurrent buffered writers keep their lines whole", "[OutputUtils]")
{
  std::ostringstream target;
  std::mutex targetMutex;

  const int writers = 4;
  const int linesPerWriter = 2000;

  std::vector<std::thread> threads;
  for (int w = 0; w < writers; ++w)
    threads.emplace_back ([&target, &targetMutex, w]() {
	for (int i = 0; i < linesPerWriter; ++i)
	  {
	    utils::BufferedDiagnosticStream os (target, targetMutex);
	    os << "   [Writer" << w << "] line " << i << std::endl;
	  }
      });

  for (auto& thread : threads)
    thread.join();

  std::istringstream lines (target.str());
  std::string line;
  int count = 0;
  while (std::getline (lines, line))
    {
      REQUIRE (line.rfind ("   [Writer", 0) == 0);
      REQUIRE (line.find ("   [", 1) == std::string::npos);
      ++count;
    }

  REQUIRE (count == writers * linesPerWriter);
}

TEST_CASE ("Null stream discards output", "[OutputUtils]")
{
  utils::NullStream sink;
  sink << "   [InsightsService] nothing to see" << std::endl;
  REQUIRE (sink.good());
}
