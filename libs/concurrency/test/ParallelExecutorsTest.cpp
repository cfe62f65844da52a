#include <catch2/catch_test_macros.hpp>
#include "ParallelExecutors.h"
#include "TaskSubmission.h"
#include <atomic>
#include <chrono>
#include <thread>
#include <string>
#include <vector>

using namespace concurrency;

namespace
{
  auto createIncrementTask(std::atomic<int>& counter) {
    return [&counter]() { counter.fetch_add(1, std::memory_order_relaxed); };
  }

  auto createThrowingTask(const std::string& message) {
    return [message]() { throw std::runtime_error(message); };
  }
}

TEST_CASE("SingleThreadExecutor operations", "[SingleThreadExecutor]")
{
  SingleThreadExecutor executor;

  SECTION("Task runs inline and the future is ready")
  {
    std::atomic<int> counter{0};
    auto future = executor.submit(createIncrementTask(counter));

    REQUIRE(future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready);
    REQUIRE_NOTHROW(future.get());
    REQUIRE(counter.load() == 1);
  }

  SECTION("Tasks execute in submission order")
  {
    std::vector<int> results;
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 5; ++i)
      futures.push_back(executor.submit([&results, i]() { results.push_back(i); }));

    executor.waitAll(futures);
    REQUIRE(results == std::vector<int>{0, 1, 2, 3, 4});
  }

  SECTION("Exception is stored in the future")
  {
    auto future = executor.submit(createThrowingTask("bad ledger"));
    REQUIRE_THROWS_AS(future.get(), std::runtime_error);
  }
}

TEST_CASE("StdAsyncExecutor operations", "[StdAsyncExecutor]")
{
  StdAsyncExecutor executor;
  std::atomic<int> counter{0};
  std::vector<std::future<void>> futures;

  for (int i = 0; i < 8; ++i)
    futures.push_back(executor.submit(createIncrementTask(counter)));

  executor.waitAll(futures);
  REQUIRE(counter.load() == 8);
}

TEST_CASE("ThreadPoolExecutor operations", "[ThreadPoolExecutor]")
{
  SECTION("Fixed pool size")
  {
    ThreadPoolExecutor<3> executor;
    REQUIRE(executor.getNumThreads() == 3);
  }

  SECTION("All queued tasks complete")
  {
    ThreadPoolExecutor<2> executor;
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 50; ++i)
      futures.push_back(executor.submit(createIncrementTask(counter)));

    executor.waitAll(futures);
    REQUIRE(counter.load() == 50);
  }

  SECTION("Exceptions propagate through waitAll")
  {
    ThreadPoolExecutor<2> executor;
    std::vector<std::future<void>> futures;
    futures.push_back(executor.submit([]() {}));
    futures.push_back(executor.submit(createThrowingTask("pool failure")));

    REQUIRE_THROWS_AS(executor.waitAll(futures), std::runtime_error);
  }

  SECTION("Destruction drains the queue")
  {
    std::atomic<int> counter{0};
    {
      ThreadPoolExecutor<1> executor;
      for (int i = 0; i < 10; ++i)
	executor.submit([&counter]() {
	    std::this_thread::sleep_for(std::chrono::milliseconds(1));
	    counter.fetch_add(1);
	  });
    }
    REQUIRE(counter.load() == 10);
  }
}

TEST_CASE("submitTask returns typed results", "[TaskSubmission]")
{
  SECTION("Value from the inline executor")
  {
    SingleThreadExecutor executor;
    auto future = submitTask(executor, []() { return 42; });
    REQUIRE(future.get() == 42);
  }

  SECTION("Value from a pool")
  {
    ThreadPoolExecutor<2> executor;
    auto first = submitTask(executor, []() { return std::string("revenue"); });
    auto second = submitTask(executor, []() { return std::vector<int>{1, 2, 3}; });

    REQUIRE(first.get() == "revenue");
    REQUIRE(second.get().size() == 3);
  }

  SECTION("Value from std::async does not block the caller on submission")
  {
    StdAsyncExecutor executor;
    std::atomic<bool> release{false};
    auto future = submitTask(executor, [&release]() {
	while (!release.load())
	  std::this_thread::sleep_for(std::chrono::milliseconds(1));
	return 7;
      });

    release.store(true);
    REQUIRE(future.get() == 7);
  }

  SECTION("Exceptions surface on get")
  {
    ThreadPoolExecutor<1> executor;
    auto future = submitTask(executor, []() -> int { throw std::invalid_argument("null company"); });
    REQUIRE_THROWS_AS(future.get(), std::invalid_argument);
  }

  SECTION("Void results")
  {
    SingleThreadExecutor executor;
    std::atomic<int> counter{0};
    auto future = submitTask(executor, createIncrementTask(counter));
    REQUIRE_NOTHROW(future.get());
    REQUIRE(counter.load() == 1);
  }
}
