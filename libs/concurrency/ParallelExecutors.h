#pragma once

#include "IParallelExecutor.h"
#include <queue>
#include <future>
#include <thread>
#include <vector>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <stdexcept>
#include <exception>

/**
 * @file ParallelExecutors.h
 * @brief Executor policies the analysis entry points can be offloaded to.
 *
 *  - SingleThreadExecutor: runs tasks inline on the calling thread (deterministic, no concurrency).
 *  - StdAsyncExecutor: one std::async(std::launch::async) call per task.
 *  - ThreadPoolExecutor<N>: a fixed-size pool of N worker threads.
 *
 * @section usage Choosing an executor
 * - SingleThreadExecutor: unit tests, or callers that already run on a worker thread.
 * - StdAsyncExecutor: a handful of independent analyses from a UI or request thread.
 * - ThreadPoolExecutor<N>: a long-lived service answering many analysis calls; caps concurrency.
 */
namespace concurrency
{
  /**
   * @brief Executes tasks synchronously on the calling thread.
   *
   * The returned future is ready on return. Exceptions thrown by the task are
   * stored in the future rather than propagated from submit().
   */
  class SingleThreadExecutor : public IParallelExecutor {
  public:
    std::future<void> submit(std::function<void()> task) override {
      std::promise<void> prom;
      auto fut = prom.get_future();
      try {
	task();
	prom.set_value();
      } catch (...) {
	prom.set_exception(std::current_exception());
      }
      return fut;
    }
  };

  /**
   * @brief Executor policy using std::async for each task.
   *
   * Each submit may start a new thread, with no bound on how many run at once.
   */
  class StdAsyncExecutor : public IParallelExecutor {
  public:
    std::future<void> submit(std::function<void()> task) override {
      return std::async(std::launch::async, std::move(task));
    }
  };

  /**
   * @brief Fixed-size thread pool executor.
   * Tasks submitted are queued and executed by a pool of worker threads.
   * Template parameter N specifies the number of threads in the pool.
   *
   * If N == 0, at runtime we pick std::thread::hardware_concurrency()
   * (falling back to 2 if that returns 0).
   *
   * Destruction drains the queue: tasks already submitted still run.
   */
  template <std::size_t N = 0>
  class ThreadPoolExecutor : public IParallelExecutor {
  public:
    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor(ThreadPoolExecutor&&) = delete;
    ThreadPoolExecutor& operator=(ThreadPoolExecutor&&) = delete;

    ThreadPoolExecutor() : stop_(false)
    {
      const std::size_t threads =
	N > 0 ? N : (std::thread::hardware_concurrency() ? std::thread::hardware_concurrency() : 2);

      try {
	for (std::size_t i = 0; i < threads; ++i) {
	  workers_.emplace_back([this] { workerLoop(); });
	}
      }
      catch (...) {
	{
	  std::lock_guard<std::mutex> lock(tasksMutex_);
	  stop_ = true;
	}
	condition_.notify_all();
	for (auto& w : workers_) if (w.joinable()) w.join();
	throw;
      }
    }

    ~ThreadPoolExecutor()
    {
      {
	std::unique_lock<std::mutex> lock(tasksMutex_);
	stop_ = true;
      }
      condition_.notify_all();
      for (auto &worker : workers_) {
	if (worker.joinable())
	  worker.join();
      }
    }

    std::size_t getNumThreads() const
    {
      return workers_.size();
    }

    std::future<void> submit(std::function<void()> task) override
    {
      auto packaged = std::make_shared<std::packaged_task<void()>>(std::move(task));
      auto fut = packaged->get_future();
      {
	std::unique_lock<std::mutex> lock(tasksMutex_);
	if (stop_)
	  throw std::runtime_error("enqueue on stopped ThreadPoolExecutor");
	tasks_.emplace([packaged]() { (*packaged)(); });
      }
      condition_.notify_one();
      return fut;
    }

  private:
    void workerLoop()
    {
      for (;;) {
	std::function<void()> task;
	{
	  std::unique_lock<std::mutex> lock(tasksMutex_);
	  condition_.wait(lock, [this]{ return stop_ || !tasks_.empty(); });
	  if (stop_ && tasks_.empty()) return;
	  task = std::move(tasks_.front());
	  tasks_.pop();
	}
	task();
      }
    }

  private:
    std::vector<std::thread>          workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex                        tasksMutex_;
    std::condition_variable           condition_;
    bool                              stop_;
  };
} // namespace concurrency
