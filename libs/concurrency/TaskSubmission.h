#pragma once

#include <future>
#include <memory>
#include <optional>
#include <functional>
#include <type_traits>
#include "IParallelExecutor.h"

namespace concurrency
{
  /**
   * @brief Run a value-returning function on an executor.
   *
   * IParallelExecutor only schedules void() tasks, so the value is parked in
   * a shared slot and the executor's own future carries completion and any
   * exception. The returned future is deferred: get() waits for the
   * scheduled task, rethrows its exception if it failed, and otherwise
   * yields the value.
   *
   * Keeping the executor's future inside the deferred state matters for
   * StdAsyncExecutor, whose futures block on destruction; dropping it here
   * would make every submission synchronous.
   */
  template <class Fn>
  std::future<std::invoke_result_t<Fn>>
  submitTask(IParallelExecutor& executor, Fn fn)
  {
    using Result = std::invoke_result_t<Fn>;

    if constexpr (std::is_void_v<Result>)
      {
	auto scheduled = std::make_shared<std::future<void>>(executor.submit(std::move(fn)));
	return std::async(std::launch::deferred, [scheduled]() { scheduled->get(); });
      }
    else
      {
	auto slot = std::make_shared<std::optional<Result>>();
	auto scheduled = std::make_shared<std::future<void>>(
	  executor.submit([slot, fn = std::move(fn)]() mutable { slot->emplace(fn()); }));

	return std::async(std::launch::deferred, [slot, scheduled]() -> Result {
	    scheduled->get();
	    return std::move(**slot);
	  });
      }
  }
}
