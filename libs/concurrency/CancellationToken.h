#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <stdexcept>

namespace concurrency
{
  class OperationCancelledException : public std::runtime_error
  {
  public:
    OperationCancelledException(const std::string msg)
      : std::runtime_error(msg)
    {}

    ~OperationCancelledException()
    {}
  };

  /**
   * @class CancellationToken
   * @brief Read side of a cooperative cancellation flag.
   *
   * Tokens are cheap to copy and all copies observe the same flag. A
   * default-constructed token can never be cancelled.
   *
   * Work checks the token at its own boundaries (before starting each
   * sub-analysis); nothing is interrupted mid-computation.
   */
  class CancellationToken
  {
  public:
    CancellationToken()
      : mFlag()
    {}

    bool isCancellationRequested() const
    {
      return mFlag && mFlag->load(std::memory_order_acquire);
    }

    /**
     * @throws OperationCancelledException naming the step that was about to start.
     */
    void throwIfCancellationRequested(const std::string& step) const
    {
      if (isCancellationRequested())
	throw OperationCancelledException("Operation cancelled before " + step);
    }

  private:
    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<std::atomic<bool>> flag)
      : mFlag(std::move(flag))
    {}

    std::shared_ptr<std::atomic<bool>> mFlag;
  };

  /**
   * @class CancellationSource
   * @brief Owner side: hands out tokens and requests cancellation.
   */
  class CancellationSource
  {
  public:
    CancellationSource()
      : mFlag(std::make_shared<std::atomic<bool>>(false))
    {}

    CancellationToken getToken() const
    {
      return CancellationToken(mFlag);
    }

    void cancel()
    {
      mFlag->store(true, std::memory_order_release);
    }

    bool isCancellationRequested() const
    {
      return mFlag->load(std::memory_order_acquire);
    }

  private:
    std::shared_ptr<std::atomic<bool>> mFlag;
  };
}
