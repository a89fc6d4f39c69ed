#pragma once

#include "IParallelExecutor.h"
#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

/**
 * @file ConcurrencyLimiter.h
 * @brief Bounded-parallelism task scheduler.
 *
 * ConcurrencyLimiter caps the number of tasks running at the same time to a
 * capacity fixed at construction. Excess submissions wait in a FIFO queue and
 * start only when a running task finishes. A task always gives its slot back,
 * whether it returned normally or threw: the outcome (value or exception)
 * travels to the caller through the returned future.
 *
 * @section usage
 * - capacity 1 runs the submitted tasks strictly one after the other, in
 *   submission order.
 * - capacity >= number of pending tasks runs everything at once.
 *
 * Worker threads are created on demand, never more than the capacity, so a
 * limiter sized for 50 tasks that only ever receives 3 uses 3 threads.
 *
 * The destructor lets every queued task run before joining the workers, so no
 * future obtained from submit() is ever left without a result.
 */
namespace concurrency
{
  class ConcurrencyLimiter : public IParallelExecutor
  {
  public:
    explicit ConcurrencyLimiter(std::size_t maxConcurrent)
      : mMaxConcurrent(maxConcurrent),
	mWorkers(),
	mTasks(),
	mTasksMutex(),
	mCondition(),
	mStop(false),
	mIdleWorkers(0),
	mInFlight(0),
	mPeakInFlight(0)
    {
      if (maxConcurrent == 0)
	throw std::invalid_argument("ConcurrencyLimiter: capacity must be at least 1");
    }

    ConcurrencyLimiter(const ConcurrencyLimiter&) = delete;
    ConcurrencyLimiter& operator=(const ConcurrencyLimiter&) = delete;
    ConcurrencyLimiter(ConcurrencyLimiter&&) = delete;
    ConcurrencyLimiter& operator=(ConcurrencyLimiter&&) = delete;

    ~ConcurrencyLimiter()
    {
      {
	std::unique_lock<std::mutex> lock(mTasksMutex);
	mStop = true;
      }
      mCondition.notify_all();
      for (auto &worker : mWorkers) {
	if (worker.joinable())
	  worker.join();
      }
    }

    std::future<void> submit(std::function<void()> task) override
    {
      return submitTask(std::move(task));
    }

    /**
     * @brief Queue a callable; it starts as soon as a slot is free.
     * @return future settling with the callable's return value or exception
     * @throws std::runtime_error if the limiter is shutting down
     */
    template <class F>
    auto submitTask(F&& func) -> std::future<std::invoke_result_t<std::decay_t<F>>>
    {
      using ResultType = std::invoke_result_t<std::decay_t<F>>;

      auto packaged = std::make_shared<std::packaged_task<ResultType()>>(std::forward<F>(func));
      auto fut = packaged->get_future();
      {
	std::unique_lock<std::mutex> lock(mTasksMutex);
	if (mStop)
	  throw std::runtime_error("submit on stopped ConcurrencyLimiter");

	mTasks.emplace([packaged]() { (*packaged)(); });

	if (mTasks.size() > mIdleWorkers && mWorkers.size() < mMaxConcurrent)
	  mWorkers.emplace_back([this] { workerLoop(); });
      }
      mCondition.notify_one();
      return fut;
    }

    std::size_t getMaxConcurrent() const
    {
      return mMaxConcurrent;
    }

    std::size_t getInFlight() const
    {
      std::lock_guard<std::mutex> lock(mTasksMutex);
      return mInFlight;
    }

    /// Highest number of tasks observed running at the same time
    std::size_t getPeakInFlight() const
    {
      std::lock_guard<std::mutex> lock(mTasksMutex);
      return mPeakInFlight;
    }

    std::size_t getQueuedCount() const
    {
      std::lock_guard<std::mutex> lock(mTasksMutex);
      return mTasks.size();
    }

  private:
    void workerLoop()
    {
      for (;;) {
	std::function<void()> task;
	{
	  std::unique_lock<std::mutex> lock(mTasksMutex);
	  ++mIdleWorkers;
	  mCondition.wait(lock, [this]{ return mStop || !mTasks.empty(); });
	  --mIdleWorkers;

	  if (mTasks.empty())
	    return;

	  task = std::move(mTasks.front());
	  mTasks.pop();
	  ++mInFlight;
	  mPeakInFlight = std::max(mPeakInFlight, mInFlight);
	}

	// packaged_task stores any exception in its future, so the slot is
	// always released below
	task();

	{
	  std::lock_guard<std::mutex> lock(mTasksMutex);
	  --mInFlight;
	}
      }
    }

  private:
    const std::size_t                 mMaxConcurrent;
    std::vector<std::thread>          mWorkers;
    std::queue<std::function<void()>> mTasks;
    mutable std::mutex                mTasksMutex;
    std::condition_variable           mCondition;
    bool                              mStop;
    std::size_t                       mIdleWorkers;
    std::size_t                       mInFlight;
    std::size_t                       mPeakInFlight;
  };
} // namespace concurrency
