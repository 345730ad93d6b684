// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <cstddef>
#include <future>
#include <thread>
#include <vector>
#include <functional>
#include <queue>
#include <mutex>
#include <memory>
#include <condition_variable>
#include <stdexcept>
#include <exception>
#include "IParallelExecutor.h"

/**
 * @file ParallelExecutors.h
 * @brief Executor policies used to spread bootstrap replicates across threads.
 *
 *  - SingleThreadExecutor: runs tasks inline on the calling thread.
 *  - ThreadPoolExecutor<N>: a fixed-size pool of worker threads.
 *
 * Replicate results never depend on the executor: every replicate derives its
 * own random streams from its index, so a pool of any size and the inline
 * executor produce identical outcome matrices. The inline executor is the one
 * to use in unit tests and when debugging.
 */
namespace triagesim
{
  namespace concurrency
  {
    inline std::size_t defaultThreadCount()
    {
      const unsigned hw = std::thread::hardware_concurrency();
      return hw ? hw : 2;
    }

    /**
     * @brief Executes tasks synchronously on the calling thread.
     */
    class SingleThreadExecutor : public IParallelExecutor
    {
    public:
      SingleThreadExecutor() = default;

      // Thread count is accepted so the runner can construct any executor the same way.
      explicit SingleThreadExecutor(std::size_t)
      {}

      std::future<void> submit(std::function<void()> task) override
      {
	std::promise<void> prom;
	auto fut = prom.get_future();
	try
	  {
	    task();
	    prom.set_value();
	  }
	catch (...)
	  {
	    prom.set_exception(std::current_exception());
	  }
	return fut;
      }

      std::size_t concurrency() const override
      {
	return 1;
      }
    };

    /**
     * @brief Fixed-size thread pool executor.
     *
     * Tasks submitted are queued and executed by a pool of worker threads.
     * Template parameter N fixes the number of threads at compile time. If N == 0
     * the count is taken from the constructor argument, and when that is also 0
     * from std::thread::hardware_concurrency() (falling back to 2).
     */
    template <std::size_t N = 0>
    class ThreadPoolExecutor : public IParallelExecutor
    {
    public:
      ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
      ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;
      ThreadPoolExecutor(ThreadPoolExecutor&&) = delete;
      ThreadPoolExecutor& operator=(ThreadPoolExecutor&&) = delete;

      ThreadPoolExecutor()
	: ThreadPoolExecutor(0)
      {}

      explicit ThreadPoolExecutor(std::size_t requestedThreads)
	: mStop(false)
      {
	std::size_t threads = N;
	if (threads == 0)
	  threads = requestedThreads > 0 ? requestedThreads : defaultThreadCount();

	try
	  {
	    for (std::size_t i = 0; i < threads; ++i)
	      mWorkers.emplace_back([this] { workerLoop(); });
	  }
	catch (...)
	  {
	    shutdown();
	    throw;
	  }
      }

      ~ThreadPoolExecutor()
      {
	shutdown();
      }

      std::future<void> submit(std::function<void()> task) override
      {
	auto packaged = std::make_shared<std::packaged_task<void()>>(std::move(task));
	auto fut = packaged->get_future();
	{
	  std::unique_lock<std::mutex> lock(mTasksMutex);
	  if (mStop)
	    throw std::runtime_error("enqueue on stopped ThreadPoolExecutor");
	  mTasks.emplace([packaged]() { (*packaged)(); });
	}
	mCondition.notify_one();
	return fut;
      }

      std::size_t concurrency() const override
      {
	return mWorkers.size();
      }

    private:
      void workerLoop()
      {
	for (;;)
	  {
	    std::function<void()> task;
	    {
	      std::unique_lock<std::mutex> lock(mTasksMutex);
	      mCondition.wait(lock, [this]{ return mStop || !mTasks.empty(); });
	      if (mStop && mTasks.empty())
		return;
	      task = std::move(mTasks.front());
	      mTasks.pop();
	    }
	    task();
	  }
      }

      void shutdown()
      {
	{
	  std::lock_guard<std::mutex> lock(mTasksMutex);
	  mStop = true;
	}
	mCondition.notify_all();
	for (auto& worker : mWorkers)
	  {
	    if (worker.joinable())
	      worker.join();
	  }
      }

    private:
      std::vector<std::thread>          mWorkers;
      std::queue<std::function<void()>> mTasks;
      std::mutex                        mTasksMutex;
      std::condition_variable           mCondition;
      bool                              mStop;
    };
  } // namespace concurrency
} // namespace triagesim
