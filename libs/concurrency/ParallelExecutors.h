#pragma once

#include "IParallelExecutor.h"
#include <condition_variable>
#include <cstdlib>
#include <deque>
#include <functional>
#include <future>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

/**
 * @file ParallelExecutors.h
 * @brief Executors for the background Monte Carlo work.
 *
 *  - SingleThreadExecutor: runs each request on the caller's thread. Used
 *    where results must arrive in submission order, e.g. in unit tests.
 *  - ThreadPoolExecutor: a fixed set of workers draining a FIFO queue of
 *    simulation requests.
 */
namespace abvalue
{
  namespace concurrency
  {
    /**
     * @brief Number of worker threads to use.
     *
     * The ncpu environment variable overrides the hardware count. A value
     * of zero means "let the executor decide".
     */
    inline std::size_t getNCpus()
    {
      std::size_t hwcpus = std::thread::hardware_concurrency();
      const char* ncpu_env = std::getenv("ncpu");
      if (ncpu_env != nullptr)
	{
	  int envcpus = std::atoi(ncpu_env);
	  if (envcpus >= 0)
	    return envcpus % std::numeric_limits<unsigned char>::max();
	}
      return hwcpus;
    }

    /**
     * @brief Executes tasks synchronously on the calling thread.
     *
     * The returned future is already ready; a throwing task stores its
     * exception in it.
     */
    class SingleThreadExecutor : public IParallelExecutor
    {
    public:
      std::future<void> submit(std::function<void()> task) override
      {
	std::packaged_task<void()> job(std::move(task));
	std::future<void> done = job.get_future();
	job();
	return done;
      }
    };

    /**
     * @brief Fixed pool of worker threads fed from a FIFO queue.
     *
     * A thread count of zero picks getNCpus(), or two workers when that
     * reports zero. The destructor lets the workers finish everything
     * already queued before joining them.
     */
    class ThreadPoolExecutor : public IParallelExecutor
    {
    public:
      static constexpr std::size_t FALLBACK_THREADS = 2;

      explicit ThreadPoolExecutor(std::size_t numThreads = 0)
	: mStopping(false)
      {
	if (numThreads == 0)
	  numThreads = getNCpus();
	if (numThreads == 0)
	  numThreads = FALLBACK_THREADS;

	mWorkers.reserve(numThreads);
	try
	  {
	    for (std::size_t i = 0; i < numThreads; ++i)
	      mWorkers.emplace_back(&ThreadPoolExecutor::drainQueue, this);
	  }
	catch (const std::system_error&)
	  {
	    shutdown();
	    throw;
	  }
      }

      ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
      ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;

      ~ThreadPoolExecutor()
      {
	shutdown();
      }

      std::size_t numThreads() const
      {
	return mWorkers.size();
      }

      std::future<void> submit(std::function<void()> task) override
      {
	std::packaged_task<void()> job(std::move(task));
	std::future<void> done = job.get_future();
	{
	  std::lock_guard<std::mutex> lock(mQueueMutex);
	  if (mStopping)
	    throw std::runtime_error("ThreadPoolExecutor: submit after shutdown");
	  mQueue.push_back(std::move(job));
	}
	mQueueChanged.notify_one();
	return done;
      }

    private:
      void drainQueue()
      {
	for (;;)
	  {
	    std::packaged_task<void()> job;
	    {
	      std::unique_lock<std::mutex> lock(mQueueMutex);
	      mQueueChanged.wait(lock, [this] { return mStopping || !mQueue.empty(); });
	      if (mQueue.empty())
		return;
	      job = std::move(mQueue.front());
	      mQueue.pop_front();
	    }
	    // Exceptions land in the job's future.
	    job();
	  }
      }

      void shutdown()
      {
	{
	  std::lock_guard<std::mutex> lock(mQueueMutex);
	  mStopping = true;
	}
	mQueueChanged.notify_all();
	for (auto& worker : mWorkers)
	  if (worker.joinable())
	    worker.join();
      }

      std::vector<std::thread> mWorkers;
      std::deque<std::packaged_task<void()>> mQueue;
      std::mutex mQueueMutex;
      std::condition_variable mQueueChanged;
      bool mStopping;
    };
  } // namespace concurrency
} // namespace abvalue
