#include <catch2/catch_test_macros.hpp>
#include "ParallelExecutors.h"
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <algorithm>
#include <stdexcept>
#include <vector>

using namespace abvalue::concurrency;

namespace
{
  auto createIncrementTask(std::atomic<int>& counter) {
    return [&counter]() { counter.fetch_add(1, std::memory_order_relaxed); };
  }

  auto createThrowingTask(const std::string& message) {
    return [message]() { throw std::runtime_error(message); };
  }

  // Rethrows the first stored exception.
  void getAll(std::vector<std::future<void>>& futures)
  {
    for (auto& f : futures)
      f.get();
  }

  // Restores the ncpu environment variable on scope exit.
  class ScopedNcpu
  {
  public:
    explicit ScopedNcpu(const char* value)
    {
      const char* old = std::getenv("ncpu");
      if (old != nullptr)
	mPrevious = std::make_unique<std::string>(old);

      if (value != nullptr)
	setenv("ncpu", value, 1);
      else
	unsetenv("ncpu");
    }

    ~ScopedNcpu()
    {
      if (mPrevious)
	setenv("ncpu", mPrevious->c_str(), 1);
      else
	unsetenv("ncpu");
    }

  private:
    std::unique_ptr<std::string> mPrevious;
  };
}

TEST_CASE("getNCpus honours the ncpu environment variable", "[getNCpus]")
{
  SECTION("Explicit count")
  {
    ScopedNcpu env("3");
    REQUIRE(getNCpus() == 3);
  }

  SECTION("Unset falls back to the hardware count")
  {
    ScopedNcpu env(nullptr);
    REQUIRE(getNCpus() == std::thread::hardware_concurrency());
  }

  SECTION("Zero lets the pool choose")
  {
    ScopedNcpu env("0");
    REQUIRE(getNCpus() == 0);

    ThreadPoolExecutor pool;
    REQUIRE(pool.numThreads() == 2);
  }

  SECTION("Pool size follows ncpu")
  {
    ScopedNcpu env("5");
    ThreadPoolExecutor pool;
    REQUIRE(pool.numThreads() == 5);

    ThreadPoolExecutor fixed(2);
    REQUIRE(fixed.numThreads() == 2);
  }
}

TEST_CASE("SingleThreadExecutor runs inline", "[SingleThreadExecutor]")
{
  SingleThreadExecutor executor;

  SECTION("Future is ready on return")
  {
    std::atomic<bool> executed{false};
    auto future = executor.submit([&executed]() { executed.store(true); });
    REQUIRE(future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready);
    REQUIRE(executed.load());
  }

  SECTION("Submission order is execution order")
  {
    std::vector<int> results;
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 10; ++i)
      futures.push_back(executor.submit([&results, i]() { results.push_back(i); }));

    getAll(futures);
    REQUIRE(results.size() == 10);
    REQUIRE(std::is_sorted(results.begin(), results.end()));
  }

  SECTION("Exceptions are stored in the future")
  {
    auto future = executor.submit(createThrowingTask("inline failure"));
    REQUIRE_THROWS_AS(future.get(), std::runtime_error);
  }
}

TEST_CASE("ThreadPoolExecutor operations", "[ThreadPoolExecutor]")
{
  SECTION("Many small tasks all run")
  {
    ThreadPoolExecutor executor(4);
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 500; ++i)
      futures.push_back(executor.submit(createIncrementTask(counter)));

    REQUIRE_NOTHROW(getAll(futures));
    REQUIRE(counter.load() == 500);
  }

  SECTION("Tasks run concurrently")
  {
    ThreadPoolExecutor executor(4);
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 4; ++i)
      futures.push_back(executor.submit([&active, &peak]() {
	const int now = active.fetch_add(1) + 1;
	int seen = peak.load();
	while (now > seen && !peak.compare_exchange_weak(seen, now))
	  ;
	std::this_thread::sleep_for(std::chrono::milliseconds(50));
	active.fetch_sub(1);
      }));

    getAll(futures);
    REQUIRE(peak.load() > 1);
  }

  SECTION("A failing task does not stop the workers")
  {
    ThreadPoolExecutor executor(2);
    auto bad = executor.submit(createThrowingTask("pool failure"));
    auto good = executor.submit([]() {});

    REQUIRE_THROWS_AS(bad.get(), std::runtime_error);
    REQUIRE_NOTHROW(good.get());
  }

  SECTION("Destructor finishes queued tasks")
  {
    std::atomic<int> counter{0};
    {
      ThreadPoolExecutor executor(1);
      for (int i = 0; i < 20; ++i)
	executor.submit([&counter]() {
	  std::this_thread::sleep_for(std::chrono::milliseconds(1));
	  counter.fetch_add(1);
	});
    }
    REQUIRE(counter.load() == 20);
  }

  SECTION("Shared data guarded by a mutex")
  {
    ThreadPoolExecutor executor(4);
    std::vector<int> data;
    std::mutex dataMutex;
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 100; ++i)
      futures.push_back(executor.submit([&data, &dataMutex, i]() {
	std::lock_guard<std::mutex> lock(dataMutex);
	data.push_back(i);
      }));

    getAll(futures);
    std::sort(data.begin(), data.end());
    REQUIRE(data.size() == 100);
    for (int i = 0; i < 100; ++i)
      REQUIRE(data[i] == i);
  }
}

TEST_CASE("IParallelExecutor interface compliance", "[Interface]")
{
  SingleThreadExecutor single;
  ThreadPoolExecutor pool(2);

  IParallelExecutor* executors[] = {&single, &pool};

  for (auto* executor : executors)
    {
      std::atomic<int> counter{0};
      std::vector<std::future<void>> futures;
      for (int i = 0; i < 5; ++i)
	futures.push_back(executor->submit(createIncrementTask(counter)));

      REQUIRE_NOTHROW(getAll(futures));
      REQUIRE(counter.load() == 5);

      auto failed = executor->submit(createThrowingTask("interface"));
      REQUIRE_THROWS_AS(failed.get(), std::runtime_error);
    }
}
