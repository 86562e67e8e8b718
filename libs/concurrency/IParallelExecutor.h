// concurrency/IParallelExecutor.h
#pragma once
#include <functional>
#include <future>

namespace abvalue
{
  namespace concurrency
  {
    class IParallelExecutor {
    public:
      virtual ~IParallelExecutor() = default;

      // Schedule a void() task; the future reports completion or the task's exception.
      virtual std::future<void> submit(std::function<void()> task) = 0;
    };
  } // namespace concurrency
} // namespace abvalue
