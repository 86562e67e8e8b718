// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, December 2024
//

#pragma once

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "IParallelExecutor.h"
#include "ParallelExecutors.h"
#include "DecisionException.h"
#include "EvpiCalculator.h"
#include "EvsiCalculator.h"
#include "NetValueCalculator.h"

namespace abvalue
{
  namespace concurrency
  {
    enum class ComputeFailureKind
    {
      Numerical,     // NaN, Infinity or a prior with no feasible mass
      Unexpected     // any other exception escaping a calculator
    };

    inline std::string computeFailureKindToString(ComputeFailureKind kind)
    {
      return kind == ComputeFailureKind::Numerical ? "numerical" : "unexpected";
    }

    /**
     * @brief Exactly one of these arrives per background request: a result or a failure.
     */
    template <class R>
    class ComputeResponse
    {
    public:
      static ComputeResponse success(R result)
      {
	ComputeResponse response;
	response.mResult = std::move(result);
	return response;
      }

      static ComputeResponse failure(ComputeFailureKind kind, std::string message)
      {
	ComputeResponse response;
	response.mFailureKind = kind;
	response.mMessage = std::move(message);
	return response;
      }

      bool ok() const
      {
	return mResult.has_value();
      }

      const R& result() const
      {
	if (!mResult)
	  throw std::logic_error("ComputeResponse::result: request failed: " + mMessage);
	return *mResult;
      }

      ComputeFailureKind failureKind() const
      {
	if (!mFailureKind)
	  throw std::logic_error("ComputeResponse::failureKind: request succeeded");
	return *mFailureKind;
      }

      const std::string& message() const
      {
	return mMessage;
      }

    private:
      ComputeResponse() = default;

      std::optional<R> mResult;
      std::optional<ComputeFailureKind> mFailureKind;
      std::string mMessage;
    };

    /**
     * @class DecisionComputeService
     * @brief Dispatches value-of-information requests onto an executor.
     *
     * Inputs are validated on the caller's thread, so a ValidationException
     * is thrown from submit*() and nothing is dispatched. Calculations that
     * need no simulation (EVPI, EVSI with a Normal prior) run inline. Monte
     * Carlo work is copied into a task and run on the executor; its future
     * resolves to exactly one ComputeResponse.
     *
     * The destructor waits for every request still in flight.
     */
    class DecisionComputeService
    {
    public:
      DecisionComputeService()
	: mExecutor(std::make_shared<ThreadPoolExecutor>())
      {}

      explicit DecisionComputeService(std::shared_ptr<IParallelExecutor> executor)
	: mExecutor(std::move(executor))
      {
	if (!mExecutor)
	  throw std::invalid_argument("DecisionComputeService: executor must not be null");
      }

      DecisionComputeService(const DecisionComputeService&) = delete;
      DecisionComputeService& operator=(const DecisionComputeService&) = delete;

      ~DecisionComputeService()
      {
	waitForPending();
      }

      EvpiResult computeEvpi(const EvpiInputs& inputs) const
      {
	return EvpiCalculator::compute(inputs);
      }

      std::future<ComputeResponse<EvsiResult>> submitEvsi(const EvsiInputs& inputs,
							  const MonteCarloOptions& options = MonteCarloOptions())
      {
	EvsiCalculator::validate(inputs);
	if (EvsiCalculator::usesFastPath(inputs))
	  return runInline<EvsiResult>("EVSI", [inputs]() { return EvsiCalculator::normalFastPath(inputs); });

	requireSamples(options);
	return dispatch<EvsiResult>("EVSI", [inputs, options]() { return EvsiCalculator::monteCarlo(inputs, options); });
      }

      std::future<ComputeResponse<NetValueResult>> submitNetValue(const NetValueInputs& inputs,
								  const MonteCarloOptions& options = MonteCarloOptions())
      {
	NetValueCalculator::validate(inputs);
	requireSamples(options);
	return dispatch<NetValueResult>("net value", [inputs, options]() {
	  return NetValueCalculator::compute(inputs, options);
	});
      }

      /**
       * @brief Block until every dispatched task has finished.
       */
      void waitForPending()
      {
	std::vector<std::future<void>> pending;
	{
	  std::lock_guard<std::mutex> lock(mPendingMutex);
	  pending.swap(mPending);
	}

	// Task failures are delivered through the response futures.
	for (auto& f : pending)
	  f.wait();
      }

    private:
      static void requireSamples(const MonteCarloOptions& options)
      {
	if (options.numSamples == 0)
	  throw ValidationException("simulation.numSamples", "must be at least 1");
      }

      template <class R, class Fn>
      static ComputeResponse<R> run(const std::string& what, Fn&& fn)
      {
	try
	  {
	    return ComputeResponse<R>::success(fn());
	  }
	catch (const NumericalException& e)
	  {
	    std::cerr << "DecisionComputeService: " << what << " failed: " << e.what() << std::endl;
	    return ComputeResponse<R>::failure(ComputeFailureKind::Numerical, e.what());
	  }
	catch (const std::exception& e)
	  {
	    std::cerr << "DecisionComputeService: " << what << " failed unexpectedly: " << e.what() << std::endl;
	    return ComputeResponse<R>::failure(ComputeFailureKind::Unexpected, e.what());
	  }
      }

      template <class R, class Fn>
      static std::future<ComputeResponse<R>> runInline(const std::string& what, Fn fn)
      {
	std::promise<ComputeResponse<R>> promise;
	promise.set_value(run<R>(what, fn));
	return promise.get_future();
      }

      template <class R, class Fn>
      std::future<ComputeResponse<R>> dispatch(const std::string& what, Fn fn)
      {
	auto promise = std::make_shared<std::promise<ComputeResponse<R>>>();
	auto response = promise->get_future();

	std::future<void> done = mExecutor->submit([promise, what, fn]() {
	  promise->set_value(run<R>(what, fn));
	});

	std::lock_guard<std::mutex> lock(mPendingMutex);
	pruneFinished();
	mPending.push_back(std::move(done));
	return response;
      }

      // Caller holds mPendingMutex.
      void pruneFinished()
      {
	auto finished = [](std::future<void>& f) {
	  return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
	};
	mPending.erase(std::remove_if(mPending.begin(), mPending.end(), finished), mPending.end());
      }

    private:
      std::shared_ptr<IParallelExecutor> mExecutor;
      std::mutex mPendingMutex;
      std::vector<std::future<void>> mPending;
    };
  } // namespace concurrency
} // namespace abvalue
