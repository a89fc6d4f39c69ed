// concurrency/IParallelExecutor.h
#pragma once
#include <future>
#include <vector>
#include <functional>

namespace concurrency
{
  class IParallelExecutor {
  public:
    virtual ~IParallelExecutor() = default;

    // Schedule a void() task; returns a std::future you can wait on.
    virtual std::future<void> submit(std::function<void()> task) = 0;

    // Wait on a collection of futures. Every future is waited on even when an
    // earlier one failed; the first failure is rethrown afterwards.
    virtual void waitAll(std::vector<std::future<void>>& futures) {
      std::exception_ptr firstFailure;

      for (auto& f : futures) {
	try {
	  f.get();
	}
	catch (...) {
	  if (!firstFailure)
	    firstFailure = std::current_exception();
	}
      }

      if (firstFailure)
	std::rethrow_exception(firstFailure);
    }
  };
}
