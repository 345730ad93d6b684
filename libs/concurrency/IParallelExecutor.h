// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <cstddef>
#include <future>
#include <vector>
#include <functional>

namespace triagesim
{
  namespace concurrency
  {
    class IParallelExecutor
    {
    public:
      virtual ~IParallelExecutor() = default;

      // Schedule a void() task; the returned future carries any exception it throws.
      virtual std::future<void> submit(std::function<void()> task) = 0;

      // Number of tasks that can make progress at the same time.
      virtual std::size_t concurrency() const = 0;

      // Waits on every future, then rethrows the first failure in submission order.
      virtual void waitAll(std::vector<std::future<void>>& futures)
      {
	std::exception_ptr firstFailure;
	for (auto& f : futures)
	  {
	    try
	      {
		f.get();
	      }
	    catch (...)
	      {
		if (!firstFailure)
		  firstFailure = std::current_exception();
	      }
	  }

	if (firstFailure)
	  std::rethrow_exception(firstFailure);
      }
    };
  }
}
