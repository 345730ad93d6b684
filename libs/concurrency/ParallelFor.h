// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>
#include <future>
#include <algorithm>

namespace triagesim
{
  namespace concurrency
  {
    // Split [0…total) into at most executor.concurrency() chunks, or chunks of
    // chunkSizeHint indices when a hint is given, submit each chunk and wait.
    // The body is called once per index; exceptions are rethrown by waitAll.
    template<typename Executor, typename Body>
    void parallel_for(uint32_t total, Executor& exec, Body body, uint32_t chunkSizeHint = 0)
    {
      if (total == 0)
	return;

      uint32_t chunkSize = chunkSizeHint;
      if (chunkSize == 0)
	{
	  const std::size_t numTasks = std::max<std::size_t>(exec.concurrency(), 1);
	  chunkSize = static_cast<uint32_t>((total + numTasks - 1) / numTasks); // ceil-divide
	}

      std::vector<std::future<void>> futures;
      for (uint32_t start = 0; start < total; start += chunkSize)
	{
	  const uint32_t end = std::min(total, start + chunkSize);
	  futures.emplace_back(exec.submit([=, &body]() {
		for (uint32_t p = start; p < end; ++p)
		  body(p);
	      }));

	  if (end == total)
	    break;
	}
      exec.waitAll(futures);
    }
  }
}
