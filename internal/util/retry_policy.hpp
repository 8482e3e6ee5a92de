#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <utility>
#include <vector>

namespace vidpipe::util {

/*
  Retry policy value.

  `limit` bounds the counter the caller tracks: the upload queue passes
  its retry count (retries already scheduled), the worker pool passes
  the attempt number of the execution that just failed. Either way a
  retry happens only while counter < limit.

  Delay(counter) picks backoff[min(counter, len-1)]; an empty table
  means retry immediately.
*/
struct RetryPolicy {
  std::uint32_t                          limit = 0;
  std::vector<std::chrono::milliseconds> backoff;

  bool ShouldRetry(std::uint32_t counter) const {
    return counter < limit;
  }

  std::chrono::milliseconds Delay(std::uint32_t counter) const {
    if (backoff.empty()) {
      return std::chrono::milliseconds::zero();
    }
    const auto index = std::min<std::size_t>(counter, backoff.size() - 1);
    return backoff[index];
  }

  // 5 retries at 0s, 1s, 5s, 10s, 30s.
  static RetryPolicy UploadDefault() {
    using namespace std::chrono_literals;
    return RetryPolicy{5, {0ms, 1000ms, 5000ms, 10000ms, 30000ms}};
  }

  // 3 attempts, doubling from one minute.
  static RetryPolicy ProcessingDefault() {
    using namespace std::chrono_literals;
    return RetryPolicy{3, {60000ms, 120000ms, 240000ms}};
  }
};

} // namespace vidpipe::util
