#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace vidpipe::pipeline {

struct ProcessResult {
  int         exit_code   = -1; // -1 when killed by a signal
  int         term_signal = 0;
  std::string out;
  std::string err_tail; // last few KiB of stderr
};

/*
  Run argv[0] (PATH lookup) to completion, capturing stdout and the
  tail of stderr. Throws util::TransientIo if the process cannot be
  started, or if it outlives a non-zero timeout (the child is killed).
*/
ProcessResult RunProcess(const std::vector<std::string>& argv,
                         std::chrono::milliseconds timeout = std::chrono::milliseconds::zero());

} // namespace vidpipe::pipeline
