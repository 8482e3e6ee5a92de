#pragma once

#include <filesystem>
#include <string>

namespace vidpipe::pipeline {

/*
  Per-execution working directory, removed on destruction. Named after
  the lease so a re-delivered job never shares files with a stale
  execution of the same video.
*/
class ScratchSpace {
 public:
  ScratchSpace(const std::filesystem::path& root, const std::string& video_id, const std::string& lease_id);
  ~ScratchSpace();

  ScratchSpace(const ScratchSpace&)            = delete;
  ScratchSpace& operator=(const ScratchSpace&) = delete;

  const std::filesystem::path& Dir() const {
    return dir_;
  }

  std::filesystem::path File(const std::string& name) const {
    return dir_ / name;
  }

 private:
  std::filesystem::path dir_;
};

} // namespace vidpipe::pipeline
