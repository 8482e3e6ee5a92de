#include "scratch_space.hpp"

#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace vidpipe::pipeline {

ScratchSpace::ScratchSpace(const std::filesystem::path& root, const std::string& video_id, const std::string& lease_id)
    : dir_(root / (video_id + "-" + lease_id)) {
  std::error_code ec;
  std::filesystem::create_directories(dir_, ec);
  if (ec == std::errc::no_space_on_device) {
    throw util::ResourceExhausted("scratch disk full: " + dir_.string());
  }
  if (ec) {
    throw util::TransientIo("cannot create scratch dir " + dir_.string() + ": " + ec.message());
  }
}

ScratchSpace::~ScratchSpace() {
  std::error_code ec;
  std::filesystem::remove_all(dir_, ec);
  if (ec) {
    VIDPIPE_LOG_WARN("failed to remove scratch dir", {observability::StringField("path", dir_.string()),
                                                       observability::StringField("error", ec.message())});
  }
}

} // namespace vidpipe::pipeline
