#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace vidpipe::ingest {

/*
  Local staging files for resumable uploads, one per upload id.

  Append is positional: bytes past `offset` left behind by a crashed
  earlier append are truncated before writing, so the file length
  always converges on the confirmed offset.
*/
class StagingArea {
 public:
  explicit StagingArea(std::filesystem::path root);

  std::filesystem::path PathFor(const std::string& upload_id) const;

  // Creates (or truncates) an empty staging file.
  std::filesystem::path Create(const std::string& upload_id);

  // Writes data at offset and flushes. Returns the new file length.
  uint64_t Append(const std::filesystem::path& path, uint64_t offset, std::string_view data);

  // Reads up to n leading bytes.
  std::string ReadHeader(const std::filesystem::path& path, size_t n) const;

  uint64_t Size(const std::filesystem::path& path) const;

  void Remove(const std::filesystem::path& path) const;

 private:
  std::filesystem::path root_;
};

} // namespace vidpipe::ingest
