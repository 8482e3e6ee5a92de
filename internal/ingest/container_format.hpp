#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace vidpipe::ingest {

enum class ContainerFamily {
  kUnknown,
  kIsoBmff, // mp4, mov
  kMatroska, // mkv, webm
  kRiffAvi,
};

// Bytes needed by SniffContainer.
inline constexpr size_t kSniffBytes = 12;

// Case-insensitive extension check, extension includes the leading dot.
bool HasAllowedExtension(const std::string& filename, const std::vector<std::string>& allowed);

ContainerFamily FamilyForExtension(const std::string& filename);

ContainerFamily SniffContainer(std::string_view header);

/*
  Throws util::DataIntegrity when the extension is not allowed or the
  leading bytes do not carry the container signature it implies.
*/
void ValidateContainer(const std::string& filename, std::string_view header, const std::vector<std::string>& allowed);

const char* ToString(ContainerFamily family);

} // namespace vidpipe::ingest
