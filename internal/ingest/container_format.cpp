#include "container_format.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>

#include "internal/util/errors.hpp"

namespace vidpipe::ingest {

namespace {

std::string LowerExtension(const std::string& filename) {
  auto ext = std::filesystem::path(filename).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

// ISO base media boxes that may open a file
constexpr std::array<std::string_view, 6> kIsoLeadingBoxes = {"ftyp", "moov", "mdat", "wide", "free", "skip"};

} // namespace

bool HasAllowedExtension(const std::string& filename, const std::vector<std::string>& allowed) {
  const auto ext = LowerExtension(filename);
  if (ext.empty()) return false;
  return std::find(allowed.begin(), allowed.end(), ext) != allowed.end();
}

ContainerFamily FamilyForExtension(const std::string& filename) {
  const auto ext = LowerExtension(filename);
  if (ext == ".mp4" || ext == ".mov" || ext == ".m4v") return ContainerFamily::kIsoBmff;
  if (ext == ".mkv" || ext == ".webm") return ContainerFamily::kMatroska;
  if (ext == ".avi") return ContainerFamily::kRiffAvi;
  return ContainerFamily::kUnknown;
}

ContainerFamily SniffContainer(std::string_view header) {
  if (header.size() >= 8) {
    const auto box = header.substr(4, 4);
    if (std::find(kIsoLeadingBoxes.begin(), kIsoLeadingBoxes.end(), box) != kIsoLeadingBoxes.end()) {
      return ContainerFamily::kIsoBmff;
    }
  }
  if (header.size() >= 4 && header.substr(0, 4) == std::string_view("\x1A\x45\xDF\xA3", 4)) {
    return ContainerFamily::kMatroska;
  }
  if (header.size() >= 12 && header.substr(0, 4) == "RIFF" && header.substr(8, 4) == "AVI ") {
    return ContainerFamily::kRiffAvi;
  }
  return ContainerFamily::kUnknown;
}

void ValidateContainer(const std::string& filename, std::string_view header, const std::vector<std::string>& allowed) {
  if (!HasAllowedExtension(filename, allowed)) {
    throw util::DataIntegrity("unsupported video format: " + filename);
  }

  const auto expected = FamilyForExtension(filename);
  const auto actual   = SniffContainer(header);
  if (actual == ContainerFamily::kUnknown) {
    throw util::DataIntegrity("unrecognized container signature in " + filename);
  }
  if (expected != ContainerFamily::kUnknown && expected != actual) {
    throw util::DataIntegrity(std::string("container is ") + ToString(actual) + " but extension implies " +
                              ToString(expected) + ": " + filename);
  }
}

const char* ToString(ContainerFamily family) {
  switch (family) {
    case ContainerFamily::kIsoBmff:
      return "iso-bmff";
    case ContainerFamily::kMatroska:
      return "matroska";
    case ContainerFamily::kRiffAvi:
      return "avi";
    case ContainerFamily::kUnknown:
      break;
  }
  return "unknown";
}

} // namespace vidpipe::ingest
