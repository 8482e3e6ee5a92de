#include "internal/db/model/manifest_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace vidpipe::db::model {

std::string EncodeManifest(const vidpipe::v1::ResultManifest& manifest) {
  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(manifest, &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to encode result manifest: " + std::string(status.message()));
  }
  return json;
}

vidpipe::v1::ResultManifest DecodeManifest(const std::string& json) {
  vidpipe::v1::ResultManifest manifest;
  if (json.empty()) {
    return manifest;
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  const auto status = google::protobuf::util::JsonStringToMessage(json, &manifest, options);
  if (!status.ok()) {
    throw std::runtime_error("Corrupt result manifest: " + std::string(status.message()));
  }
  return manifest;
}

} // namespace vidpipe::db::model
