#pragma once

#include <string>

#include "vidpipe/v1/types.pb.h"

namespace vidpipe::db::model {

// Manifests are stored as protobuf JSON text in SQL backends.
std::string                 EncodeManifest(const vidpipe::v1::ResultManifest& manifest);
vidpipe::v1::ResultManifest DecodeManifest(const std::string& json);

} // namespace vidpipe::db::model
