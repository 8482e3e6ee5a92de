#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace vidpipe::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

vidpipe::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  vidpipe::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(config);
  return config;
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

void ConfigLoader::ApplyDefaults(vidpipe::runtime::config::RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0:50071");
  if (server->max_message_bytes() == 0) server->set_max_message_bytes(64u * 1024u * 1024u);

  auto* storage = config.mutable_storage();
  if (storage->object_root().empty()) storage->set_object_root("/var/lib/vidpipe/objects");
  if (storage->scratch_dir().empty()) storage->set_scratch_dir("/var/lib/vidpipe/scratch");
  if (storage->staging_dir().empty()) storage->set_staging_dir("/var/lib/vidpipe/staging");

  auto* ingest = config.mutable_ingest();
  if (ingest->max_upload_bytes() == 0) ingest->set_max_upload_bytes(500ull * 1024ull * 1024ull);
  if (ingest->upload_ttl_seconds() == 0) ingest->set_upload_ttl_seconds(24ull * 3600ull);
  if (ingest->chunk_size_bytes() == 0) ingest->set_chunk_size_bytes(5ull * 1024ull * 1024ull);
  if (ingest->allowed_extensions().empty()) {
    for (const char* ext : {".mp4", ".mov", ".avi", ".webm", ".mkv"}) {
      ingest->add_allowed_extensions(ext);
    }
  }

  auto* queue = config.mutable_queue();
  if (queue->lease_duration_ms() == 0) queue->set_lease_duration_ms(30'000);
  if (queue->poll_interval_ms() == 0) queue->set_poll_interval_ms(500);

  auto* workers = config.mutable_workers();
  if (!workers->has_threads()) workers->set_threads(2);
  if (workers->heartbeat_interval_ms() == 0) workers->set_heartbeat_interval_ms(queue->lease_duration_ms() / 3);

  auto* retry = config.mutable_retry();
  if (retry->max_attempts() == 0) retry->set_max_attempts(3);
  if (retry->backoff_ms().empty()) {
    for (uint64_t ms : {60'000ull, 120'000ull, 240'000ull}) {
      retry->add_backoff_ms(ms);
    }
  }

  auto* pipeline = config.mutable_pipeline();
  if (pipeline->qualities().empty()) {
    struct Preset {
      const char* name;
      uint32_t    width;
      uint32_t    height;
      const char* video_bitrate;
      const char* audio_bitrate;
      const char* preset;
      uint32_t    crf;
    };
    static constexpr Preset kPresets[] = {
        {"360p", 640, 360, "500k", "96k", "fast", 28},
        {"720p", 1280, 720, "1500k", "128k", "medium", 23},
        {"1080p", 1920, 1080, "3000k", "192k", "medium", 20},
    };
    for (const auto& p : kPresets) {
      auto* tier = pipeline->add_qualities();
      tier->set_name(p.name);
      tier->set_width(p.width);
      tier->set_height(p.height);
      tier->set_video_bitrate(p.video_bitrate);
      tier->set_audio_bitrate(p.audio_bitrate);
      tier->set_preset(p.preset);
      tier->set_crf(p.crf);
    }
  }
  auto* thumbnails = pipeline->mutable_thumbnails();
  if (thumbnails->count() == 0) thumbnails->set_count(5);
  if (thumbnails->width() == 0) thumbnails->set_width(320);
  if (thumbnails->height() == 0) thumbnails->set_height(180);
  if (pipeline->audio().bitrate().empty()) pipeline->mutable_audio()->set_bitrate("192k");
  if (pipeline->max_duration_seconds() <= 0) pipeline->set_max_duration_seconds(300.0);
  if (pipeline->ffmpeg_path().empty()) pipeline->set_ffmpeg_path("ffmpeg");
  if (pipeline->ffprobe_path().empty()) pipeline->set_ffprobe_path("ffprobe");
  if (pipeline->stage_timeout_ms() == 0) pipeline->set_stage_timeout_ms(30 * 60 * 1000);

  auto* retention = config.mutable_retention();
  if (retention->days() == 0) retention->set_days(30);
  if (retention->sweep_interval_ms() == 0) retention->set_sweep_interval_ms(3'600'000);
}

} // namespace vidpipe::config
