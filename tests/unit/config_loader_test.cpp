#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "vidpipe_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestMinimalConfigGetsDefaults() {
  const auto yaml_path = WriteYaml("minimal", R"(server:
  bind_address: "127.0.0.1:6000"
)");

  auto config = vidpipe::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.server().max_message_bytes() == 64u * 1024u * 1024u);

  assert(config.ingest().max_upload_bytes() == 500ull * 1024ull * 1024ull);
  assert(config.ingest().upload_ttl_seconds() == 24ull * 3600ull);
  assert(config.ingest().chunk_size_bytes() == 5ull * 1024ull * 1024ull);
  assert(config.ingest().allowed_extensions_size() == 5);

  assert(config.queue().lease_duration_ms() == 30'000);
  assert(config.workers().threads() == 2);
  assert(config.workers().heartbeat_interval_ms() == 10'000);

  assert(config.retry().max_attempts() == 3);
  assert(config.retry().backoff_ms_size() == 3);
  assert(config.retry().backoff_ms(0) == 60'000);
  assert(config.retry().backoff_ms(2) == 240'000);

  assert(config.pipeline().qualities_size() == 3);
  assert(config.pipeline().qualities(0).name() == "360p");
  assert(config.pipeline().qualities(2).height() == 1080);
  assert(config.pipeline().thumbnails().count() == 5);
  assert(config.pipeline().audio().bitrate() == "192k");
  assert(config.pipeline().max_duration_seconds() == 300.0);

  assert(config.retention().days() == 30);
  assert(!config.database().has_sqlite());
}

void TestExplicitValuesOverrideDefaults() {
  const auto yaml_path = WriteYaml("explicit", R"(database:
  sqlite:
    path: "/tmp/vidpipe.db"
queue:
  lease_duration_ms: 9000
workers:
  threads: 0
retry:
  max_attempts: 5
  backoff_ms: [1000, 2000]
pipeline:
  qualities:
    - name: "480p"
      width: 854
      height: 480
      video_bitrate: "1000k"
      audio_bitrate: "128k"
      preset: "fast"
      crf: 24
  thumbnails:
    count: 2
)");

  auto config = vidpipe::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "/tmp/vidpipe.db");
  assert(config.queue().lease_duration_ms() == 9000);
  // explicit zero is kept and derived values follow the lease
  assert(config.workers().has_threads());
  assert(config.workers().threads() == 0);
  assert(config.workers().heartbeat_interval_ms() == 3000);
  assert(config.retry().max_attempts() == 5);
  assert(config.retry().backoff_ms_size() == 2);
  assert(config.pipeline().qualities_size() == 1);
  assert(config.pipeline().qualities(0).name() == "480p");
  assert(config.pipeline().qualities(0).crf() == 24);
  assert(config.pipeline().thumbnails().count() == 2);
  assert(config.pipeline().thumbnails().width() == 320);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash", R"(database:
  sqlite:
    path: "C:\\vidpipe\\\"quoted\"\\db.sqlite"
)");

  auto config = vidpipe::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\vidpipe\\\"quoted\"\\db.sqlite");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field", R"(server:
  bind_address: "0.0.0.0:50071"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)vidpipe::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestMissingFileIsRejected() {
  bool threw = false;
  try {
    (void)vidpipe::config::ConfigLoader::LoadFromYaml("/nonexistent/vidpipe.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestShippedExampleLoads() {
  const auto path   = std::filesystem::path(VIDPIPE_SOURCE_DIR) / "config" / "vidpipe.example.yaml";
  auto       config = vidpipe::config::ConfigLoader::LoadFromYaml(path.string());
  assert(config.database().has_sqlite());
  assert(config.pipeline().qualities_size() == 3);
  assert(config.pipeline().qualities(2).name() == "1080p");
  assert(config.pipeline().qualities(2).crf() == 20);
  assert(config.ingest().allowed_extensions_size() == 5);
  assert(config.retry().backoff_ms(2) == 240000);
  assert(config.observability().transport() == vidpipe::runtime::config::OTLP_TRANSPORT_GRPC);
}

} // namespace

int main() {
  TestMinimalConfigGetsDefaults();
  TestExplicitValuesOverrideDefaults();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsRejected();
  TestShippedExampleLoads();

  std::cout << "vidpipe_unit_config_loader: pass\n";
  return 0;
}
