#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/transaction_runner.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

#if VIDPIPE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if VIDPIPE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using vidpipe::db::Repository;
using vidpipe::db::memory::MemoryRepository;
using vidpipe::db::model::JobRecord;
using vidpipe::db::model::UploadRecord;
using vidpipe::db::model::VideoRecord;
using vidpipe::model::VideoStatus;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

VideoRecord MakeVideo(const std::string& id, uint64_t created_at_ms) {
  VideoRecord video;
  video.video_id          = id;
  video.owner_id          = "owner-1";
  video.filename          = "clip.mp4";
  video.source_object_key = "videos/original/" + id + "_clip.mp4";
  video.size_bytes        = 4096;
  video.status            = VideoStatus::kPending;
  video.created_at_ms     = created_at_ms;
  video.version           = 1;
  return video;
}

JobRecord MakeJob(const std::string& video_id, uint64_t enqueued_at_ms) {
  JobRecord job;
  job.job_id                 = "job-" + video_id;
  job.video_id               = video_id;
  job.enqueued_at_ms         = enqueued_at_ms;
  job.visibility_deadline_ms = enqueued_at_ms;
  return job;
}

void VerifyVideoLifecycle(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();
  assert(repo.InsertVideo(*tx, MakeVideo(id, 1000)));
  assert(!repo.InsertVideo(*tx, MakeVideo(id, 1000)));

  auto video = repo.GetVideo(*tx, id);
  assert(video.has_value());
  assert(video->status == VideoStatus::kPending);
  assert(video->source_object_key == "videos/original/" + id + "_clip.mp4");

  video->status                   = VideoStatus::kTranscoding;
  video->progress                 = 0.4;
  video->processing_started_at_ms = 2000;
  video->version                  = 2;
  auto* rendition                 = video->manifest.add_renditions();
  rendition->set_quality("360p");
  rendition->set_object_key("videos/transcoded/360p/" + id + ".mp4");
  rendition->set_width(640);
  rendition->set_height(360);
  rendition->set_bitrate(500000);
  video->manifest.mutable_media()->set_duration_s(12.5);
  assert(repo.UpdateVideo(*tx, *video));

  auto updated = repo.GetVideo(*tx, id);
  assert(updated.has_value());
  assert(updated->status == VideoStatus::kTranscoding);
  assert(updated->progress == 0.4);
  assert(updated->processing_started_at_ms == 2000);
  assert(updated->processing_completed_at_ms == 0);
  assert(updated->manifest.renditions_size() == 1);
  assert(updated->manifest.renditions(0).bitrate() == 500000);
  assert(updated->manifest.media().duration_s() == 12.5);

  assert(repo.DeleteVideo(*tx, id));
  assert(!repo.GetVideo(*tx, id).has_value());
  tx->Commit();
}

void VerifyVideosCreatedBefore(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertVideo(*tx, MakeVideo(prefix + "-b", 200)));
    assert(repo.InsertVideo(*tx, MakeVideo(prefix + "-a", 100)));
    assert(repo.InsertVideo(*tx, MakeVideo(prefix + "-c", 900)));
    tx->Commit();
  }

  auto tx  = repo.Begin();
  auto old = repo.ListVideosCreatedBefore(*tx, 500);
  std::vector<std::string> ids;
  for (const auto& v : old) {
    if (v.video_id.rfind(prefix, 0) == 0) ids.push_back(v.video_id);
  }
  assert(ids.size() == 2);
  assert(ids[0] == prefix + "-a");
  assert(ids[1] == prefix + "-b");

  for (const auto& suffix : {"-a", "-b", "-c"}) {
    assert(repo.DeleteVideo(*tx, prefix + suffix));
  }
  tx->Commit();
}

void VerifyJobVisibility(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertVideo(*tx, MakeVideo(prefix + "-1", 100)));
    assert(repo.InsertVideo(*tx, MakeVideo(prefix + "-2", 100)));
    assert(repo.InsertJob(*tx, MakeJob(prefix + "-2", 20)));
    assert(repo.InsertJob(*tx, MakeJob(prefix + "-1", 10)));
    tx->Commit();
  }

  auto tx = repo.Begin();
  assert(repo.CountJobs(*tx) == 2);

  auto first = repo.NextVisibleJob(*tx, 50);
  assert(first.has_value());
  assert(first->video_id == prefix + "-1");

  first->attempt                = 1;
  first->lease_id               = "lease-a";
  first->visibility_deadline_ms = 10'000;
  first->reduced_concurrency    = true;
  first->last_error             = "disk full";
  assert(repo.UpdateJob(*tx, *first));

  auto next = repo.NextVisibleJob(*tx, 50);
  assert(next.has_value());
  assert(next->video_id == prefix + "-2");

  // the leased job comes back once its deadline has passed
  auto by_video = repo.GetJobByVideo(*tx, prefix + "-1");
  assert(by_video.has_value());
  assert(by_video->lease_id == "lease-a");
  assert(by_video->attempt == 1);
  assert(by_video->reduced_concurrency);
  assert(by_video->last_error == "disk full");
  assert(!repo.NextVisibleJob(*tx, 5).has_value());

  assert(repo.DeleteJob(*tx, next->job_id));
  auto expired = repo.NextVisibleJob(*tx, 10'000);
  assert(expired.has_value());
  assert(expired->job_id == first->job_id);

  assert(repo.DeleteJob(*tx, first->job_id));
  assert(!repo.GetJob(*tx, first->job_id).has_value());
  assert(repo.CountJobs(*tx) == 0);
  assert(repo.DeleteVideo(*tx, prefix + "-1"));
  assert(repo.DeleteVideo(*tx, prefix + "-2"));
  tx->Commit();
}

void VerifyUploadSessions(Repository& repo, const std::string& id) {
  UploadRecord upload;
  upload.upload_id     = id;
  upload.owner_id      = "owner-1";
  upload.filename      = "clip.mp4";
  upload.declared_size = 10'000;
  upload.staging_path  = "/tmp/staging/" + id;
  upload.created_at_ms = 1000;
  upload.expires_at_ms = 5000;

  auto tx = repo.Begin();
  assert(repo.InsertUpload(*tx, upload));
  assert(!repo.InsertUpload(*tx, upload));

  auto read = repo.GetUpload(*tx, id);
  assert(read.has_value());
  assert(read->confirmed_offset == 0);
  assert(read->video_id.empty());

  read->confirmed_offset = 6000;
  read->video_id         = "video-" + id;
  assert(repo.UpdateUpload(*tx, *read));
  assert(repo.GetUpload(*tx, id)->confirmed_offset == 6000);

  bool listed = false;
  for (const auto& u : repo.ListUploadsExpiredBefore(*tx, 5001)) {
    if (u.upload_id == id) listed = true;
  }
  assert(listed);
  for (const auto& u : repo.ListUploadsExpiredBefore(*tx, 4999)) {
    assert(u.upload_id != id);
  }

  assert(repo.DeleteUpload(*tx, id));
  assert(!repo.GetUpload(*tx, id).has_value());
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertVideo(*tx, MakeVideo(id, 100)));
    assert(repo.InsertJob(*tx, MakeJob(id, 100)));
    tx->Rollback();
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetVideo(*check_tx, id).has_value());
  assert(!repo.GetJobByVideo(*check_tx, id).has_value());
  check_tx->Commit();
}

void VerifyConcurrentClaims(Repository& repo, const std::string& prefix) {
  constexpr int kJobs = 12;
  {
    auto tx = repo.Begin();
    for (int i = 0; i < kJobs; ++i) {
      const auto id = prefix + "-" + std::to_string(i);
      assert(repo.InsertVideo(*tx, MakeVideo(id, 100)));
      assert(repo.InsertJob(*tx, MakeJob(id, 100 + i)));
    }
    tx->Commit();
  }

  std::mutex                 mu;
  std::multiset<std::string> claimed;
  std::atomic<int>           done{0};

  auto claimer = [&](int worker) {
    while (done.load() < kJobs) {
      std::optional<JobRecord> job;
      try {
        job = vidpipe::db::RunInTransaction(repo, [&](vidpipe::db::Transaction& tx) -> std::optional<JobRecord> {
          auto next = repo.NextVisibleJob(tx, 1000);
          if (!next) return std::nullopt;
          next->lease_id               = "lease-" + std::to_string(worker);
          next->visibility_deadline_ms = 1'000'000;
          vidpipe::db::ThrowIfError(repo.UpdateJob(tx, *next), "claim job");
          return next;
        });
      } catch (const vidpipe::util::TransientIo&) {
        continue;
      }
      if (!job) break;
      std::lock_guard lock(mu);
      claimed.insert(job->job_id);
      done.fetch_add(1);
    }
  };

  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) threads.emplace_back(claimer, i);
  for (auto& t : threads) t.join();

  assert(claimed.size() == kJobs);
  assert(std::set<std::string>(claimed.begin(), claimed.end()).size() == kJobs);

  auto tx = repo.Begin();
  for (int i = 0; i < kJobs; ++i) {
    const auto id = prefix + "-" + std::to_string(i);
    assert(repo.DeleteJob(*tx, "job-" + id));
    assert(repo.DeleteVideo(*tx, id));
  }
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx    = repo->Begin();
    auto video = MakeVideo(id, 100);
    video.status   = VideoStatus::kCompleted;
    video.progress = 1.0;
    video.manifest.mutable_audio()->set_object_key("videos/audio/" + id + ".mp3");
    assert(repo->InsertVideo(*tx, video));

    UploadRecord upload{.upload_id = id + "-upload", .owner_id = "owner-1", .filename = "clip.mp4", .declared_size = 10,
                        .confirmed_offset = 4, .staging_path = "/tmp/x", .created_at_ms = 1, .expires_at_ms = NowMs() + 60'000};
    assert(repo->InsertUpload(*tx, upload));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto v  = repo->GetVideo(*tx, id);
  assert(v.has_value());
  assert(v->status == VideoStatus::kCompleted);
  assert(v->manifest.audio().object_key() == "videos/audio/" + id + ".mp3");

  auto u = repo->GetUpload(*tx, id + "-upload");
  assert(u.has_value());
  assert(u->confirmed_offset == 4);

  assert(repo->DeleteVideo(*tx, id));
  assert(repo->DeleteUpload(*tx, id + "-upload"));
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if VIDPIPE_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("vidpipe_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<vidpipe::db::sqlite::SqliteDB>(db_path);
    db->Bootstrap();
    return std::make_shared<vidpipe::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

#if VIDPIPE_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("VIDPIPE_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("VIDPIPE_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<vidpipe::db::postgres::PgPool>(conninfo, 8);
    pool->Bootstrap();
    return std::make_shared<vidpipe::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  const auto tag  = backend.name + "-" + std::to_string(NowMs());
  auto       repo = backend.make_repository();

  VerifyVideoLifecycle(*repo, tag + "-video");
  VerifyVideosCreatedBefore(*repo, tag + "-aged");
  VerifyJobVisibility(*repo, tag + "-jobs");
  VerifyUploadSessions(*repo, tag + "-upload");
  VerifyRollbackBehavior(*repo, tag + "-rollback");
  VerifyConcurrentClaims(*repo, tag + "-claims");

  repo.reset();
  VerifyRestartDurability(backend, tag + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if VIDPIPE_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if VIDPIPE_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "vidpipe_integration_repository_parity: pass\n";
  return 0;
}
