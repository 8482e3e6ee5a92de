#include "pipeline_runner.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

#include "internal/db/api/transaction_runner.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "scratch_space.hpp"

namespace vidpipe::pipeline {

using db::model::VideoRecord;
using model::VideoStatus;
using observability::DoubleField;
using observability::IntField;
using observability::StringField;

namespace {

struct ExhaustedAttempts : std::runtime_error {
  using std::runtime_error::runtime_error;
};

} // namespace

const char* ToString(JobOutcome outcome) {
  switch (outcome) {
    case JobOutcome::kCompleted:
      return "completed";
    case JobOutcome::kRetryScheduled:
      return "retry_scheduled";
    case JobOutcome::kFailed:
      return "failed";
    case JobOutcome::kAbandoned:
      return "abandoned";
  }
  return "unknown";
}

PipelineRunner::PipelineRunner(std::shared_ptr<db::Repository> repository, std::shared_ptr<queue::JobQueue> queue,
                               storage::ObjectStorePtr objects, std::shared_ptr<MediaTranscoder> transcoder,
                               std::shared_ptr<util::ClockSource> clock, PipelineOptions options)
    : repository_(std::move(repository)), queue_(std::move(queue)), objects_(std::move(objects)),
      transcoder_(std::move(transcoder)), clock_(std::move(clock)), options_(std::move(options)) {
}

JobOutcome PipelineRunner::Run(const queue::JobLease& lease) {
  observability::SpanScope span("pipeline.run");
  span.SetAttribute("video_id", lease.video_id);
  span.SetAttribute("attempt", static_cast<int64_t>(lease.attempt));

  JobOutcome outcome = JobOutcome::kFailed;

  try {
    if (options_.retry.limit > 0 && lease.attempt > options_.retry.limit) {
      // earlier deliveries died without reporting back (crash, kill, hang)
      std::string message = "processing exceeded " + std::to_string(options_.retry.limit) + " attempts";
      message += lease.last_error.empty() ? ", last attempt lost its lease" : ": " + lease.last_error;
      throw ExhaustedAttempts(message);
    }

    auto video = Load(lease);

    ScratchSpace scratch(options_.scratch_dir, video.video_id, lease.lease_id);
    StageContext ctx{*objects_, *transcoder_, options_, scratch, *clock_, lease.reduced_concurrency};

    for (;;) {
      const auto stage   = video.status;
      const auto started = std::chrono::steady_clock::now();

      auto next = Advance(video, ctx);

      const std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - started;
      observability::Metrics::Instance().ObserveStageDurationMs(model::ToString(stage), elapsed.count());

      if (next.status == VideoStatus::kCompleted) {
        Finish(lease, std::move(next));
        outcome = JobOutcome::kCompleted;
        break;
      }
      video = Persist(lease, std::move(next));
    }
  } catch (const util::LeaseConflict& e) {
    VIDPIPE_LOG_WARN("lease lost, abandoning job",
                     {StringField("video_id", lease.video_id), StringField("job_id", lease.job_id),
                      StringField("error", e.what())});
    outcome = JobOutcome::kAbandoned;
  } catch (const ExhaustedAttempts& e) {
    outcome = Fail(lease, e.what());
  } catch (const util::DataIntegrity& e) {
    outcome = Fail(lease, e.what());
  } catch (const util::InvalidState& e) {
    VIDPIPE_LOG_ERROR("pipeline contract violation",
                      {StringField("video_id", lease.video_id), StringField("error", e.what())});
    outcome = Fail(lease, e.what());
  } catch (const util::ResourceExhausted& e) {
    if (lease.reduced_concurrency) {
      outcome = Fail(lease, std::string("resources exhausted at reduced concurrency: ") + e.what());
    } else {
      outcome = RetryOrFail(lease, e.what(), true);
    }
  } catch (const std::exception& e) {
    outcome = RetryOrFail(lease, e.what(), lease.reduced_concurrency);
  }

  span.SetAttribute("outcome", std::string_view(ToString(outcome)));
  observability::Metrics::Instance().RecordJobOutcome(ToString(outcome));
  return outcome;
}

VideoRecord PipelineRunner::Load(const queue::JobLease& lease) {
  return db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    queue_->VerifyLease(tx, lease);
    auto video = repository_->GetVideo(tx, lease.video_id);
    if (!video) {
      throw util::InvalidState("job " + lease.job_id + " references missing video " + lease.video_id);
    }
    if (model::IsTerminal(video->status)) {
      throw util::InvalidState("job " + lease.job_id + " delivered for terminal video " + lease.video_id);
    }
    return *video;
  });
}

VideoRecord PipelineRunner::Persist(const queue::JobLease& lease, VideoRecord next) {
  auto stored = db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    queue_->VerifyLease(tx, lease);

    auto current = repository_->GetVideo(tx, lease.video_id);
    if (!current) {
      throw util::InvalidState("video " + lease.video_id + " disappeared during processing");
    }
    if (!model::CanTransition(current->status, next.status)) {
      throw util::InvalidState("illegal transition " + std::string(model::ToString(current->status)) + " -> " +
                               std::string(model::ToString(next.status)));
    }
    if (next.progress < current->progress) {
      throw util::InvalidState("progress regressed for video " + lease.video_id);
    }

    VideoRecord row = next;
    row.version     = current->version + 1;
    db::ThrowIfError(repository_->UpdateVideo(tx, row), "update video");
    return row;
  });

  VIDPIPE_LOG_DEBUG("stage persisted", {StringField("video_id", stored.video_id),
                                        StringField("status", model::ToString(stored.status)),
                                        DoubleField("progress", stored.progress)});
  Publish(stored);
  return stored;
}

void PipelineRunner::Finish(const queue::JobLease& lease, VideoRecord next) {
  auto stored = db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    queue_->VerifyLease(tx, lease);

    auto current = repository_->GetVideo(tx, lease.video_id);
    if (!current) {
      throw util::InvalidState("video " + lease.video_id + " disappeared during processing");
    }
    if (!model::CanTransition(current->status, VideoStatus::kCompleted)) {
      throw util::InvalidState("cannot complete video in status " + std::string(model::ToString(current->status)));
    }

    VideoRecord row = next;
    row.status      = VideoStatus::kCompleted;
    row.progress    = 1.0;
    row.error_message.clear();
    row.version = current->version + 1;
    db::ThrowIfError(repository_->UpdateVideo(tx, row), "complete video");
    queue_->AckIn(tx, lease);
    return row;
  });

  VIDPIPE_LOG_INFO("video processed", {StringField("video_id", stored.video_id),
                                       IntField("renditions", stored.manifest.renditions_size()),
                                       IntField("thumbnails", stored.manifest.thumbnails_size()),
                                       IntField("attempt", lease.attempt)});
  Publish(stored);
}

JobOutcome PipelineRunner::Fail(const queue::JobLease& lease, const std::string& message) {
  try {
    auto stored = db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
      queue_->VerifyLease(tx, lease);

      auto current = repository_->GetVideo(tx, lease.video_id);
      if (current && !model::IsTerminal(current->status)) {
        current->status        = VideoStatus::kFailed;
        current->error_message = message;
        current->version += 1;
        db::ThrowIfError(repository_->UpdateVideo(tx, *current), "fail video");
      }
      queue_->AckIn(tx, lease);
      return current;
    });

    VIDPIPE_LOG_WARN("video failed", {StringField("video_id", lease.video_id), StringField("error", message),
                                      IntField("attempt", lease.attempt)});
    if (stored) Publish(*stored);
    return JobOutcome::kFailed;
  } catch (const util::LeaseConflict& e) {
    VIDPIPE_LOG_WARN("lease lost before failure could be recorded",
                     {StringField("video_id", lease.video_id), StringField("error", e.what())});
    return JobOutcome::kAbandoned;
  }
}

JobOutcome PipelineRunner::RetryOrFail(const queue::JobLease& lease, const std::string& error, bool reduced_concurrency) {
  if (!options_.retry.ShouldRetry(lease.attempt)) {
    return Fail(lease, "processing failed after " + std::to_string(lease.attempt) + " attempts: " + error);
  }

  const auto delay = options_.retry.Delay(lease.attempt - 1);
  try {
    db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
      queue_->RetryIn(tx, lease, delay, error, reduced_concurrency);
    });
  } catch (const util::LeaseConflict& e) {
    VIDPIPE_LOG_WARN("lease lost before retry could be scheduled",
                     {StringField("video_id", lease.video_id), StringField("error", e.what())});
    return JobOutcome::kAbandoned;
  }

  VIDPIPE_LOG_WARN("processing attempt failed, retry scheduled",
                   {StringField("video_id", lease.video_id), StringField("error", error),
                    IntField("attempt", lease.attempt), IntField("delay_ms", delay.count()),
                    observability::BoolField("reduced_concurrency", reduced_concurrency)});
  return JobOutcome::kRetryScheduled;
}

void PipelineRunner::Publish(const VideoRecord& video) {
  events_.Publish(StageEvent{video.video_id, video.status, video.progress, video.error_message});
}

} // namespace vidpipe::pipeline
