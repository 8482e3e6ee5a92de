#include <grpcpp/grpcpp.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "client/cpp/grpc_endpoint.h"
#include "client/cpp/upload_queue.h"
#include "client/cpp/video_client.h"

using namespace vidpipe::client;

static void Usage() {
  std::cout << "Usage:\n"
            << "  vidpipectl <addr> upload <owner_id> <file> [chunk_bytes]\n"
            << "  vidpipectl <addr> status <video_id>\n"
            << "  vidpipectl <addr> wait <video_id> [timeout_s]\n"
            << "  vidpipectl <addr> cancel <video_id>\n"
            << "  vidpipectl <addr> resubmit <video_id>\n";
}

static void PrintReport(const vidpipe::v1::VideoStatusReport& report) {
  std::cout << "video_id=" << report.video_id() << "\n"
            << "status=" << report.status_name() << "\n"
            << "progress=" << report.progress() << "\n";
  if (report.has_error_message()) {
    std::cout << "error=" << report.error_message() << "\n";
  }
  for (const auto& rendition : report.result_manifest().renditions()) {
    std::cout << "rendition=" << rendition.quality() << " " << rendition.width() << "x" << rendition.height() << " "
              << rendition.object_key() << "\n";
  }
  for (const auto& thumb : report.result_manifest().thumbnails()) {
    std::cout << "thumbnail=" << thumb.object_key() << "\n";
  }
  if (!report.result_manifest().audio().object_key().empty()) {
    std::cout << "audio=" << report.result_manifest().audio().object_key() << "\n";
  }
}

int main(int argc, char** argv) {
  if (argc < 4) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  // ------------------------------------------------------------

  if (cmd == "upload") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    UploadQueueOptions options;
    options.max_concurrent = 1;
    if (argc >= 6) options.chunk_size = std::stoull(argv[5]);

    UploadQueueManager queue(std::make_shared<GrpcResumableEndpoint>(channel), options);
    auto               events = queue.Subscribe();
    queue.Start();

    UploadRequest request;
    request.owner_id    = argv[3];
    request.source_path = argv[4];

    auto task_id = queue.Enqueue(request);
    if (!task_id.ok()) {
      std::cerr << task_id.status().ToString() << "\n";
      return 2;
    }

    for (;;) {
      auto event = events->Receive(std::chrono::seconds(1));
      if (!event || event->task_id != *task_id) continue;

      if (event->status == UploadStatus::kUploading && event->total_bytes > 0) {
        std::cerr << "\r" << event->bytes_transferred << "/" << event->total_bytes << " bytes" << std::flush;
      }
      if (event->status == UploadStatus::kCompleted) {
        std::cerr << "\n";
        std::cout << "video_id=" << event->video_id << "\n";
        queue.Stop();
        return 0;
      }
      if (event->status == UploadStatus::kFailed || event->status == UploadStatus::kCancelled) {
        std::cerr << "\nupload " << ToString(event->status) << ": " << event->message << "\n";
        queue.Stop();
        return 2;
      }
      if (event->status == UploadStatus::kQueued && !event->message.empty()) {
        std::cerr << "\nretrying: " << event->message << "\n";
      }
    }
  }

  // ------------------------------------------------------------

  VideoClient videos(channel);

  if (cmd == "status") {
    auto report = videos.GetStatus(argv[3]);
    if (!report.ok()) {
      std::cerr << report.status().ToString() << "\n";
      return 2;
    }
    PrintReport(*report);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "wait") {
    const auto timeout = std::chrono::seconds(argc >= 5 ? std::stoll(argv[4]) : 600);
    auto       report  = videos.WaitForTerminal(argv[3], timeout);
    if (!report.ok()) {
      std::cerr << report.status().ToString() << "\n";
      return 2;
    }
    PrintReport(*report);
    return report->status() == vidpipe::v1::VIDEO_STATUS_COMPLETED ? 0 : 3;
  }

  // ------------------------------------------------------------

  if (cmd == "cancel") {
    auto resp = videos.CancelProcessing(argv[3]);
    if (!resp.ok()) {
      std::cerr << resp.status().ToString() << "\n";
      return 2;
    }
    std::cout << "status=" << resp->status_name() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "resubmit") {
    auto resp = videos.Resubmit(argv[3]);
    if (!resp.ok()) {
      std::cerr << resp.status().ToString() << "\n";
      return 2;
    }
    std::cout << "status=" << resp->status_name() << "\n"
              << "job_id=" << resp->job_id() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
