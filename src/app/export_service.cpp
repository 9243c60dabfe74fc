//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "app/export_service.hpp"

#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <opencv2/core/utils/logger.hpp>
#include <set>
#include <utility>

#include "io/image/image_loader.hpp"
#include "io/image/image_writer.hpp"
#include "type/errors.hpp"
#include "utils/profiler/profiler.hpp"

namespace photograph {
namespace {
auto OutputPathAvailable(const image_path_t& path, const std::set<image_path_t>& reserved)
    -> bool {
  std::error_code ec;
  return reserved.count(path) == 0 && !std::filesystem::exists(path, ec);
}

auto BuildOutputPath(const image_path_t& source_path, const image_path_t& output_dir,
                     const std::string& ext, std::set<image_path_t>& reserved) -> image_path_t {
  std::string stem = source_path.stem().string();
  if (stem.empty()) stem = "image";

  image_path_t candidate = output_dir / (stem + "." + ext);
  if (OutputPathAvailable(candidate, reserved)) {
    reserved.insert(candidate);
    return candidate;
  }
  for (int n = 2; n < 10000; ++n) {
    candidate = output_dir / (stem + "-" + std::to_string(n) + "." + ext);
    if (OutputPathAvailable(candidate, reserved)) {
      reserved.insert(candidate);
      return candidate;
    }
  }
  candidate = output_dir / (stem + "-final." + ext);
  reserved.insert(candidate);
  return candidate;
}

// Shared by the workers of one Run call
struct ExportSession {
  std::mutex                      mtx_;
  std::condition_variable         done_condition_;
  std::vector<ExportResult>       results_;
  ExportProgress                  progress_;
  // Jobs whose progress notification has been handled, delivered or dropped
  size_t                          notified_ = 0;

  // Serializes callback invocations; never held together with mtx_
  std::mutex                      callback_mtx_;
  size_t                          last_reported_ = 0;
  ExportService::ProgressCallback callback_;
};

void ReportProgress(ExportSession& session, const ExportProgress& snapshot) {
  std::lock_guard<std::mutex> lock(session.callback_mtx_);
  // A snapshot overtaken by a newer one is dropped so the reported count never goes back
  if (!session.callback_ || snapshot.completed_ <= session.last_reported_) return;
  session.last_reported_ = snapshot.completed_;
  try {
    session.callback_(snapshot);
  } catch (const std::exception& e) {
    CV_LOG_WARNING(NULL, "[ExportService] Progress callback threw: " << e.what());
  } catch (...) {
    CV_LOG_WARNING(NULL, "[ExportService] Progress callback threw an unknown exception");
  }
}
}  // namespace

auto ExportErrorKindName(ExportErrorKind kind) -> std::string_view {
  switch (kind) {
    case ExportErrorKind::NONE:
      return "none";
    case ExportErrorKind::DECODE:
      return "decode";
    case ExportErrorKind::RENDER:
      return "render";
    case ExportErrorKind::ENCODE:
      return "encode";
    case ExportErrorKind::IO:
      return "io";
    case ExportErrorKind::INVALID_STATE:
      return "invalid state";
  }
  return "unknown";
}

auto ExportSummary::FirstError() const -> const ExportResult* {
  for (const auto& result : results_) {
    if (!result.success_) return &result;
  }
  return nullptr;
}

auto BuildRenderJobs(const std::vector<ExportTask>& tasks, const image_path_t& output_dir,
                     const ExportFormatOptions& options) -> std::vector<RenderJob> {
  std::set<image_path_t>  reserved;
  std::vector<RenderJob>  jobs;
  const std::string       ext = ExtensionOf(options.format_);
  jobs.reserve(tasks.size());
  for (size_t i = 0; i < tasks.size(); ++i) {
    RenderJob job;
    job.index_       = i;
    job.source_path_ = tasks[i].source_path_;
    job.state_       = tasks[i].state_;
    job.output_path_ = BuildOutputPath(tasks[i].source_path_, output_dir, ext, reserved);
    job.options_     = options;
    jobs.push_back(std::move(job));
  }
  return jobs;
}

ExportService::ExportService(std::shared_ptr<const RenderRouter> router, size_t worker_count)
    : router_(std::move(router)),
      decode_([](const image_path_t& path) { return ImageLoader::Load(path); }),
      encode_([](const ImageBuffer& image, const image_path_t& path,
                 const ExportFormatOptions& options) {
        ImageWriter::WriteImageToPath(image, path, options);
      }),
      export_thread_pool_(worker_count) {}

auto ExportService::RunExportRenderTask(const RenderJob& job) const -> ExportResult {
  EASY_BLOCK("ExportService::RunExportRenderTask");
  ExportResult result;
  result.index_       = job.index_;
  result.source_path_ = job.source_path_;
  result.output_path_ = job.output_path_;

  auto fail = [&result](ExportErrorKind kind, const std::string& message) {
    result.success_    = false;
    result.error_kind_ = kind;
    result.message_    = message;
    return result;
  };

  try {
    for (const auto& op : job.state_.Operations()) {
      Validate(op);
    }
  } catch (const OperationError& e) {
    return fail(ExportErrorKind::INVALID_STATE, e.what());
  }

  ImageBuffer source;
  try {
    source = decode_(job.source_path_);
  } catch (const DecodeError& e) {
    return fail(ExportErrorKind::DECODE, e.what());
  } catch (const std::filesystem::filesystem_error& e) {
    return fail(ExportErrorKind::IO, e.what());
  } catch (const std::exception& e) {
    return fail(ExportErrorKind::DECODE, e.what());
  } catch (...) {
    return fail(ExportErrorKind::DECODE, "Unknown decode error");
  }

  std::optional<RenderOutput> rendered;
  try {
    rendered = router_->Render(source, job.state_);
  } catch (const PolicyViolation& e) {
    return fail(ExportErrorKind::RENDER, e.what());
  } catch (const std::exception& e) {
    return fail(ExportErrorKind::RENDER, e.what());
  } catch (...) {
    return fail(ExportErrorKind::RENDER, "Unknown render error");
  }
  result.backend_ = rendered->backend_;

  try {
    encode_(rendered->image_, job.output_path_, job.options_);
  } catch (const EncodeError& e) {
    return fail(ExportErrorKind::ENCODE, e.what());
  } catch (const std::filesystem::filesystem_error& e) {
    return fail(ExportErrorKind::IO, e.what());
  } catch (const std::exception& e) {
    return fail(ExportErrorKind::ENCODE, e.what());
  } catch (...) {
    return fail(ExportErrorKind::ENCODE, "Unknown export error");
  }

  result.success_ = true;
  return result;
}

auto ExportService::Run(std::vector<RenderJob> jobs, ProgressCallback progress) -> ExportSummary {
  const auto start    = std::chrono::steady_clock::now();
  auto       session  = std::make_shared<ExportSession>();
  session->results_.resize(jobs.size());
  session->progress_.total_ = jobs.size();
  session->callback_        = std::move(progress);

  auto shared_jobs = std::make_shared<const std::vector<RenderJob>>(std::move(jobs));
  for (size_t slot = 0; slot < shared_jobs->size(); ++slot) {
    export_thread_pool_.Submit([this, session, shared_jobs, slot]() {
      ExportResult result = RunExportRenderTask((*shared_jobs)[slot]);
      if (!result.success_) {
        CV_LOG_WARNING(NULL, "[ExportService] " << result.source_path_.string() << " failed ("
                                                << ExportErrorKindName(result.error_kind_)
                                                << "): " << result.message_);
      }

      ExportProgress snapshot;
      {
        std::lock_guard<std::mutex> lock(session->mtx_);
        if (result.success_) {
          ++session->progress_.succeeded_;
        } else {
          ++session->progress_.failed_;
        }
        ++session->progress_.completed_;
        session->results_[slot] = std::move(result);
        snapshot                = session->progress_;
      }

      ReportProgress(*session, snapshot);

      std::lock_guard<std::mutex> lock(session->mtx_);
      ++session->notified_;
      if (session->notified_ == session->progress_.total_) {
        session->done_condition_.notify_all();
      }
    });
  }

  ExportSummary summary;
  {
    std::unique_lock<std::mutex> lock(session->mtx_);
    // Wait for the notifications as well, so no callback runs after Run returns
    session->done_condition_.wait(
        lock, [&session] { return session->notified_ == session->progress_.total_; });
    summary.total_     = session->progress_.total_;
    summary.succeeded_ = session->progress_.succeeded_;
    summary.failed_    = session->progress_.failed_;
    summary.results_   = std::move(session->results_);
  }
  summary.elapsed_ = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  return summary;
}

void ExportService::RunAsync(std::vector<RenderJob> jobs, ProgressCallback progress,
                             DoneCallback done) {
  coordinator_pool_.Submit([this, jobs = std::move(jobs), progress = std::move(progress),
                            done = std::move(done)]() mutable {
    ExportSummary summary = Run(std::move(jobs), std::move(progress));
    if (!done) return;
    try {
      done(summary);
    } catch (const std::exception& e) {
      CV_LOG_WARNING(NULL, "[ExportService] Completion callback threw: " << e.what());
    } catch (...) {
      CV_LOG_WARNING(NULL, "[ExportService] Completion callback threw an unknown exception");
    }
  });
}
};  // namespace photograph
