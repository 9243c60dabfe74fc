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

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "concurrency/thread_pool.hpp"
#include "edit/state/edit_state.hpp"
#include "image/image_buffer.hpp"
#include "renderer/render_router.hpp"
#include "type/supported_file_type.hpp"
#include "type/type.hpp"

namespace photograph {
struct ExportTask {
  image_path_t source_path_;
  EditState    state_;
};

struct RenderJob {
  job_index_t         index_ = 0;
  image_path_t        source_path_;
  EditState           state_;
  image_path_t        output_path_;
  ExportFormatOptions options_;
};

enum class ExportErrorKind { NONE, DECODE, RENDER, ENCODE, IO, INVALID_STATE };

auto ExportErrorKindName(ExportErrorKind kind) -> std::string_view;

struct ExportResult {
  job_index_t                    index_      = 0;
  image_path_t                   source_path_;
  image_path_t                   output_path_;
  bool                           success_    = false;
  ExportErrorKind                error_kind_ = ExportErrorKind::NONE;
  std::string                    message_;
  std::optional<PipelineBackend> backend_;
};

struct ExportProgress {
  size_t completed_ = 0;
  size_t total_     = 0;
  size_t succeeded_ = 0;
  size_t failed_    = 0;
};

struct ExportSummary {
  size_t                    total_     = 0;
  size_t                    succeeded_ = 0;
  size_t                    failed_    = 0;
  // One entry per submitted job, ordered by job index
  std::vector<ExportResult> results_;
  std::chrono::milliseconds elapsed_{0};

  auto                      FirstError() const -> const ExportResult*;
};

/**
 * @brief Turn export tasks into jobs with unique output paths inside `output_dir`. A name is
 * never reused if it exists on disk or was already given to an earlier task of the batch.
 */
auto BuildRenderJobs(const std::vector<ExportTask>& tasks, const image_path_t& output_dir,
                     const ExportFormatOptions& options) -> std::vector<RenderJob>;

/**
 * @brief Renders batches of jobs on a bounded worker pool. One job's failure never affects its
 * siblings; every job ends with exactly one result.
 */
class ExportService {
 public:
  using DecodeFn         = std::function<ImageBuffer(const image_path_t&)>;
  using EncodeFn         = std::function<void(const ImageBuffer&, const image_path_t&,
                                      const ExportFormatOptions&)>;
  using ProgressCallback = std::function<void(const ExportProgress&)>;
  using DoneCallback     = std::function<void(const ExportSummary&)>;

  explicit ExportService(std::shared_ptr<const RenderRouter> router,
                         size_t worker_count = ThreadPool::DefaultThreadCount());

  ExportService(const ExportService&)            = delete;
  ExportService& operator=(const ExportService&) = delete;

  void SetDecoder(DecodeFn decoder) { decode_ = std::move(decoder); }
  void SetEncoder(EncodeFn encoder) { encode_ = std::move(encoder); }

  /**
   * @brief Render every job and block until all have finished. Progress is reported from worker
   * threads outside the session lock, one call at a time, with a strictly increasing completed
   * count; a snapshot overtaken by a newer one is skipped. The final count is always reported.
   */
  auto Run(std::vector<RenderJob> jobs, ProgressCallback progress = {}) -> ExportSummary;

  /**
   * @brief Run on a background coordinator and hand the summary to `done`.
   */
  void RunAsync(std::vector<RenderJob> jobs, ProgressCallback progress, DoneCallback done);

  void WaitAsync() { coordinator_pool_.WaitIdle(); }

  auto WorkerCount() const -> size_t { return export_thread_pool_.ThreadCount(); }

 private:
  std::shared_ptr<const RenderRouter> router_;
  DecodeFn                            decode_;
  EncodeFn                            encode_;

  ThreadPool                          export_thread_pool_;
  // Destroyed first: a running async session still needs the export pool
  ThreadPool                          coordinator_pool_{1};

  auto                                RunExportRenderTask(const RenderJob& job) const -> ExportResult;
};
};  // namespace photograph
