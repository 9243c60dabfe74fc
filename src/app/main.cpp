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

#include <fstream>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "app/app_config.hpp"
#include "app/export_service.hpp"
#include "edit/pipeline/gpu_context.hpp"
#include "edit/pipeline/pipeline_cpu.hpp"
#include "edit/pipeline/pipeline_gpu.hpp"
#include "edit/state/edit_sidecar.hpp"
#include "io/image/image_loader.hpp"
#include "io/image/image_writer.hpp"
#include "parity/parity_harness.hpp"
#include "renderer/backend_policy.hpp"
#include "renderer/render_router.hpp"
#include "type/errors.hpp"
#include "type/supported_file_type.hpp"
#include "utils/env/env.hpp"
#include "utils/profiler/profiler.hpp"

using namespace photograph;

namespace {
constexpr int kExitOk      = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage   = 2;

void          PrintUsage() {
  std::cerr << "usage: photograph <command> [args]\n"
               "  status\n"
               "  render <input> <output> [--state <json>]\n"
               "  export [--out <dir>] <inputs...> [--format jpg|png|webp] [--quality N]\n"
               "         [--lossless] [--long-edge N] [--profile quality|balanced|speed]\n"
               "         (--out defaults to export_dir from the config file)\n"
               "  parity\n";
}

struct Startup {
  AppConfig                         config_;
  Environment                       env_;
  BackendChoice                     choice_;
  std::shared_ptr<GpuContext>       context_;
  std::shared_ptr<const RenderRouter> router_;
};

/**
 * @brief Resolve the backend policy. Exits with kPolicyExitCode after printing the reason when
 * no backend may run.
 */
auto PrepareStartup(bool print_status) -> Startup {
  Startup startup;
  startup.config_       = AppConfig::Load();
  startup.env_          = Environment::FromProcess();

  auto&         runtime = GpuRuntime::Instance();
  BackendPolicy policy  = BackendPolicy::FromEnvironment(runtime.Status(), startup.env_);
  startup.choice_       = policy.EffectiveBackend(startup.config_, startup.env_);

  if (print_status) {
    std::cout << StatusSummary(runtime.Status()) << "\n"
              << "requested backend: " << BackendModeName(startup.choice_.requested_) << "\n"
              << "effective backend: "
              << (startup.choice_.permitted_ ? BackendName(startup.choice_.backend_) : "none")
              << " (" << startup.choice_.reason_ << ")\n"
              << "debug cpu fallback: "
              << (policy.DebugCpuFallbackAllowed() ? "enabled" : "disabled") << std::endl;
  }

  startup.context_ = runtime.Context();
  startup.router_  = EnforceStartupPolicy(
      policy, startup.choice_, std::make_shared<GPUPipelineExecutor>(startup.context_));
  return startup;
}

auto ParseInt(std::string_view raw) -> std::optional<int> {
  try {
    size_t     consumed = 0;
    const int  value    = std::stoi(std::string(raw), &consumed);
    if (consumed != raw.size()) return std::nullopt;
    return value;
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

auto LoadStateFile(const image_path_t& path) -> EditState {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw std::runtime_error("cannot open state file " + path.string());
  }
  try {
    return EditState::FromJson(nlohmann::json::parse(in));
  } catch (const nlohmann::json::exception& e) {
    throw OperationError(std::string("malformed state file: ") + e.what());
  }
}

auto RunStatus() -> int {
  PrepareStartup(true);
  return kExitOk;
}

auto RunRender(const std::vector<std::string>& args) -> int {
  std::vector<std::string>    positional;
  std::optional<image_path_t> state_path;
  for (size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--state" && i + 1 < args.size()) {
      state_path = args[++i];
    } else {
      positional.push_back(args[i]);
    }
  }
  if (positional.size() != 2) {
    PrintUsage();
    return kExitUsage;
  }

  const Startup startup = PrepareStartup(false);

  const image_path_t input  = positional[0];
  const image_path_t output = positional[1];
  try {
    EditState state =
        state_path ? LoadStateFile(*state_path) : EditSidecar::Load(input).value_or(EditState{});
    ImageBuffer  source   = ImageLoader::Load(input);
    RenderOutput rendered = startup.router_->Render(source, state);

    std::string  ext      = output.extension().string();
    if (!ext.empty()) ext.erase(0, 1);
    ExportFormatOptions options;
    options.format_ = ParseImageFormat(ext).value_or(ImageFormatType::JPEG);
    ImageWriter::WriteImageToPath(rendered.image_, output, options);
    std::cout << output.string() << " (" << BackendName(rendered.backend_) << ")" << std::endl;
  } catch (const PolicyViolation& e) {
    std::cerr << e.what() << std::endl;
    return kPolicyExitCode;
  } catch (const std::exception& e) {
    std::cerr << "photograph: " << e.what() << std::endl;
    return kExitFailure;
  }
  return kExitOk;
}

auto RunExport(const std::vector<std::string>& args) -> int {
  std::vector<std::string> positional;
  ImageFormatType          format  = ImageFormatType::JPEG;
  RenderSpeedProfile       profile = RenderSpeedProfile::BALANCED;
  std::optional<int>       quality;
  std::optional<int>       long_edge;
  bool                     lossless = false;
  std::optional<image_path_t> out_dir;
  for (size_t i = 0; i < args.size(); ++i) {
    const bool has_value = i + 1 < args.size();
    if (args[i] == "--out" && has_value) {
      out_dir = args[++i];
    } else if (args[i] == "--format" && has_value) {
      auto parsed = ParseImageFormat(args[++i]);
      if (!parsed) {
        std::cerr << "photograph: unknown format " << args[i] << std::endl;
        return kExitUsage;
      }
      format = *parsed;
    } else if (args[i] == "--quality" && has_value) {
      quality = ParseInt(args[++i]);
      if (!quality) {
        PrintUsage();
        return kExitUsage;
      }
    } else if (args[i] == "--lossless") {
      lossless = true;
    } else if (args[i] == "--long-edge" && has_value) {
      long_edge = ParseInt(args[++i]);
      if (!long_edge) {
        PrintUsage();
        return kExitUsage;
      }
    } else if (args[i] == "--profile" && has_value) {
      const std::string& name = args[++i];
      if (name == "quality") {
        profile = RenderSpeedProfile::QUALITY;
      } else if (name == "balanced") {
        profile = RenderSpeedProfile::BALANCED;
      } else if (name == "speed") {
        profile = RenderSpeedProfile::SPEED;
      } else {
        PrintUsage();
        return kExitUsage;
      }
    } else {
      positional.push_back(args[i]);
    }
  }
  if (positional.empty()) {
    PrintUsage();
    return kExitUsage;
  }

  const Startup startup    = PrepareStartup(false);
  const auto    output_dir = startup.config_.ExportDirectory(out_dir);
  if (!output_dir) {
    std::cerr << "photograph: no output directory; pass --out or set export_dir in "
              << AppConfig::DefaultPath().value_or("the config file").string() << std::endl;
    return kExitUsage;
  }

  ExportFormatOptions options = ExportFormatOptions::FromProfile(format, profile);
  if (quality) options.quality_ = *quality;
  options.lossless_ = lossless;
  if (long_edge) {
    options.resize_enabled_  = true;
    options.max_length_side_ = *long_edge;
  }

  std::vector<ExportTask> tasks;
  for (const auto& arg : positional) {
    const image_path_t source = arg;
    tasks.push_back(ExportTask{source, EditSidecar::Load(source).value_or(EditState{})});
  }

  ExportService service(startup.router_);
  auto          summary = service.Run(
      BuildRenderJobs(tasks, *output_dir, options), [](const ExportProgress& progress) {
        std::cout << "[" << progress.completed_ << "/" << progress.total_ << "] "
                  << progress.succeeded_ << " ok, " << progress.failed_ << " failed"
                  << std::endl;
      });

  for (const auto& result : summary.results_) {
    if (result.success_) {
      std::cout << "  ok     " << result.output_path_.string() << std::endl;
    } else {
      std::cout << "  failed " << result.source_path_.string() << " ("
                << ExportErrorKindName(result.error_kind_) << "): " << result.message_
                << std::endl;
    }
  }
  std::cout << "exported " << summary.succeeded_ << "/" << summary.total_ << " in "
            << summary.elapsed_.count() << " ms" << std::endl;
  return summary.failed_ == 0 ? kExitOk : kExitFailure;
}

auto RunParity() -> int {
  const Startup startup = PrepareStartup(false);
  if (!startup.context_) {
    std::cerr << "photograph: parity needs a GPU, "
              << StatusSummary(GpuRuntime::Instance().Status()) << std::endl;
    return kExitFailure;
  }

  GPUPipelineExecutor gpu(startup.context_);
  CPUPipelineExecutor cpu;
  const auto          results = Parity::RunParitySuite(gpu, cpu, Parity::StandardParityCases());
  size_t              failed  = 0;
  for (const auto& result : results) {
    const bool passed = result.rendered_ && result.report_.passed_;
    if (!passed) ++failed;
    std::cout << (passed ? "PASS " : "FAIL ") << result.name_ << ": " << result.report_.message_
              << std::endl;
  }
  std::cout << results.size() - failed << "/" << results.size() << " parity cases passed"
            << std::endl;
  return failed == 0 ? kExitOk : kExitFailure;
}
}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    PrintUsage();
    return kExitUsage;
  }
  const std::string        command = argv[1];
  std::vector<std::string> args(argv + 2, argv + argc);

  const auto               profile_dump = Env::Get("PHOTOGRAPH_PROFILE_DUMP");
  if (profile_dump) {
    Profiler::Enable();
  }

  int                      status  = kExitUsage;
  if (command == "status") {
    status = RunStatus();
  } else if (command == "render") {
    status = RunRender(args);
  } else if (command == "export") {
    status = RunExport(args);
  } else if (command == "parity") {
    status = RunParity();
  } else {
    PrintUsage();
  }

  if (profile_dump) {
    Profiler::DumpTo(*profile_dump);
  }
  return status;
}
