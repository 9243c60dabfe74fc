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

#include <optional>
#include <string>
#include <string_view>

#include "app/app_config.hpp"
#include "edit/pipeline/gpu_context.hpp"
#include "edit/pipeline/pipeline.hpp"

namespace photograph {
// Documented exit status when the backend policy cannot be satisfied (EX_CONFIG)
inline constexpr int         kPolicyExitCode      = 78;

inline constexpr const char* kDebugCpuFallbackEnv = "PHOTOGRAPH_DEBUG_ALLOW_CPU_FALLBACK";
inline constexpr const char* kPreviewBackendEnv   = "PHOTOGRAPH_PREVIEW_BACKEND";

enum class BackendMode { AUTO, GPU, CPU };

/**
 * @brief Parse "auto", "gpu" (or "cuda", "gpu_pipeline") and "cpu", ignoring case and
 * surrounding whitespace.
 */
auto ParseBackendMode(std::string_view raw) -> std::optional<BackendMode>;
auto BackendModeName(BackendMode mode) -> std::string_view;

/**
 * @brief Process-level overrides, read once from the environment.
 */
struct Environment {
  std::optional<std::string> backend_override_;
  bool                       debug_allow_cpu_fallback_ = false;

  static auto                FromProcess() -> Environment;
};

struct BackendChoice {
  BackendMode     requested_            = BackendMode::AUTO;
  // Backend tried first
  PipelineBackend backend_              = PipelineBackend::CUDA;
  // False when no backend may run under the current policy
  bool            permitted_            = false;
  // The CPU pipeline may substitute for a missing or refusing GPU
  bool            cpu_fallback_allowed_ = false;
  std::string     reason_;
};

struct StartupCheck {
  bool        ok_        = false;
  int         exit_code_ = 0;
  std::string message_;
};

/**
 * @brief The single authority on which backend may execute. Holds only the cached GPU
 * availability and the debug flag, both fixed at construction.
 */
class BackendPolicy {
 private:
  bool gpu_available_;
  bool debug_cpu_fallback_;

 public:
  BackendPolicy(bool gpu_available, bool debug_cpu_fallback)
      : gpu_available_(gpu_available), debug_cpu_fallback_(debug_cpu_fallback) {}

  static auto FromEnvironment(const RuntimeStatus& status, const Environment& env)
      -> BackendPolicy {
    return BackendPolicy(status.available_, env.debug_allow_cpu_fallback_);
  }

  auto GpuAvailable() const -> bool { return gpu_available_; }
  auto DebugCpuFallbackAllowed() const -> bool { return debug_cpu_fallback_; }

  /**
   * @brief Requested mode: the environment override wins over the config, and AUTO applies when
   * neither names a recognized mode.
   */
  auto RequestedMode(const AppConfig& config, const Environment& env) const -> BackendMode;

  auto EffectiveBackend(const AppConfig& config, const Environment& env) const -> BackendChoice;

  auto Resolve(BackendMode mode) const -> BackendChoice;

  /**
   * @brief Fail-fast gate run before any rendering.
   *
   * @return ok, or the exit status and message the process must terminate with
   */
  auto CheckStartup(const BackendChoice& choice) const -> StartupCheck;
};
};  // namespace photograph
