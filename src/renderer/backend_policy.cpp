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

#include "renderer/backend_policy.hpp"

#include <opencv2/core/utils/logger.hpp>

#include "utils/env/env.hpp"

namespace photograph {
auto ParseBackendMode(std::string_view raw) -> std::optional<BackendMode> {
  const std::string value = Env::ToLower(Env::Trim(raw));
  if (value == "auto") return BackendMode::AUTO;
  if (value == "gpu" || value == "cuda" || value == "gpu_pipeline") return BackendMode::GPU;
  if (value == "cpu") return BackendMode::CPU;
  return std::nullopt;
}

auto BackendModeName(BackendMode mode) -> std::string_view {
  switch (mode) {
    case BackendMode::AUTO:
      return "auto";
    case BackendMode::GPU:
      return "gpu";
    case BackendMode::CPU:
      return "cpu";
  }
  return "auto";
}

auto Environment::FromProcess() -> Environment {
  Environment env;
  env.backend_override_ = Env::Get(kPreviewBackendEnv);
  if (auto flag = Env::Get(kDebugCpuFallbackEnv)) {
    env.debug_allow_cpu_fallback_ = Env::IsTruthy(*flag);
  }
  return env;
}

auto BackendPolicy::RequestedMode(const AppConfig& config, const Environment& env) const
    -> BackendMode {
  if (env.backend_override_) {
    if (auto mode = ParseBackendMode(*env.backend_override_)) return *mode;
    CV_LOG_WARNING(NULL, "[BackendPolicy] Ignoring unknown " << kPreviewBackendEnv << " value '"
                                                             << *env.backend_override_ << "'");
  }
  if (config.preview_backend_) {
    if (auto mode = ParseBackendMode(*config.preview_backend_)) return *mode;
    CV_LOG_WARNING(NULL, "[BackendPolicy] Ignoring unknown preview_backend '"
                             << *config.preview_backend_ << "'");
  }
  return BackendMode::AUTO;
}

auto BackendPolicy::EffectiveBackend(const AppConfig& config, const Environment& env) const
    -> BackendChoice {
  return Resolve(RequestedMode(config, env));
}

auto BackendPolicy::Resolve(BackendMode mode) const -> BackendChoice {
  BackendChoice choice;
  choice.requested_            = mode;
  choice.cpu_fallback_allowed_ = debug_cpu_fallback_;

  if (mode == BackendMode::CPU) {
    choice.backend_   = PipelineBackend::CPU;
    choice.permitted_ = debug_cpu_fallback_;
    choice.reason_    = debug_cpu_fallback_
                            ? "cpu backend requested with debug fallback enabled"
                            : std::string("cpu backend requires ") + kDebugCpuFallbackEnv + "=1";
    return choice;
  }

  if (gpu_available_) {
    choice.backend_   = PipelineBackend::CUDA;
    choice.permitted_ = true;
    choice.reason_    = "gpu available";
    return choice;
  }

  choice.backend_   = PipelineBackend::CPU;
  choice.permitted_ = debug_cpu_fallback_;
  choice.reason_    = debug_cpu_fallback_
                          ? "gpu unavailable, debug cpu fallback enabled"
                          : std::string("gpu unavailable and ") + kDebugCpuFallbackEnv +
                                " is not set";
  return choice;
}

auto BackendPolicy::CheckStartup(const BackendChoice& choice) const -> StartupCheck {
  if (choice.permitted_) {
    return StartupCheck{.ok_ = true, .exit_code_ = 0, .message_ = choice.reason_};
  }
  return StartupCheck{.ok_        = false,
                      .exit_code_ = kPolicyExitCode,
                      .message_   = "photograph: backend policy cannot be satisfied (" +
                                  std::string(BackendModeName(choice.requested_)) +
                                  "): " + choice.reason_};
}
};  // namespace photograph
