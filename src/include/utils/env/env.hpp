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

namespace photograph {
namespace Env {
/**
 * @brief Read a process environment variable.
 *
 * @param name variable name
 * @return its value, or nullopt when unset
 */
auto Get(const char* name) -> std::optional<std::string>;

auto Trim(std::string_view raw) -> std::string;
auto ToLower(std::string_view raw) -> std::string;

/**
 * @brief Accepts "1", "true", "yes" and "on", ignoring case and surrounding whitespace.
 */
auto IsTruthy(std::string_view raw) -> bool;
};  // namespace Env
};  // namespace photograph
