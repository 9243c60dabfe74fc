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

#include "utils/env/env.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace photograph {
namespace Env {
auto Get(const char* name) -> std::optional<std::string> {
  const char* value = std::getenv(name);
  if (value == nullptr) {
    return std::nullopt;
  }
  return std::string(value);
}

auto Trim(std::string_view raw) -> std::string {
  const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  size_t     begin    = 0;
  size_t     end      = raw.size();
  while (begin < end && is_space(static_cast<unsigned char>(raw[begin]))) ++begin;
  while (end > begin && is_space(static_cast<unsigned char>(raw[end - 1]))) --end;
  return std::string(raw.substr(begin, end - begin));
}

auto ToLower(std::string_view raw) -> std::string {
  std::string out(raw);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

auto IsTruthy(std::string_view raw) -> bool {
  const auto value = ToLower(Trim(raw));
  return value == "1" || value == "true" || value == "yes" || value == "on";
}
};  // namespace Env
};  // namespace photograph
