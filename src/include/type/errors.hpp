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

#include <stdexcept>
#include <string>

namespace photograph {
/**
 * @brief GPU context creation failed, or the adapter did not pass the acceptance rule.
 */
class InitError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief The GPU backend declined one specific render (texture limit, device loss).
 */
class BackendRefusal : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief A render needed a backend that the current policy does not permit.
 */
class PolicyViolation : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief Malformed edit operation parameters.
 */
class OperationError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class DecodeError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class EncodeError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};
};  // namespace photograph
