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

#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace photograph {

// Path of a source or rendered image on disk
#define image_path_t    std::filesystem::path

// Issued by a preview session on every edit-state change
#define generation_t    uint64_t

// Version counter carried by an edit state snapshot
#define state_version_t uint64_t

// Position of a job inside one export batch
#define job_index_t     size_t

// 64-bit content signature (XXH3)
#define p_hash_t        uint64_t

};  // namespace photograph
