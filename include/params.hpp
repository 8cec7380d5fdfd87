/*
 * Copyright (C) 2023-2025 Ligero, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace cairo::vm::params {

constexpr auto   ecdsa_builtin_name             = "ecdsa";
constexpr size_t ecdsa_cells_per_instance       = 2;
constexpr size_t ecdsa_input_cells_per_instance = 2;
constexpr size_t ecdsa_instances_per_component  = 1;

// Steps per instance used by the `small` and `dex` layouts
constexpr uint64_t default_ecdsa_ratio = 512;

// Bound on signature registrations when none is configured
constexpr uint64_t max_ecdsa_instances = uint64_t(1) << 20;

constexpr size_t felt_bytes      = 32;
constexpr size_t signature_bytes = 2 * felt_bytes;

// Leading bits of the message hash the verifier keeps
constexpr size_t scalar_bits = 252;

}  // namespace cairo::vm::params
