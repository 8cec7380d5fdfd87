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

#include <memory>
#include <types.hpp>

namespace cairo::vm {

struct allocation_params {
    u64 ratio;                     // VM steps per instance, 0 for the dynamic layout
    u64 input_cells_per_instance;
    u64 instances_per_component;
    u64 cells_per_instance;
};

/************************************************************
 * Number of cells a builtin segment is grown to before the
 * trace is handed to the prover.
 ************************************************************/
struct allocation_policy {
    virtual ~allocation_policy() = default;

    /**
     * @param used           Used size of the builtin segment
     * @param vm_step_count  Steps executed so far
     * @return  The allocated size, never less than `used`
     */
    virtual u64 allocated_size(u64 used,
                               u64 vm_step_count,
                               const allocation_params& p) const = 0;
};

/************************************************************
 * Ratio based sizing shared by all builtins.
 *
 * With a ratio, one instance is allocated every `ratio` steps.
 * Without one (dynamic layout), the used instances are rounded
 * up to a power of two components.
 ************************************************************/
struct ratio_allocation_policy : public allocation_policy {
    u64 allocated_size(u64 used,
                       u64 vm_step_count,
                       const allocation_params& p) const override;
};

std::shared_ptr<const allocation_policy> default_allocation_policy();

}  // namespace cairo::vm
