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

#include <bit>
#include <string>

#include <builtins/allocation.hpp>

namespace cairo::vm {

namespace {

u64 div_ceil(u64 a, u64 b) {
    return a / b + (a % b != 0);
}

}  // namespace

u64 ratio_allocation_policy::allocated_size(u64 used,
                                            u64 vm_step_count,
                                            const allocation_params& p) const
{
    if (p.cells_per_instance == 0 || p.instances_per_component == 0) {
        throw vm_error(error_kind::sizing, "builtin layout has no cells per instance");
    }
    if (p.input_cells_per_instance > p.cells_per_instance) {
        throw vm_error(error_kind::sizing,
                       "input cells (" + std::to_string(p.input_cells_per_instance)
                       + ") exceed cells per instance ("
                       + std::to_string(p.cells_per_instance) + ")");
    }

    // Dynamic layout: exactly the instances needed, in power of two components
    if (p.ratio == 0) {
        const u64 instances  = div_ceil(used, p.cells_per_instance);
        const u64 components = div_ceil(instances, p.instances_per_component);
        if (components == 0) {
            return 0;
        }
        return p.cells_per_instance * p.instances_per_component * std::bit_ceil(components);
    }

    const u64 min_steps = p.ratio * p.instances_per_component;
    if (vm_step_count < min_steps) {
        throw vm_error(error_kind::sizing,
                       "number of steps must be at least " + std::to_string(min_steps)
                       + ", got " + std::to_string(vm_step_count));
    }

    const u64 size = (vm_step_count / p.ratio) * p.cells_per_instance;
    if (used > size) {
        throw vm_error(error_kind::sizing,
                       "used cells (" + std::to_string(used)
                       + ") exceed the allocated size (" + std::to_string(size) + ")");
    }
    return size;
}

std::shared_ptr<const allocation_policy> default_allocation_policy() {
    static const auto policy = std::make_shared<ratio_allocation_policy>();
    return policy;
}

}  // namespace cairo::vm
