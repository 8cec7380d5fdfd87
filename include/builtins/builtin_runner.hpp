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

#include <string_view>

#include <types.hpp>
#include <zkp/finite_field_gmp.hpp>

namespace cairo::vm {

struct memory_segment;

/************************************************************
 * Interface every builtin exposes to the VM.
 *
 * The VM calls `check_write` after a value lands in the
 * builtin's segment, `allocated_size` from the segment
 * finalization pass, and `set_stop_pointer` once execution
 * halted.
 ************************************************************/
struct builtin_runner {
    using felt_type = zkp::stark252_gmp;

    virtual ~builtin_runner() = default;

    virtual std::string_view name() const = 0;

    virtual check_result check_write(const memory_segment& segment,
                                      address_t offset,
                                      const felt_type& value) = 0;

    /** Deduce the value of an output cell, throws vm_error on failure */
    virtual felt_type infer_value(const memory_segment& segment, address_t offset) = 0;

    virtual u64 allocated_size(u64 used, u64 vm_step_count) const = 0;
    virtual u64 cells_per_instance() const = 0;

    u64  stop_pointer() const noexcept { return stop_pointer_; }
    void set_stop_pointer(u64 ptr) noexcept { stop_pointer_ = ptr; }

protected:
    u64 stop_pointer_ = 0;
};

}  // namespace cairo::vm
