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

#include <optional>
#include <vector>

#include <types.hpp>
#include <zkp/finite_field_gmp.hpp>

namespace cairo::vm {

struct builtin_runner;

// Memory Segment
/* ------------------------------------------------------------ */
struct memory_segment {
    using felt_type = zkp::stark252_gmp;

    memory_segment() = default;
    explicit memory_segment(size_t length) : cells_(length) { }

    /** Non-forcing lookup, nullptr if the cell is unknown or out of range */
    const felt_type* peek(address_t offset) const noexcept;

    /** Forcing lookup, throws vm_error(unknown_cell) if the cell is unknown */
    const felt_type& read(address_t offset) const;

    /**
     * Commit `value` to a cell. Cells are write-once: rewriting the same
     * value is accepted, a different value throws vm_error(write_conflict).
     * The attached builtin, if any, checks every accepted write (rewrites
     * included) and its errors propagate to the caller.
     */
    std::optional<check_result> write(address_t offset, const felt_type& value);

    size_t    length()    const noexcept { return cells_.size(); }
    address_t used_size() const noexcept;

    memory_segment& with_builtin_runner(builtin_runner *runner) noexcept {
        builtin_ = runner;
        return *this;
    }

    builtin_runner* builtin() const noexcept { return builtin_; }

protected:
    std::vector<std::optional<felt_type>> cells_;
    builtin_runner *builtin_ = nullptr;
};

}  // namespace cairo::vm
