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

#include <string>

#include <builtins/builtin_runner.hpp>
#include <memory/segment.hpp>

namespace cairo::vm {

const memory_segment::felt_type* memory_segment::peek(address_t offset) const noexcept {
    if (offset >= cells_.size() || !cells_[offset]) {
        return nullptr;
    }
    return &*cells_[offset];
}

const memory_segment::felt_type& memory_segment::read(address_t offset) const {
    if (const felt_type *v = peek(offset)) {
        return *v;
    }
    throw vm_error(error_kind::unknown_cell,
                   "reading unknown cell at offset " + std::to_string(offset));
}

std::optional<check_result> memory_segment::write(address_t offset, const felt_type& value) {
    if (offset >= cells_.size()) {
        cells_.resize(offset + 1);
    }

    auto& cell = cells_[offset];
    if (cell && !(*cell == value)) {
        throw vm_error(error_kind::write_conflict,
                       "rewriting cell at offset " + std::to_string(offset)
                       + ": " + cell->to_hex() + " != " + value.to_hex());
    }
    cell = value;

    // Rewrites of the same value are checked again
    if (builtin_) {
        return builtin_->check_write(*this, offset, value);
    }
    return std::nullopt;
}

address_t memory_segment::used_size() const noexcept {
    for (size_t i = cells_.size(); i > 0; i--) {
        if (cells_[i - 1]) {
            return i;
        }
    }
    return 0;
}

}  // namespace cairo::vm
