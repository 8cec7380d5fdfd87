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

#include <cstdint>
#include <stdexcept>
#include <string>

namespace cairo {

// Numeric Types
/* ------------------------------------------------------------ */
using u8  = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

/** Offset of a cell relative to the start of its segment */
using address_t = u64;

// Errors
/* ------------------------------------------------------------ */
enum class error_kind : uint8_t {
    invalid_public_key,
    key_not_on_curve,
    missing_signature,
    invalid_signature,
    encoding,
    unknown_cell,
    write_conflict,
    sizing,
    cannot_infer,
    config,
};

inline std::string to_string(error_kind k) {
    switch (k) {
    case error_kind::invalid_public_key: return "invalid_public_key";
    case error_kind::key_not_on_curve:   return "key_not_on_curve";
    case error_kind::missing_signature:  return "missing_signature";
    case error_kind::invalid_signature:  return "invalid_signature";
    case error_kind::encoding:           return "encoding";
    case error_kind::unknown_cell:       return "unknown_cell";
    case error_kind::write_conflict:     return "write_conflict";
    case error_kind::sizing:             return "sizing";
    case error_kind::cannot_infer:       return "cannot_infer";
    case error_kind::config:             return "config";
    default:
        return "<error>";
    }
}

struct vm_error : std::runtime_error {
    vm_error(error_kind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) { }

    error_kind kind() const noexcept { return kind_; }

private:
    error_kind kind_;
};

// Outcome of a checked write that did not fail
/* ------------------------------------------------------------ */
enum class check_result : uint8_t {
    awaiting_operands,  // the instance still has unknown cells
    verified,
};

}  // namespace cairo
