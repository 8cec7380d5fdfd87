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
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <params.hpp>
#include <types.hpp>
#include <util/log.hpp>

namespace cairo::vm {

enum class write_order : uint8_t {
    pubkey_first,
    msg_first,
};

struct ecdsa_instance_config {
    std::string pubkey;
    std::string msg;
    std::string r;
    std::string s;
    write_order order = write_order::pubkey_first;
};

/************************************************************
 * Run description for the ECDSA runner.
 *
 * Example:
 *     { "ratio": 512, "steps": 4096, "log-level": "info",
 *       "instances": [ { "pubkey": "0x..", "msg": "0x..",
 *                        "r": "0x..", "s": "0x..",
 *                        "write-order": "msg-first" } ] }
 ************************************************************/
struct ecdsa_config {
    u64 ratio = params::default_ecdsa_ratio;
    std::optional<u64> steps;
    std::optional<u64> max_instances;
    log_level level = log_level::info_only;
    std::vector<ecdsa_instance_config> instances;

    /** Steps to size the segment with, at least one component when unset.
     *  Throws vm_error(config) if the default does not fit in 64 bits. */
    u64 step_count() const;

    /** Throws vm_error(config) on a malformed document */
    static ecdsa_config from_json(const nlohmann::json& j);
};

}  // namespace cairo::vm
