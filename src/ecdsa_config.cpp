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

#include <algorithm>
#include <limits>

#include <builtins/ecdsa_config.hpp>

using json = nlohmann::json;

namespace cairo::vm {

namespace {

u64 get_count(const json& j, const char *key) {
    const auto& v = j.at(key);
    if (!v.is_number_unsigned()) {
        throw vm_error(error_kind::config,
                       std::string("\"") + key + "\" must be a non-negative integer, got "
                       + v.dump());
    }
    return v.template get<u64>();
}

}  // namespace

u64 ecdsa_config::step_count() const {
    if (steps) {
        return *steps;
    }

    const u64 n = std::max<u64>(instances.size(), 1) * params::ecdsa_instances_per_component;
    if (ratio != 0 && n > std::numeric_limits<u64>::max() / ratio) {
        throw vm_error(error_kind::config,
                       "default step count overflows for ratio " + std::to_string(ratio)
                       + " and " + std::to_string(n) + " instances");
    }
    return ratio * n;
}

ecdsa_config ecdsa_config::from_json(const json& j) {
    ecdsa_config config;

    try {
        if (!j.is_object()) {
            throw vm_error(error_kind::config, "configuration must be a JSON object");
        }

        if (j.contains("ratio")) {
            config.ratio = get_count(j, "ratio");
        }

        if (j.contains("steps")) {
            config.steps = get_count(j, "steps");
        }

        if (j.contains("max-instances")) {
            config.max_instances = get_count(j, "max-instances");
        }

        if (j.contains("log-level")) {
            auto name = j.at("log-level").template get<std::string>();
            auto level = parse_log_level(name);
            if (!level) {
                throw vm_error(error_kind::config, "unknown log level \"" + name + "\"");
            }
            config.level = *level;
        }

        if (j.contains("instances")) {
            for (const auto& inst : j.at("instances")) {
                ecdsa_instance_config ic;
                ic.pubkey = inst.at("pubkey").template get<std::string>();
                ic.msg    = inst.at("msg").template get<std::string>();
                ic.r      = inst.at("r").template get<std::string>();
                ic.s      = inst.at("s").template get<std::string>();

                if (inst.contains("write-order")) {
                    auto order = inst.at("write-order").template get<std::string>();
                    if (order == "pubkey-first") {
                        ic.order = write_order::pubkey_first;
                    }
                    else if (order == "msg-first") {
                        ic.order = write_order::msg_first;
                    }
                    else {
                        throw vm_error(error_kind::config,
                                       "invalid write-order \"" + order + "\"");
                    }
                }
                config.instances.push_back(std::move(ic));
            }
        }
    }
    catch (const json::exception& e) {
        throw vm_error(error_kind::config, e.what());
    }

    return config;
}

}  // namespace cairo::vm
