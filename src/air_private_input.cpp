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

#include <builtins/air_private_input.hpp>
#include <params.hpp>

using json = nlohmann::json;

namespace cairo::vm {

void to_json(json& j, const air_private_ecdsa_signature_input& in) {
    j = json{ { "r", in.r }, { "w", in.w } };
}

void from_json(const json& j, air_private_ecdsa_signature_input& in) {
    j.at("r").get_to(in.r);
    j.at("w").get_to(in.w);
}

void to_json(json& j, const air_private_ecdsa& rec) {
    j = json{
        { "index",           rec.index           },
        { "pubkey",          rec.pubkey          },
        { "msg",             rec.msg             },
        { "signature_input", rec.signature_input },
    };
}

void from_json(const json& j, air_private_ecdsa& rec) {
    j.at("index").get_to(rec.index);
    j.at("pubkey").get_to(rec.pubkey);
    j.at("msg").get_to(rec.msg);
    j.at("signature_input").get_to(rec.signature_input);
}

json make_air_private_input(std::vector<air_private_ecdsa> records) {
    std::sort(records.begin(), records.end(),
              [](const auto& a, const auto& b) { return a.index < b.index; });

    json j = json::object();
    j[params::ecdsa_builtin_name] = records;
    return j;
}

}  // namespace cairo::vm
