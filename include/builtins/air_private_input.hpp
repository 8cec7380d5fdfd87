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

#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <types.hpp>

namespace cairo::vm {

// AIR private input of the ECDSA builtin
/* ------------------------------------------------------------ */
struct air_private_ecdsa_signature_input {
    std::string r;
    std::string w;   // s^-1 modulo the curve order

    bool operator==(const air_private_ecdsa_signature_input&) const = default;
};

struct air_private_ecdsa {
    u64 index = 0;
    std::string pubkey;
    std::string msg;
    air_private_ecdsa_signature_input signature_input;

    bool operator==(const air_private_ecdsa&) const = default;
};

void to_json(nlohmann::json& j, const air_private_ecdsa_signature_input& in);
void from_json(const nlohmann::json& j, air_private_ecdsa_signature_input& in);
void to_json(nlohmann::json& j, const air_private_ecdsa& rec);
void from_json(const nlohmann::json& j, air_private_ecdsa& rec);

/** `{"ecdsa": [...]}` with records sorted by index */
nlohmann::json make_air_private_input(std::vector<air_private_ecdsa> records);

}  // namespace cairo::vm
