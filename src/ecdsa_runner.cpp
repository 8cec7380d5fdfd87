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

#include <cstdlib>
#include <iostream>
#include <string_view>

#include <builtins/ecdsa.hpp>
#include <builtins/ecdsa_config.hpp>
#include <memory/segment.hpp>
#include <util/log.hpp>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

using namespace cairo;
using namespace cairo::vm;

using field_t = zkp::stark252_gmp;

namespace {

void write_instance(memory_segment& segment, address_t base,
                    const field_t& pubkey, const field_t& msg, write_order order) {
    const auto inst = ecdsa_instance::containing(base);

    if (order == write_order::msg_first) {
        segment.write(inst.msg_cell, msg);
        segment.write(inst.x_cell, pubkey);
    }
    else {
        segment.write(inst.x_cell, pubkey);
        segment.write(inst.msg_cell, msg);
    }
}

}  // namespace

int main(int argc, const char *argv[]) {
    if (argc < 2) {
        std::cerr << "Error: No JSON input provided" << std::endl;
        exit(EXIT_FAILURE);
    }

    std::string_view jstr = argv[1];
    json jconfig;

    try {
        jconfig = json::parse(jstr);
    }
    catch (json::exception& e) {
        std::cerr << e.what() << std::endl;
        exit(EXIT_FAILURE);
    }

    try {
        const ecdsa_config config = ecdsa_config::from_json(jconfig);
        set_logging_level(config.level);

        CAIRO_LOG_INFO << "ratio: " << config.ratio
                       << ", steps: " << config.step_count()
                       << ", instances: " << config.instances.size();

        ecdsa_builtin builtin(config.ratio, config.max_instances);
        memory_segment segment;
        segment.with_builtin_runner(&builtin);

        for (size_t i = 0; i < config.instances.size(); i++) {
            const auto& inst = config.instances[i];
            const address_t base = i * builtin.cells_per_instance();

            // Signature hint runs before the instance cells are written
            builtin.add_signature(base,
                                  field_t::from_string(inst.r),
                                  field_t::from_string(inst.s));

            write_instance(segment, base,
                           field_t::from_string(inst.pubkey),
                           field_t::from_string(inst.msg),
                           inst.order);
        }

        const u64 used = segment.used_size();
        builtin.set_stop_pointer(used);

        const u64 allocated = builtin.allocated_size(used, config.step_count());
        CAIRO_LOG_INFO << "used cells: " << used << ", allocated cells: " << allocated;

        json out = make_air_private_input(builtin.air_private_input(segment));
        std::cout << out.dump(4) << std::endl;
    }
    catch (const vm_error& e) {
        CAIRO_LOG_ERROR << e.what();
        std::cerr << "Error: " << to_string(e.kind()) << ": " << e.what() << std::endl;
        exit(EXIT_FAILURE);
    }

    return 0;
}
