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

#include <array>
#include <utility>

#include <util/log.hpp>

namespace trivial = logging::trivial;

namespace {

constexpr std::array<std::pair<std::string_view, log_level>, 4> level_names {{
    { "disabled", log_level::disabled   },
    { "debug",    log_level::debug_only },
    { "info",     log_level::info_only  },
    { "full",     log_level::full       },
}};

void install_filter(log_level level) {
    auto core = logging::core::get();
    switch (level) {
    case log_level::debug_only:
        core->set_filter(trivial::severity == trivial::debug);
        break;
    case log_level::info_only:
        // Warnings and errors stay visible
        core->set_filter(trivial::severity >= trivial::info);
        break;
    case log_level::full:
        core->reset_filter();
        break;
    case log_level::disabled:
        break;
    }
}

}  // namespace

void enable_logging() {
    logging::core::get()->set_logging_enabled(true);
}

void disable_logging() {
    logging::core::get()->set_logging_enabled(false);
}

void set_logging_level(log_level level) {
    if (level == log_level::disabled) {
        disable_logging();
        return;
    }
    install_filter(level);
    enable_logging();
}

std::optional<log_level> parse_log_level(std::string_view name) {
    for (const auto& [key, level] : level_names) {
        if (key == name) {
            return level;
        }
    }
    return std::nullopt;
}
