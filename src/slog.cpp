// Copyright Cartesi and individual authors (see AUTHORS)
// SPDX-License-Identifier: LGPL-3.0-or-later
//
// This program is free software: you can redistribute it and/or modify it under
// the terms of the GNU Lesser General Public License as published by the Free
// Software Foundation, either version 3 of the License, or (at your option) any
// later version.
//
// This program is distributed in the hope that it will be useful, but WITHOUT ANY
// WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A
// PARTICULAR PURPOSE. See the GNU Lesser General Public License for more details.
//
// You should have received a copy of the GNU Lesser General Public License along
// with this program (see COPYING). If not, see <https://www.gnu.org/licenses/>.
//

#include "slog.h"

#include <array>
#include <cstring>
#include <stdexcept>
#include <string>

namespace slog {

namespace {

struct level_name {
    severity_level level;
    const char *name;
};

constexpr std::array<level_name, 6> level_names{{
    {severity_level::trace, "trace"},
    {severity_level::debug, "debug"},
    {severity_level::info, "info"},
    {severity_level::warning, "warning"},
    {severity_level::error, "error"},
    {severity_level::fatal, "fatal"},
}};

} // namespace

severity_level log_level(level_operation operation, severity_level new_level) {
    static severity_level level = default_log_level;
    auto old_level = level;
    if (operation == level_operation::set) {
        level = new_level;
    }
    return old_level;
}

const char *to_string(severity_level level) {
    for (const auto &entry : level_names) {
        if (entry.level == level) {
            return entry.name;
        }
    }
    return "unknown";
}

severity_level from_string(const char *name) {
    if (name == nullptr) {
        throw std::domain_error{"missing log severity level"};
    }
    for (const auto &entry : level_names) {
        if (strcmp(name, entry.name) == 0) {
            return entry.level;
        }
    }
    throw std::domain_error{std::string("unknown log severity level '") + name + "'"};
}

} // namespace slog
