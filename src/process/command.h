// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <boost/process/environment.hpp>
#include "config/gateway.h"
#include "gatewarden-export.h"

namespace gatewarden::process {

namespace bp = boost::process;

using dirs_t = std::vector<std::string>;

/* returns the list of well-known installation directories */
GATEWARDEN_API dirs_t default_dirs() noexcept;

/* resolves the executable name into an invocable path: at first via PATH,
 * then via the supplied directories, and finally the name is returned as is */
GATEWARDEN_API std::string resolve_command(std::string_view name, const dirs_t &dirs = default_dirs()) noexcept;

/* prepends the directories to PATH-like string, keeping the first occurrence
 * of each entry; empty `current` is treated as the default system PATH */
GATEWARDEN_API std::string augment_path(std::string_view current, const dirs_t &dirs = default_dirs()) noexcept;

/* the environment of this process with augmented PATH, and the overrides on top */
GATEWARDEN_API bp::environment make_environment(const config::process_config_t::env_t &overrides) noexcept;

/* resolved command followed by its arguments, single-space joined */
GATEWARDEN_API std::string make_command_line(const config::process_config_t &config) noexcept;

} // namespace gatewarden::process
