// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#pragma once

#include <string>
#include <boost/outcome.hpp>
#include <filesystem>
#include "gatewarden-export.h"

namespace gatewarden {
namespace utils {

namespace outcome = boost::outcome_v2;
namespace bfs = std::filesystem;

GATEWARDEN_API outcome::result<bfs::path> get_home_dir() noexcept;

/* $XDG_CONFIG_HOME/gatewarden or ~/.config/gatewarden */
GATEWARDEN_API outcome::result<bfs::path> get_default_config_dir() noexcept;

} // namespace utils
} // namespace gatewarden
