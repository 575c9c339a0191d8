// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#pragma once

#include <cstdint>
#include <array>
#include "gatewarden-export.h"

namespace gatewarden::constants {

static const constexpr std::uint32_t poll_interval = 30000;
static const constexpr std::uint32_t startup_grace = 10000;
static const constexpr std::uint32_t probe_timeout = 5000;
static const constexpr std::uint32_t restart_base = 1000;
static const constexpr std::uint32_t restart_max = 60000;
static const constexpr std::uint32_t actor_timeout = 5000;

GATEWARDEN_API extern const char *client_name;
GATEWARDEN_API extern const char *client_version;
GATEWARDEN_API extern const char *helper_name;
GATEWARDEN_API extern const char *loopback_host;
GATEWARDEN_API extern const char *host_alias;
GATEWARDEN_API extern const char *health_path;
GATEWARDEN_API extern const char *default_path;
GATEWARDEN_API extern const std::array<const char *, 3> well_known_dirs;

} // namespace gatewarden::constants
