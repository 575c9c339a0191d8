// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#include "constants.h"
#include "gatewarden-config.h"

namespace gatewarden::constants {

const char *client_name = "gatewarden";
const char *client_version = GATEWARDEN_VERSION;
const char *helper_name = "supergateway";
const char *loopback_host = "127.0.0.1";
const char *host_alias = "host.docker.internal";
const char *health_path = "/sse";
const char *default_path = "/usr/bin:/bin";

// clang-format off
const std::array<const char *, 3> well_known_dirs = {
    "/usr/local/bin",
    "/usr/local/opt/node@22/bin",
    "/opt/homebrew/bin",
};
// clang-format on

} // namespace gatewarden::constants
