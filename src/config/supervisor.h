// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#pragma once
#include <cstdint>
#include <string>

namespace gatewarden::config {

struct supervisor_config_t {
    std::string helper;
    std::uint32_t poll_interval;
    std::uint32_t startup_grace;
    std::uint32_t probe_timeout;
    std::uint32_t restart_base;
    std::uint32_t restart_max;
    std::string host_alias;
};

} // namespace gatewarden::config
