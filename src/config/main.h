// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#pragma once
#include <cstdint>
#include "log.h"
#include "supervisor.h"
#include <boost/filesystem.hpp>

namespace gatewarden::config {

namespace bfs = boost::filesystem;

struct main_t {
    bfs::path config_path;
    bfs::path gateways_file;
    bfs::path directory_file;

    log_configs_t log_configs;
    supervisor_config_t supervisor_config;

    std::uint32_t timeout;
};

} // namespace gatewarden::config
