// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace gatewarden::config {

/* gateway spawned and owned by the supervisor; zero port or empty
 * command mean the declaration is incomplete */
struct process_config_t {
    using args_t = std::vector<std::string>;
    using env_t = std::map<std::string, std::string>;

    std::string command;
    args_t args;
    env_t env;
    std::uint16_t port = 0;
};

/* pre-existing network endpoint, only observed */
struct endpoint_config_t {
    std::string url;
};

using gateway_kind_t = std::variant<process_config_t, endpoint_config_t>;

struct gateway_config_t {
    std::string name;
    gateway_kind_t kind;
    bool optional = false;
    std::string description;
};

using gateway_configs_t = std::vector<gateway_config_t>;

} // namespace gatewarden::config
