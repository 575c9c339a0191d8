// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#pragma once
#include <cstdint>
#include <iosfwd>
#include <string_view>
#include <boost/outcome.hpp>
#include "main.h"
#include "gateway.h"
#include "gatewarden-export.h"

namespace gatewarden::config {

namespace outcome = boost::outcome_v2;

using config_result_t = outcome::outcome<main_t, std::string>;

GATEWARDEN_API config_result_t get_config(std::istream &config, const bfs::path &config_path);

GATEWARDEN_API outcome::result<main_t> generate_config(const bfs::path &config_path);

GATEWARDEN_API outcome::result<void> serialize(const main_t cfg, std::ostream &out) noexcept;

/* parses gateway declarations json; broken entries are reported and skipped,
 * duplicate names are resolved in favor of the last declaration */
GATEWARDEN_API outcome::result<gateway_configs_t> parse_gateways(std::string_view json) noexcept;

/* absent or unusable file yields an empty list */
GATEWARDEN_API gateway_configs_t load_gateways(const bfs::path &path) noexcept;

} // namespace gatewarden::config
