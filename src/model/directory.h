// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#pragma once

#include <string>
#include <string_view>
#include <vector>
#include "gateway.h"
#include "gatewarden-export.h"

namespace gatewarden::model {

struct directory_entry_t {
    std::string name;
    std::string url;

    inline bool operator==(const directory_entry_t &other) const noexcept {
        return name == other.name && url == other.url;
    }
};

using directory_t = std::vector<directory_entry_t>;

/* healthy gateways only, in declaration order; loopback host is replaced
 * by the alias, so the addresses are reachable from containers */
GATEWARDEN_API directory_t make_directory(const gateways_map_t &gateways, std::string_view alias) noexcept;

GATEWARDEN_API std::string serialize(const directory_t &directory) noexcept;

} // namespace gatewarden::model
