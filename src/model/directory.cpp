// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#include "directory.h"
#include "constants.h"
#include "utils/uri.h"
#include <nlohmann/json.hpp>

namespace gatewarden::model {

using json = nlohmann::json;

directory_t make_directory(const gateways_map_t &gateways, std::string_view alias) noexcept {
    directory_t r;
    for (auto &gateway : gateways) {
        if (!gateway->is_healthy()) {
            continue;
        }
        auto url = utils::rewrite_host(gateway->get_address(), constants::loopback_host, alias);
        r.emplace_back(directory_entry_t{gateway->get_name(), std::move(url)});
    }
    return r;
}

std::string serialize(const directory_t &directory) noexcept {
    auto items = json::array();
    for (auto &entry : directory) {
        items.push_back(json::object({{"name", entry.name}, {"url", entry.url}}));
    }
    auto root = json::object({{"gateways", std::move(items)}});
    return root.dump(2, ' ', false, json::error_handler_t::replace);
}

} // namespace gatewarden::model
