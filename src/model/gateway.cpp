// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#include "gateway.h"
#include "constants.h"
#include "utils/error_code.h"
#include <spdlog/fmt/fmt.h>

namespace gatewarden::model {

std::uint32_t restart_delay(std::uint32_t attempt, std::uint32_t base, std::uint32_t max) noexcept {
    if (attempt >= 32) {
        return max;
    }
    auto value = static_cast<std::uint64_t>(base) << attempt;
    return value >= max ? max : static_cast<std::uint32_t>(value);
}

gateway_t::gateway_t(config::gateway_config_t config_) noexcept : config{std::move(config_)} {
    if (auto c = std::get_if<config::process_config_t>(&config.kind); c) {
        address = fmt::format("http://{}:{}{}", constants::loopback_host, c->port, constants::health_path);
        if (c->command.empty()) {
            misconfiguration = utils::make_error_code(utils::error_code_t::missing_command);
        } else if (!c->port) {
            misconfiguration = utils::make_error_code(utils::error_code_t::missing_port);
        }
    } else {
        address = std::get<config::endpoint_config_t>(config.kind).url;
    }
}

const config::process_config_t *gateway_t::get_process_config() const noexcept {
    return std::get_if<config::process_config_t>(&config.kind);
}

transition_t gateway_t::update_health(bool healthy) noexcept {
    auto prev = health;
    health = healthy ? health_t::healthy : health_t::unhealthy;
    if (healthy && prev != health_t::healthy) {
        restart_count = 0;
        return transition_t::became_healthy;
    }
    if (!healthy && prev == health_t::healthy) {
        return transition_t::became_unhealthy;
    }
    return transition_t::none;
}

std::uint32_t gateway_t::next_generation() noexcept { return ++generation; }

void gateway_t::assign(process::process_ptr_t process_) noexcept { process = std::move(process_); }

bool gateway_t::is_current(std::uint32_t generation_) const noexcept {
    return process && generation_ == generation;
}

std::uint32_t gateway_t::on_process_gone() noexcept {
    process.reset();
    health = health_t::unhealthy;
    return restart_count++;
}

process::process_ptr_t gateway_t::release_process() noexcept {
    auto r = std::move(process);
    process.reset();
    return r;
}

bool gateways_map_t::put(gateway_ptr_t item) noexcept {
    auto &by_name = get<1>();
    auto it = by_name.find(item->get_name());
    if (it != by_name.end()) {
        by_name.erase(it);
    }
    return push_back(std::move(item)).second;
}

gateway_ptr_t gateways_map_t::by_name(std::string_view name) const noexcept {
    auto &index = get<1>();
    auto it = index.find(name);
    if (it != index.end()) {
        return *it;
    }
    return {};
}

} // namespace gatewarden::model
