// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#include "log.h"
#include <algorithm>
#include <iterator>

namespace gatewarden::utils {

namespace {

using L = spdlog::level::level_enum;

struct level_name_t {
    std::string_view name;
    L level;
};

// the first spelling of a level is the one written back into configs
const level_name_t level_names[] = {
    {"trace", L::trace}, {"debug", L::debug}, {"info", L::info},        {"warn", L::warn}, {"warning", L::warn},
    {"error", L::err},   {"crit", L::critical}, {"critical", L::critical}, {"off", L::off},
};

logger_t closest_registered(std::string_view name) noexcept {
    for (auto p = name.rfind('.'); p != name.npos; p = name.rfind('.')) {
        name = name.substr(0, p);
        if (auto logger = spdlog::get(std::string(name)); logger) {
            return logger;
        }
    }
    return spdlog::default_logger();
}

} // namespace

auto get_log_level(std::string_view log_level) noexcept -> level_opt_t {
    auto it = std::find_if(std::begin(level_names), std::end(level_names),
                           [&](const level_name_t &item) { return item.name == log_level; });
    if (it == std::end(level_names)) {
        return {};
    }
    return it->level;
}

std::string_view get_level_string(spdlog::level::level_enum level) noexcept {
    auto it = std::find_if(std::begin(level_names), std::end(level_names),
                           [&](const level_name_t &item) { return item.level == level; });
    return it != std::end(level_names) ? it->name : std::string_view("off");
}

logger_t get_logger(std::string_view name) noexcept {
    auto full_name = std::string(name);
    if (auto logger = spdlog::get(full_name); logger) {
        return logger;
    }

    auto parent = closest_registered(name);
    auto &sinks = parent->sinks();
    auto logger = std::make_shared<spdlog::logger>(std::move(full_name), sinks.begin(), sinks.end());
    logger->set_level(parent->level());
    logger->flush_on(parent->flush_level());
    spdlog::register_logger(logger);
    return logger;
}

} // namespace gatewarden::utils
