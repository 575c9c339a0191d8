// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#include "command.h"
#include "constants.h"
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <boost/filesystem.hpp>
#include <boost/process/search_path.hpp>
#include <unistd.h>

namespace gatewarden::process {

namespace bfs = boost::filesystem;
namespace sys = boost::system;

dirs_t default_dirs() noexcept {
    return dirs_t(constants::well_known_dirs.begin(), constants::well_known_dirs.end());
}

static bool is_executable(const bfs::path &path) noexcept {
    sys::error_code ec;
    if (!bfs::is_regular_file(path, ec) || ec) {
        return false;
    }
    return ::access(path.c_str(), X_OK) == 0;
}

std::string resolve_command(std::string_view name, const dirs_t &dirs) noexcept {
    auto name_str = std::string(name);
    if (name_str.empty() || name_str.find('/') != std::string::npos) {
        return name_str;
    }

    auto found = bp::search_path(name_str);
    if (!found.empty()) {
        return found.string();
    }

    for (auto &dir : dirs) {
        auto path = bfs::path(dir) / name_str;
        if (is_executable(path)) {
            return path.string();
        }
    }
    return name_str;
}

std::string augment_path(std::string_view current, const dirs_t &dirs) noexcept {
    auto current_str = current.empty() ? std::string(constants::default_path) : std::string(current);
    auto existing = std::vector<std::string>();
    boost::algorithm::split(existing, current_str, boost::algorithm::is_any_of(":"));

    auto entries = std::vector<std::string>();
    auto append = [&](const std::string &entry) {
        if (entry.empty()) {
            return;
        }
        if (std::find(entries.begin(), entries.end(), entry) == entries.end()) {
            entries.push_back(entry);
        }
    };
    for (auto &dir : dirs) {
        append(dir);
    }
    for (auto &dir : existing) {
        append(dir);
    }
    return boost::algorithm::join(entries, ":");
}

bp::environment make_environment(const config::process_config_t::env_t &overrides) noexcept {
    bp::environment env = boost::this_process::environment();
    auto path_it = env.find("PATH");
    auto current = (path_it != env.end()) ? path_it->to_string() : std::string();
    env["PATH"] = augment_path(current);
    for (auto &[key, value] : overrides) {
        env[key] = value;
    }
    return env;
}

std::string make_command_line(const config::process_config_t &config) noexcept {
    auto r = resolve_command(config.command);
    for (auto &arg : config.args) {
        r += ' ';
        r += arg;
    }
    return r;
}

} // namespace gatewarden::process
