// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#include "location.h"
#include "error_code.h"
#include <cerrno>
#include <cstdlib>
#include <boost/system/error_code.hpp>

#include <unistd.h>
#include <sys/types.h>
#include <pwd.h>

namespace gatewarden::utils {

namespace sys = boost::system;

outcome::result<bfs::path> get_home_dir() noexcept {
    if (auto home = std::getenv("HOME"); home && *home) {
        return bfs::path(home);
    }
    auto *pw = getpwuid(getuid());
    if (!pw) {
        if (errno) {
            return sys::error_code{errno, sys::generic_category()};
        }
        return error_code_t::cant_determine_config_dir;
    }
    return bfs::path(pw->pw_dir);
}

outcome::result<bfs::path> get_default_config_dir() noexcept {
    if (auto xdg_home = std::getenv("XDG_CONFIG_HOME"); xdg_home && *xdg_home) {
        return bfs::path(xdg_home) / "gatewarden";
    }
    auto home_opt = get_home_dir();
    if (home_opt.has_error()) {
        return home_opt.assume_error();
    }
    return home_opt.assume_value() / ".config" / "gatewarden";
}

} // namespace gatewarden::utils
