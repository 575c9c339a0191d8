// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#pragma once

#include <catch2/catch_all.hpp>
#include <boost/filesystem.hpp>
#include <boost/system/error_code.hpp>
#include <string>
#include <string_view>
#include "utils/log-setup.h"
#include "gatewarden-test-export.h"

namespace gatewarden::test {

namespace bfs = boost::filesystem;
namespace sys = boost::system;

struct GATEWARDEN_TEST_API path_guard_t {
    bfs::path path;
    path_guard_t(const bfs::path &path_);
    path_guard_t(path_guard_t &) = delete;
    path_guard_t(path_guard_t &&other);
    ~path_guard_t();
};

GATEWARDEN_TEST_API bfs::path unique_path();
GATEWARDEN_TEST_API utils::dist_sink_t init_logging();
GATEWARDEN_TEST_API std::string read_file(const bfs::path &path);
GATEWARDEN_TEST_API void write_file(const bfs::path &path, std::string_view content);

} // namespace gatewarden::test
