// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#include "test-utils.h"
#include "config/utils.h"
#include "utils/error_code.h"
#include "utils/location.h"
#include <cstdlib>
#include <sstream>

namespace gatewarden::config {

bool operator==(const log_config_t &lhs, const log_config_t &rhs) noexcept {
    return lhs.name == rhs.name && lhs.level == rhs.level && lhs.sinks == rhs.sinks;
}

bool operator==(const supervisor_config_t &lhs, const supervisor_config_t &rhs) noexcept {
    return lhs.helper == rhs.helper && lhs.poll_interval == rhs.poll_interval &&
           lhs.startup_grace == rhs.startup_grace && lhs.probe_timeout == rhs.probe_timeout &&
           lhs.restart_base == rhs.restart_base && lhs.restart_max == rhs.restart_max &&
           lhs.host_alias == rhs.host_alias;
}

bool operator==(const main_t &lhs, const main_t &rhs) noexcept {
    return lhs.config_path == rhs.config_path && lhs.gateways_file == rhs.gateways_file &&
           lhs.directory_file == rhs.directory_file && lhs.log_configs == rhs.log_configs &&
           lhs.supervisor_config == rhs.supervisor_config && lhs.timeout == rhs.timeout;
}

} // namespace gatewarden::config

namespace st = gatewarden::test;
namespace bfs = boost::filesystem;

using namespace gatewarden;
using E = utils::error_code_t;

TEST_CASE("default config dir", "[config]") {
    auto prev = getenv("XDG_CONFIG_HOME");
    auto prev_value = std::string(prev ? prev : "");
    setenv("XDG_CONFIG_HOME", "/some/xdg", 1);
    auto dir = utils::get_default_config_dir();
    REQUIRE(dir);
    CHECK(dir.value().string() == "/some/xdg/gatewarden");
    if (prev) {
        setenv("XDG_CONFIG_HOME", prev_value.c_str(), 1);
    } else {
        unsetenv("XDG_CONFIG_HOME");
    }
}

TEST_CASE("default config is OK", "[config]") {
    auto dir = st::unique_path();
    auto dir_guard = st::path_guard_t(dir);
    auto cfg_path = dir / "gatewarden.toml";
    auto cfg_opt = config::generate_config(cfg_path);
    REQUIRE(cfg_opt);
    CHECK(bfs::exists(dir));

    auto &cfg = cfg_opt.value();
    CHECK(cfg.gateways_file == dir / "gateways.json");
    CHECK(cfg.directory_file.empty());
    CHECK(cfg.supervisor_config.helper == "supergateway");
    CHECK(cfg.supervisor_config.poll_interval == 30000);
    CHECK(cfg.supervisor_config.startup_grace == 10000);
    CHECK(cfg.supervisor_config.probe_timeout == 5000);
    CHECK(cfg.supervisor_config.restart_base == 1000);
    CHECK(cfg.supervisor_config.restart_max == 60000);
    CHECK(cfg.supervisor_config.host_alias == "host.docker.internal");

    SECTION("serialize default") {
        std::stringstream out;
        auto r = config::serialize(cfg, out);
        CHECK(r);
        INFO(out.str());
        auto cfg2_opt = config::get_config(out, cfg_path);
        REQUIRE(cfg2_opt);
        CHECK(cfg == cfg2_opt.value());
    }
    SECTION("directory file survives serialization") {
        cfg.directory_file = dir / "directory.json";
        std::stringstream out;
        REQUIRE(config::serialize(cfg, out));
        auto cfg2_opt = config::get_config(out, cfg_path);
        REQUIRE(cfg2_opt);
        CHECK(cfg2_opt.value().directory_file == cfg.directory_file);
    }
}

TEST_CASE("partial and broken config", "[config]") {
    auto cfg_path = bfs::path("/tmp/gatewarden/gatewarden.toml");
    SECTION("missing values are defaulted") {
        std::stringstream in("[supervisor]\npoll_interval = 500\n");
        auto cfg_opt = config::get_config(in, cfg_path);
        REQUIRE(cfg_opt);
        auto &cfg = cfg_opt.value();
        CHECK(cfg.supervisor_config.poll_interval == 500);
        CHECK(cfg.supervisor_config.restart_base == 1000);
        CHECK(cfg.gateways_file == bfs::path("/tmp/gatewarden/gateways.json"));
        REQUIRE(cfg.log_configs.size() == 1);
        CHECK(cfg.log_configs[0].name == "default");
    }
    SECTION("log sections") {
        std::stringstream in(R"(
[[log]]
name = "default"
level = "debug"
sinks = ["stderr"]

[[log]]
name = "gateway"
level = "warn"
)");
        auto cfg_opt = config::get_config(in, cfg_path);
        REQUIRE(cfg_opt);
        auto &logs = cfg_opt.value().log_configs;
        REQUIRE(logs.size() == 2);
        CHECK(logs[0].level == spdlog::level::debug);
        CHECK(logs[0].sinks == config::log_config_t::sinks_t{"stderr"});
        CHECK(logs[1].name == "gateway");
        CHECK(logs[1].level == spdlog::level::warn);
        CHECK(logs[1].sinks.empty());
    }
    SECTION("zero interval") {
        std::stringstream in("[supervisor]\nprobe_timeout = 0\n");
        CHECK(!config::get_config(in, cfg_path));
    }
    SECTION("restart_max below restart_base") {
        std::stringstream in("[supervisor]\nrestart_base = 5000\nrestart_max = 100\n");
        CHECK(!config::get_config(in, cfg_path));
    }
    SECTION("not a toml") {
        std::stringstream in("[supervisor\n");
        CHECK(!config::get_config(in, cfg_path));
    }
}

TEST_CASE("gateway declarations", "[config]") {
    SECTION("both kinds") {
        auto r = config::parse_gateways(R"({
            "gateways": [
                {"name": "fs", "type": "stdio", "command": "npx", "args": ["-y", "server-fs", "/data"],
                 "env": {"TOKEN": "abc"}, "port": 8001, "description": "files"},
                {"name": "remote", "type": "http", "url": "https://mcp.example.com/sse", "optional": true}
            ]
        })");
        REQUIRE(r);
        auto &gws = r.value();
        REQUIRE(gws.size() == 2);

        CHECK(gws[0].name == "fs");
        CHECK(!gws[0].optional);
        CHECK(gws[0].description == "files");
        auto p = std::get_if<config::process_config_t>(&gws[0].kind);
        REQUIRE(p);
        CHECK(p->command == "npx");
        CHECK(p->args == config::process_config_t::args_t{"-y", "server-fs", "/data"});
        CHECK(p->env.at("TOKEN") == "abc");
        CHECK(p->port == 8001);

        CHECK(gws[1].name == "remote");
        CHECK(gws[1].optional);
        auto e = std::get_if<config::endpoint_config_t>(&gws[1].kind);
        REQUIRE(e);
        CHECK(e->url == "https://mcp.example.com/sse");
    }
    SECTION("incomplete process declaration is kept") {
        auto r = config::parse_gateways(R"({"gateways": [{"name": "x", "type": "stdio", "port": 70000}]})");
        REQUIRE(r);
        REQUIRE(r.value().size() == 1);
        auto p = std::get_if<config::process_config_t>(&r.value()[0].kind);
        REQUIRE(p);
        CHECK(p->command.empty());
        CHECK(p->port == 0);
    }
    SECTION("broken entries are skipped") {
        auto r = config::parse_gateways(R"({"gateways": [
            42,
            {"type": "http", "url": "http://a"},
            {"name": "u", "type": "websocket"},
            {"name": "ok", "type": "http", "url": "http://b"}
        ]})");
        REQUIRE(r);
        REQUIRE(r.value().size() == 1);
        CHECK(r.value()[0].name == "ok");
    }
    SECTION("last declaration wins") {
        auto r = config::parse_gateways(R"({"gateways": [
            {"name": "a", "type": "http", "url": "http://first"},
            {"name": "b", "type": "http", "url": "http://b"},
            {"name": "a", "type": "http", "url": "http://second"}
        ]})");
        REQUIRE(r);
        auto &gws = r.value();
        REQUIRE(gws.size() == 2);
        CHECK(gws[0].name == "b");
        CHECK(gws[1].name == "a");
        CHECK(std::get<config::endpoint_config_t>(gws[1].kind).url == "http://second");
    }
    SECTION("document errors") {
        auto r1 = config::parse_gateways("{");
        REQUIRE(!r1);
        CHECK(r1.error() == utils::make_error_code(E::malformed_json));

        auto r2 = config::parse_gateways("[]");
        REQUIRE(!r2);
        CHECK(r2.error() == utils::make_error_code(E::incorrect_json));

        auto r3 = config::parse_gateways(R"({"servers": []})");
        REQUIRE(!r3);
        CHECK(r3.error() == utils::make_error_code(E::incorrect_json));
    }
}

TEST_CASE("load gateways file", "[config]") {
    auto dir = st::unique_path();
    auto dir_guard = st::path_guard_t(dir);
    auto path = dir / "gateways.json";

    SECTION("absent file") { CHECK(config::load_gateways(path).empty()); }
    SECTION("broken file") {
        st::write_file(path, "definitely not json");
        CHECK(config::load_gateways(path).empty());
    }
    SECTION("valid file") {
        st::write_file(path, R"({"gateways": [{"name": "a", "type": "http", "url": "http://a"}]})");
        auto gws = config::load_gateways(path);
        REQUIRE(gws.size() == 1);
        CHECK(gws[0].name == "a");
    }
}
