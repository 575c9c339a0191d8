// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#include "utils.h"

#include <boost/nowide/convert.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <iterator>
#include "constants.h"
#include "utils/error_code.h"
#include "utils/log.h"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.h>

#define SAFE_GET_VALUE(property, type, table_name)                                                                     \
    {                                                                                                                  \
        auto option = t[#property].value<type>();                                                                      \
        if (!option) {                                                                                                 \
            spdlog::warn("using default value for {}/{}", table_name, #property);                                      \
            c.property = c_default.property;                                                                           \
        } else {                                                                                                       \
            c.property = option.value();                                                                               \
        }                                                                                                              \
    }

#define SAFE_GET_PATH(property, table_name)                                                                            \
    {                                                                                                                  \
        auto option = t[#property].value<std::string>();                                                               \
        if (!option) {                                                                                                 \
            spdlog::warn("using default value for {}/{}", table_name, #property);                                      \
            c.property = c_default.property;                                                                           \
        } else {                                                                                                       \
            c.property = boost::nowide::widen(option.value());                                                         \
        }                                                                                                              \
    }

#define SAFE_GET_PATH_OPTIONAL(property, table_name)                                                                   \
    {                                                                                                                  \
        auto option = t[#property].value<std::string>();                                                               \
        if (option) {                                                                                                  \
            c.property = boost::nowide::widen(option.value());                                                         \
        }                                                                                                              \
    }

namespace sys = boost::system;
using json = nlohmann::json;

namespace gatewarden::config {

using level_t = spdlog::level::level_enum;

static main_t make_default_config(const bfs::path &config_path) {
    auto dir = config_path.parent_path();

    // clang-format off
    main_t cfg;
    cfg.config_path = config_path;
    cfg.gateways_file = dir / "gateways.json";
    cfg.timeout = constants::actor_timeout;
    cfg.log_configs = {
        log_config_t {
            "default", spdlog::level::level_enum::info, {"stdout"}
        }
    };
    cfg.supervisor_config = supervisor_config_t {
        constants::helper_name,     /* helper */
        constants::poll_interval,   /* poll_interval */
        constants::startup_grace,   /* startup_grace */
        constants::probe_timeout,   /* probe_timeout */
        constants::restart_base,    /* restart_base */
        constants::restart_max,     /* restart_max */
        constants::host_alias,      /* host_alias */
    };
    // clang-format on
    return cfg;
}

static log_configs_t get_log_configs(toml::node_view<toml::node> node) noexcept {
    log_configs_t r;
    auto logs = node.as_array();
    if (!logs) {
        return r;
    }
    for (auto &item : *logs) {
        auto t = item.as_table();
        if (!t) {
            continue;
        }
        auto name = (*t)["name"].value<std::string>();
        if (!name) {
            continue;
        }
        auto level = level_t::info;
        if (auto level_str = (*t)["level"].value<std::string>(); level_str) {
            auto level_opt = utils::get_log_level(*level_str);
            if (!level_opt) {
                spdlog::warn("unknown log level '{}' for '{}', using info", *level_str, *name);
            } else {
                level = *level_opt;
            }
        }
        auto sinks = log_config_t::sinks_t{};
        if (auto sinks_arr = (*t)["sinks"].as_array(); sinks_arr) {
            for (auto &sink : *sinks_arr) {
                if (auto s = sink.value<std::string>(); s) {
                    sinks.emplace_back(std::move(*s));
                }
            }
        }
        r.emplace_back(log_config_t{std::move(*name), level, std::move(sinks)});
    }
    return r;
}

config_result_t get_config(std::istream &config, const bfs::path &config_path) {
    main_t cfg;
    cfg.config_path = config_path;

    auto r = toml::parse(config);
    if (!r) {
        return std::string(r.error().description());
    }

    auto default_config = make_default_config(config_path);

    auto &root_tbl = r.table();
    // main
    {
        auto t = root_tbl["main"];
        auto &c = cfg;
        auto &c_default = default_config;

        SAFE_GET_VALUE(timeout, std::uint32_t, "main");
        SAFE_GET_PATH(gateways_file, "main");
        SAFE_GET_PATH_OPTIONAL(directory_file, "main");
    };

    // supervisor
    {
        auto t = root_tbl["supervisor"];
        auto &c = cfg.supervisor_config;
        auto &c_default = default_config.supervisor_config;

        SAFE_GET_VALUE(helper, std::string, "supervisor");
        SAFE_GET_VALUE(poll_interval, std::uint32_t, "supervisor");
        SAFE_GET_VALUE(startup_grace, std::uint32_t, "supervisor");
        SAFE_GET_VALUE(probe_timeout, std::uint32_t, "supervisor");
        SAFE_GET_VALUE(restart_base, std::uint32_t, "supervisor");
        SAFE_GET_VALUE(restart_max, std::uint32_t, "supervisor");
        SAFE_GET_VALUE(host_alias, std::string, "supervisor");

        if (!c.poll_interval || !c.probe_timeout || !c.restart_base) {
            return std::string("supervisor intervals must be positive");
        }
        if (c.restart_max < c.restart_base) {
            return std::string("supervisor/restart_max is less than supervisor/restart_base");
        }
    };

    // log
    {
        cfg.log_configs = get_log_configs(root_tbl["log"]);
        if (cfg.log_configs.empty()) {
            spdlog::warn("using default value for log");
            cfg.log_configs = default_config.log_configs;
        }
    }

    return cfg;
}

outcome::result<void> serialize(const main_t cfg, std::ostream &out) noexcept {
    using boost::nowide::narrow;

    auto logs = toml::array{};
    for (auto &c : cfg.log_configs) {
        auto sinks = toml::array{};
        for (auto &sink : c.sinks) {
            sinks.emplace_back<std::string>(sink);
        }
        auto log_table = toml::table{{
            {"name", c.name},
            {"level", utils::get_level_string(c.level)},
            {"sinks", sinks},
        }};
        logs.push_back(log_table);
    }

    auto main_tbl = toml::table{{
        {"timeout", cfg.timeout},
        {"gateways_file", narrow(cfg.gateways_file.wstring())},
    }};
    if (!cfg.directory_file.empty()) {
        main_tbl.insert("directory_file", narrow(cfg.directory_file.wstring()));
    }

    auto &sc = cfg.supervisor_config;
    // clang-format off
    auto tbl = toml::table{{
        {"main", main_tbl},
        {"log", logs},
        {"supervisor", toml::table{{
                     {"helper", sc.helper},
                     {"poll_interval", sc.poll_interval},
                     {"startup_grace", sc.startup_grace},
                     {"probe_timeout", sc.probe_timeout},
                     {"restart_base", sc.restart_base},
                     {"restart_max", sc.restart_max},
                     {"host_alias", sc.host_alias},
                 }}},
    }};
    // clang-format on
    out << tbl;
    if (!out) {
        return sys::errc::make_error_code(sys::errc::io_error);
    }
    return outcome::success();
}

outcome::result<main_t> generate_config(const bfs::path &config_path) {
    auto dir = config_path.parent_path();
    sys::error_code ec;
    bool exists = bfs::exists(dir, ec);
    if (!exists) {
        spdlog::info("creating directory {}", dir.string());
        bfs::create_directories(dir, ec);
        if (ec) {
            spdlog::error("cannot create dirs: {}", ec.message());
            return ec;
        }
    }
    return make_default_config(config_path);
}

static outcome::result<gateway_config_t> parse_gateway(const json &entry) noexcept {
    if (!entry.is_object()) {
        return utils::make_error_code(utils::error_code_t::incorrect_json);
    }
    auto name_it = entry.find("name");
    if (name_it == entry.end() || !name_it->is_string() || name_it->get<std::string>().empty()) {
        return utils::make_error_code(utils::error_code_t::missing_gateway_name);
    }

    auto get_string = [&](const char *key) -> std::string {
        auto it = entry.find(key);
        return (it != entry.end() && it->is_string()) ? it->get<std::string>() : std::string();
    };

    gateway_config_t r;
    r.name = name_it->get<std::string>();
    r.description = get_string("description");
    auto optional_it = entry.find("optional");
    r.optional = optional_it != entry.end() && optional_it->is_boolean() && optional_it->get<bool>();

    auto type = get_string("type");
    if (type == "stdio") {
        auto c = process_config_t{get_string("command"), {}, {}, 0};
        if (auto it = entry.find("args"); it != entry.end() && it->is_array()) {
            for (auto &arg : *it) {
                if (arg.is_string()) {
                    c.args.emplace_back(arg.get<std::string>());
                }
            }
        }
        if (auto it = entry.find("env"); it != entry.end() && it->is_object()) {
            for (auto &[key, value] : it->items()) {
                if (value.is_string()) {
                    c.env[key] = value.get<std::string>();
                }
            }
        }
        if (auto it = entry.find("port"); it != entry.end() && it->is_number_unsigned()) {
            auto port = it->get<std::uint64_t>();
            if (port <= 0xFFFF) {
                c.port = static_cast<std::uint16_t>(port);
            }
        }
        r.kind = std::move(c);
    } else if (type == "http") {
        r.kind = endpoint_config_t{get_string("url")};
    } else {
        return utils::make_error_code(utils::error_code_t::unknown_gateway_type);
    }
    return r;
}

outcome::result<gateway_configs_t> parse_gateways(std::string_view data) noexcept {
    auto root = json::parse(data.begin(), data.end(), nullptr, false);
    if (root.is_discarded()) {
        return utils::make_error_code(utils::error_code_t::malformed_json);
    }
    if (!root.is_object()) {
        return utils::make_error_code(utils::error_code_t::incorrect_json);
    }
    auto gateways = root.find("gateways");
    if (gateways == root.end() || !gateways->is_array()) {
        return utils::make_error_code(utils::error_code_t::incorrect_json);
    }

    gateway_configs_t r;
    std::size_t index = 0;
    for (auto &entry : *gateways) {
        auto gateway = parse_gateway(entry);
        if (!gateway) {
            spdlog::error("skipping gateway declaration #{}: {}", index, gateway.error().message());
        } else {
            auto &name = gateway.value().name;
            auto prev = std::find_if(r.begin(), r.end(), [&](auto &it) { return it.name == name; });
            if (prev != r.end()) {
                spdlog::warn("gateway '{}' is declared more than once, the last declaration wins", name);
                r.erase(prev);
            }
            r.emplace_back(std::move(gateway.value()));
        }
        ++index;
    }
    return r;
}

gateway_configs_t load_gateways(const bfs::path &path) noexcept {
    sys::error_code ec;
    if (!bfs::exists(path, ec)) {
        spdlog::info("no gateways file at {}, no gateways will be managed", path.string());
        return {};
    }

    auto in = std::ifstream(path.string(), std::ios::binary);
    if (!in) {
        spdlog::error("cannot open gateways file {}", path.string());
        return {};
    }
    auto data = std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());

    auto r = parse_gateways(data);
    if (!r) {
        spdlog::error("cannot load gateways from {}: {}", path.string(), r.error().message());
        return {};
    }
    spdlog::debug("{} gateway(s) declared in {}", r.value().size(), path.string());
    return std::move(r.value());
}

} // namespace gatewarden::config
