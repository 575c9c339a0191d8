// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#include "log-setup.h"

#include "error_code.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <algorithm>
#include <memory>
#include <unordered_map>
#include <string_view>
#include <vector>

namespace gatewarden::utils {

static const char *log_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%L/%t%$] {%n} %v";
static const char *default_logger_name = "default";

using sink_option_t = outcome::result<spdlog::sink_ptr>;

static sink_option_t make_sink(std::string_view name) noexcept {
    if (name == "stdout") {
        return std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    } else if (name == "stderr") {
        return std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    } else if (name.size() > 5 && name.substr(0, 5) == "file:") {
        auto path = std::string(name.substr(5));
        try {
            return std::make_shared<spdlog::sinks::basic_file_sink_mt>(path);
        } catch (const spdlog::spdlog_ex &) {
            return utils::make_error_code(error_code_t::cannot_open_sink);
        }
    }
    return utils::make_error_code(error_code_t::unknown_sink);
}

outcome::result<void> init_loggers(const config::log_configs_t &configs) noexcept {
    using sink_map_t = std::unordered_map<std::string, spdlog::sink_ptr>;
    using logger_map_t = std::unordered_map<std::string, std::shared_ptr<spdlog::logger>>;

    auto root = spdlog::default_logger();
    if (root->sinks().size() != 1) {
        return utils::make_error_code(error_code_t::misconfigured_default_logger);
    }
    auto dist_sink = dynamic_cast<spdlog::sinks::dist_sink_mt *>(root->sinks().front().get());
    if (!dist_sink) {
        return utils::make_error_code(error_code_t::misconfigured_default_logger);
    }

    sink_map_t sink_map;
    for (auto &cfg : configs) {
        for (auto &sink : cfg.sinks) {
            if (sink_map.count(sink)) {
                continue;
            }
            auto sink_option = make_sink(sink);
            if (!sink_option) {
                return sink_option.error();
            }
            sink_map[sink] = std::move(sink_option.value());
        }
    }

    spdlog::drop_all();
    spdlog::set_default_logger(root);

    logger_map_t logger_map;
    auto root_level = spdlog::level::info;
    for (auto &cfg : configs) {
        if (cfg.name != default_logger_name) {
            continue;
        }
        for (auto &sink_name : cfg.sinks) {
            dist_sink->add_sink(sink_map.at(sink_name));
        }
        root->set_level(cfg.level);
        if (cfg.level == spdlog::level::trace) {
            root->flush_on(spdlog::level::trace);
        }
        root_level = cfg.level;
    }

    for (auto &cfg : configs) {
        auto &name = cfg.name;
        if (name == default_logger_name) {
            continue;
        }

        std::vector<spdlog::sink_ptr> sinks;
        for (auto &sink_name : cfg.sinks) {
            sinks.push_back(sink_map.at(sink_name));
        }
        if (sinks.empty()) {
            sinks = root->sinks();
        }

        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(std::max(cfg.level, root_level));
        logger_map[name] = logger;
    }

    for (auto &it : logger_map) {
        spdlog::register_logger(it.second);
    }
    spdlog::set_pattern(log_pattern);
    return outcome::success();
}

void finalize_loggers() noexcept {
    spdlog::apply_all([](const logger_t &logger) { logger->flush(); });
    spdlog::drop_all();
    spdlog::shutdown();
}

bootstrap_guard_t::bootstrap_guard_t(dist_sink_t dist_sink_, sink_t sink_)
    : dist_sink{std::move(dist_sink_)}, sink{std::move(sink_)} {}

bootstrap_guard_t::~bootstrap_guard_t() {
    if (sink) {
        dist_sink->flush();
        dist_sink->remove_sink(sink);
    }
}

dist_sink_t create_root_logger() noexcept {
    auto dist_sink = std::make_shared<spdlog::sinks::dist_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("", dist_sink);
    logger->set_level(spdlog::level::trace);
    spdlog::drop_all();
    spdlog::set_default_logger(logger);
    spdlog::set_pattern(log_pattern);
    spdlog::set_level(spdlog::level::trace);
    return dist_sink;
}

auto bootstrap(dist_sink_t &dist_sink, spdlog::level::level_enum level) noexcept -> bootstrap_guard_ptr_t {
    auto sink = spdlog::sink_ptr(new spdlog::sinks::stderr_color_sink_mt());
    sink->set_pattern(log_pattern);
    sink->set_level(level);
    dist_sink->add_sink(sink);
    spdlog::trace("bootstrap sink has been added");
    return std::make_unique<bootstrap_guard_t>(dist_sink, std::move(sink));
}

} // namespace gatewarden::utils
