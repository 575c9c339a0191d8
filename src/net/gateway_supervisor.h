// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#pragma once

#include "messages.h"
#include "config/gateway.h"
#include "config/supervisor.h"
#include "model/directory.h"
#include "model/gateway.h"
#include "process/launcher.h"
#include "utils/log.h"
#include <boost/filesystem/path.hpp>
#include <boost/outcome.hpp>
#include <rotor.hpp>
#include <optional>
#include <unordered_map>
#include "gatewarden-export.h"

namespace gatewarden {
namespace net {

namespace bfs = boost::filesystem;
namespace outcome = boost::outcome_v2;

struct gateway_supervisor_config_t : public r::actor_config_t {
    using r::actor_config_t::actor_config_t;
    config::gateway_configs_t gateways;
    config::supervisor_config_t supervisor_config;
    process::launcher_ptr_t launcher;
    bfs::path directory_file;
};

template <typename Actor> struct gateway_supervisor_config_builder_t : r::actor_config_builder_t<Actor> {
    using builder_t = typename Actor::template config_builder_t<Actor>;
    using parent_t = r::actor_config_builder_t<Actor>;
    using parent_t::parent_t;

    builder_t &&gateways(config::gateway_configs_t value) && noexcept {
        parent_t::config.gateways = std::move(value);
        return std::move(*static_cast<typename parent_t::builder_t *>(this));
    }

    builder_t &&supervisor_config(const config::supervisor_config_t &value) && noexcept {
        parent_t::config.supervisor_config = value;
        return std::move(*static_cast<typename parent_t::builder_t *>(this));
    }

    builder_t &&launcher(process::launcher_ptr_t value) && noexcept {
        parent_t::config.launcher = std::move(value);
        return std::move(*static_cast<typename parent_t::builder_t *>(this));
    }

    builder_t &&directory_file(const bfs::path &value) && noexcept {
        parent_t::config.directory_file = value;
        return std::move(*static_cast<typename parent_t::builder_t *>(this));
    }
};

/* owns the gateways: launches the owned ones, restarts them with exponential
 * backoff on exit, polls health of all of them and publishes the directory
 * of the reachable ones */
struct GATEWARDEN_API gateway_supervisor_t : public r::actor_base_t, private process::process_observer_t {
    using config_t = gateway_supervisor_config_t;
    template <typename Actor> using config_builder_t = gateway_supervisor_config_builder_t<Actor>;

    explicit gateway_supervisor_t(config_t &config);

    void configure(r::plugin::plugin_base_t &plugin) noexcept override;
    void on_start() noexcept override;
    void shutdown_start() noexcept override;

    model::directory_t get_directory() const noexcept;
    inline const model::gateways_map_t &get_gateways() const noexcept { return gateways; }
    inline bool is_ready() const noexcept { return ready; }

  private:
    using timer_option_t = std::optional<r::request_id_t>;
    using restart_timers_t = std::unordered_map<r::request_id_t, std::string>;
    using probes_t = std::unordered_map<r::request_id_t, std::string>;

    void on_exit(process::process_t &process, int exit_code) noexcept override;
    void on_spawn_error(process::process_t &process, const sys::error_code &ec) noexcept override;

    void on_process_exited(message::process_exited_t &message) noexcept;
    void on_spawn_failed(message::spawn_failed_t &message) noexcept;
    void on_probe(message::probe_response_t &message) noexcept;
    void on_directory_request(message::directory_request_t &message) noexcept;

    void on_grace_timer(r::request_id_t, bool cancelled) noexcept;
    void on_poll_timer(r::request_id_t, bool cancelled) noexcept;
    void on_restart_timer(r::request_id_t, bool cancelled) noexcept;

    void launch(model::gateway_t &gateway) noexcept;
    void schedule_restart(model::gateway_t &gateway) noexcept;
    void cancel_restart(const std::string &name) noexcept;
    void check_health() noexcept;
    void on_health_checked() noexcept;
    void report_summary() noexcept;
    outcome::result<void> write_directory() noexcept;

    utils::logger_t log;
    config::gateway_configs_t declarations;
    config::supervisor_config_t supervisor_config;
    process::launcher_ptr_t launcher;
    bfs::path directory_file;
    r::address_ptr_t prober;
    model::gateways_map_t gateways;
    timer_option_t grace_timer;
    timer_option_t poll_timer;
    restart_timers_t restart_timers;
    probes_t probes;
    std::optional<model::directory_t> published;
    bool ready = false;
};

} // namespace net
} // namespace gatewarden
