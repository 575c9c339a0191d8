// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#pragma once

#include "config/main.h"
#include "config/gateway.h"
#include "utils/log.h"
#include "messages.h"
#include <boost/asio.hpp>
#include <rotor/asio.hpp>
#include "gatewarden-export.h"

namespace gatewarden {
namespace net {

struct app_supervisor_config_t : ra::supervisor_config_asio_t {
    config::main_t app_config;
    config::gateway_configs_t gateways;
};

template <typename Supervisor>
struct app_supervisor_config_builder_t : ra::supervisor_config_asio_builder_t<Supervisor> {
    using builder_t = typename Supervisor::template config_builder_t<Supervisor>;
    using parent_t = ra::supervisor_config_asio_builder_t<Supervisor>;
    using parent_t::parent_t;

    builder_t &&app_config(const config::main_t &value) && noexcept {
        parent_t::config.app_config = value;
        return std::move(*static_cast<typename parent_t::builder_t *>(this));
    }

    builder_t &&gateways(config::gateway_configs_t value) && noexcept {
        parent_t::config.gateways = std::move(value);
        return std::move(*static_cast<typename parent_t::builder_t *>(this));
    }
};

/* root of the daemon: hosts the prober and the gateway supervisor */
struct GATEWARDEN_API app_supervisor_t : ra::supervisor_asio_t {
    using parent_t = ra::supervisor_asio_t;
    using config_t = app_supervisor_config_t;
    template <typename Actor> using config_builder_t = app_supervisor_config_builder_t<Actor>;

    explicit app_supervisor_t(config_t &config);
    void configure(r::plugin::plugin_base_t &plugin) noexcept override;
    void on_start() noexcept override;
    void on_child_shutdown(actor_base_t *actor) noexcept override;
    void shutdown_finish() noexcept override;

  private:
    void on_gateways_ready(message::gateways_ready_t &message) noexcept;

    utils::logger_t log;
    config::main_t app_config;
    config::gateway_configs_t gateways;
};

} // namespace net
} // namespace gatewarden
