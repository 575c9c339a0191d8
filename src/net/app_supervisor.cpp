// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#include "app_supervisor.h"
#include "gateway_supervisor.h"
#include "prober_actor.h"
#include "process/child_launcher.h"

using namespace gatewarden::net;

app_supervisor_t::app_supervisor_t(config_t &cfg)
    : parent_t(cfg), app_config{cfg.app_config}, gateways{std::move(cfg.gateways)} {}

void app_supervisor_t::configure(r::plugin::plugin_base_t &plugin) noexcept {
    parent_t::configure(plugin);
    plugin.with_casted<r::plugin::address_maker_plugin_t>([&](auto &p) {
        p.set_identity("gw.app", false);
        log = utils::get_logger(identity);
    });
}

void app_supervisor_t::on_start() noexcept {
    LOG_TRACE(log, "on_start");
    parent_t::on_start();

    auto &sc = app_config.supervisor_config;
    auto timeout = shutdown_timeout * 9 / 10;
    create_actor<prober_actor_t>()
        .probe_timeout(r::pt::milliseconds{sc.probe_timeout})
        .timeout(timeout)
        .escalate_failure()
        .finish();

    auto launcher = process::launcher_ptr_t(new process::child_launcher_t(*this, sc.helper));
    auto gateway_sup = create_actor<gateway_supervisor_t>()
                           .gateways(std::move(gateways))
                           .supervisor_config(sc)
                           .launcher(std::move(launcher))
                           .directory_file(app_config.directory_file)
                           .timeout(timeout)
                           .escalate_failure()
                           .finish();
    subscribe(&app_supervisor_t::on_gateways_ready, gateway_sup->get_address());
}

void app_supervisor_t::on_gateways_ready(message::gateways_ready_t &message) noexcept {
    auto &p = message.payload;
    LOG_INFO(log, "gateways are ready, {} of {} available", p.healthy, p.total);
}

void app_supervisor_t::on_child_shutdown(actor_base_t *actor) noexcept {
    parent_t::on_child_shutdown(actor);
    auto &reason = actor->get_shutdown_reason();
    LOG_TRACE(log, "on_child_shutdown, '{}' due to {} ", actor->get_identity(), reason->message());
}

void app_supervisor_t::shutdown_finish() noexcept {
    LOG_TRACE(log, "shutdown_finish");
    parent_t::shutdown_finish();
}
