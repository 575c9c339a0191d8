// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#include "gateway_supervisor.h"
#include "names.h"
#include "utils/error_code.h"
#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>

using namespace gatewarden::net;

namespace {
namespace resource {
r::plugin::resource_id_t timer = 0;
r::plugin::resource_id_t probe = 1;
} // namespace resource

static const auto probe_margin = r::pt::milliseconds{1000};
} // namespace

gateway_supervisor_t::gateway_supervisor_t(config_t &config)
    : r::actor_base_t{config}, declarations{std::move(config.gateways)},
      supervisor_config{config.supervisor_config}, launcher{std::move(config.launcher)},
      directory_file{config.directory_file} {}

void gateway_supervisor_t::configure(r::plugin::plugin_base_t &plugin) noexcept {
    r::actor_base_t::configure(plugin);
    plugin.with_casted<r::plugin::address_maker_plugin_t>([&](auto &p) {
        p.set_identity(names::gateways, false);
        log = utils::get_logger(identity);
    });
    plugin.with_casted<r::plugin::registry_plugin_t>([&](auto &p) {
        p.register_name(names::gateways, get_address());
        p.discover_name(names::prober, prober, true).link(false);
    });
    plugin.with_casted<r::plugin::starter_plugin_t>([&](auto &p) {
        p.subscribe_actor(&gateway_supervisor_t::on_process_exited);
        p.subscribe_actor(&gateway_supervisor_t::on_spawn_failed);
        p.subscribe_actor(&gateway_supervisor_t::on_probe);
        p.subscribe_actor(&gateway_supervisor_t::on_directory_request);
    });
}

void gateway_supervisor_t::on_start() noexcept {
    LOG_TRACE(log, "on_start");
    r::actor_base_t::on_start();

    for (auto &declaration : declarations) {
        gateways.put(new model::gateway_t(std::move(declaration)));
    }
    declarations.clear();

    if (gateways.empty()) {
        LOG_INFO(log, "no gateways declared");
        ready = true;
        send<payload::gateways_ready_t>(get_address(), std::size_t{0}, std::size_t{0});
        return;
    }

    for (auto &gateway : gateways) {
        if (!gateway->is_owned()) {
            continue;
        }
        if (auto &ec = gateway->get_misconfiguration(); ec) {
            LOG_ERROR(log, "gateway '{}' is misconfigured ({}), skipping", gateway->get_name(), ec.message());
            continue;
        }
        launch(*gateway);
    }

    auto timeout = r::pt::milliseconds{supervisor_config.startup_grace};
    grace_timer = start_timer(timeout, *this, &gateway_supervisor_t::on_grace_timer);
    resources->acquire(resource::timer);
    LOG_DEBUG(log, "{} gateway(s) declared, first health check in {}ms", gateways.size(),
              supervisor_config.startup_grace);
}

void gateway_supervisor_t::shutdown_start() noexcept {
    LOG_TRACE(log, "shutdown_start");
    if (grace_timer) {
        cancel_timer(*grace_timer);
    }
    if (poll_timer) {
        cancel_timer(*poll_timer);
    }
    auto timers = restart_timers;
    for (auto &it : timers) {
        cancel_timer(it.first);
    }

    for (auto &gateway : gateways) {
        if (auto process = gateway->release_process(); process) {
            LOG_INFO(log, "stopping gateway '{}'", gateway->get_name());
            process->terminate();
        }
    }
    gateways.clear();
    r::actor_base_t::shutdown_start();
}

void gateway_supervisor_t::launch(model::gateway_t &gateway) noexcept {
    auto generation = gateway.next_generation();
    auto &config = *gateway.get_process_config();
    LOG_DEBUG(log, "launching gateway '{}' (#{}) on port {}", gateway.get_name(), generation, config.port);
    gateway.assign(launcher->launch(gateway.get_name(), generation, config, *this));
}

void gateway_supervisor_t::on_exit(process::process_t &process, int exit_code) noexcept {
    send<payload::process_exited_t>(get_address(), process.get_name(), process.get_generation(), exit_code);
}

void gateway_supervisor_t::on_spawn_error(process::process_t &process, const sys::error_code &ec) noexcept {
    send<payload::spawn_failed_t>(get_address(), process.get_name(), process.get_generation(), ec);
}

void gateway_supervisor_t::on_process_exited(message::process_exited_t &message) noexcept {
    auto &p = message.payload;
    auto gateway = gateways.by_name(p.name);
    if (!gateway || !gateway->is_current(p.generation)) {
        LOG_DEBUG(log, "ignoring exit of stale instance #{} of '{}'", p.generation, p.name);
        return;
    }
    LOG_WARN(log, "gateway '{}' exited with code {}", p.name, p.exit_code);
    schedule_restart(*gateway);
}

void gateway_supervisor_t::on_spawn_failed(message::spawn_failed_t &message) noexcept {
    auto &p = message.payload;
    auto gateway = gateways.by_name(p.name);
    if (!gateway || !gateway->is_current(p.generation)) {
        LOG_DEBUG(log, "ignoring spawn failure of stale instance #{} of '{}'", p.generation, p.name);
        return;
    }
    LOG_ERROR(log, "gateway '{}' cannot be spawned: {}", p.name, p.ec.message());
    schedule_restart(*gateway);
}

void gateway_supervisor_t::schedule_restart(model::gateway_t &gateway) noexcept {
    auto &name = gateway.get_name();
    auto attempt = gateway.on_process_gone();
    auto delay = model::restart_delay(attempt, supervisor_config.restart_base, supervisor_config.restart_max);
    cancel_restart(name);

    auto timer_id = start_timer(r::pt::milliseconds{delay}, *this, &gateway_supervisor_t::on_restart_timer);
    resources->acquire(resource::timer);
    restart_timers.emplace(timer_id, name);
    LOG_INFO(log, "restarting gateway '{}' in {}ms (restart count: {})", name, delay, gateway.get_restart_count());
}

void gateway_supervisor_t::cancel_restart(const std::string &name) noexcept {
    for (auto &it : restart_timers) {
        if (it.second == name) {
            cancel_timer(it.first);
            return;
        }
    }
}

void gateway_supervisor_t::on_restart_timer(r::request_id_t timer_id, bool cancelled) noexcept {
    resources->release(resource::timer);
    auto it = restart_timers.find(timer_id);
    if (it == restart_timers.end()) {
        return;
    }
    auto name = std::move(it->second);
    restart_timers.erase(it);
    if (cancelled || state != r::state_t::OPERATIONAL) {
        return;
    }
    auto gateway = gateways.by_name(name);
    if (gateway && !gateway->get_process()) {
        launch(*gateway);
    }
}

void gateway_supervisor_t::on_grace_timer(r::request_id_t, bool cancelled) noexcept {
    resources->release(resource::timer);
    grace_timer.reset();
    if (!cancelled) {
        check_health();
    }
}

void gateway_supervisor_t::on_poll_timer(r::request_id_t, bool cancelled) noexcept {
    resources->release(resource::timer);
    poll_timer.reset();
    if (cancelled || state != r::state_t::OPERATIONAL) {
        return;
    }
    auto timeout = r::pt::milliseconds{supervisor_config.poll_interval};
    poll_timer = start_timer(timeout, *this, &gateway_supervisor_t::on_poll_timer);
    resources->acquire(resource::timer);
    check_health();
}

void gateway_supervisor_t::check_health() noexcept {
    if (!probes.empty()) {
        LOG_DEBUG(log, "previous health check is still in progress ({} left), skipping", probes.size());
        return;
    }
    LOG_TRACE(log, "checking health of {} gateway(s)", gateways.size());
    auto timeout = r::pt::milliseconds{supervisor_config.probe_timeout} + probe_margin;
    for (auto &gateway : gateways) {
        if (gateway->is_owned() && gateway->get_misconfiguration()) {
            continue;
        }
        auto request_id = request<payload::probe_request_t>(prober, gateway->get_address()).send(timeout);
        resources->acquire(resource::probe);
        probes.emplace(request_id, gateway->get_name());
    }
    if (probes.empty()) {
        on_health_checked();
    }
}

void gateway_supervisor_t::on_probe(message::probe_response_t &message) noexcept {
    resources->release(resource::probe);
    auto it = probes.find(message.payload.req->payload.id);
    if (it == probes.end()) {
        return;
    }
    auto name = std::move(it->second);
    probes.erase(it);

    auto &ee = message.payload.ee;
    auto healthy = !ee && message.payload.res.healthy;
    if (ee) {
        LOG_DEBUG(log, "probe of '{}' failed: {}", name, ee->message());
    }

    auto gateway = gateways.by_name(name);
    if (gateway) {
        using T = model::transition_t;
        auto transition = gateway->update_health(healthy);
        if (transition == T::became_healthy) {
            LOG_INFO(log, "gateway '{}' is healthy", name);
        } else if (transition == T::became_unhealthy) {
            if (gateway->is_optional()) {
                LOG_WARN(log, "optional gateway '{}' became unhealthy", name);
            } else {
                LOG_ERROR(log, "gateway '{}' became unhealthy", name);
            }
        }
    }

    if (probes.empty() && state == r::state_t::OPERATIONAL) {
        on_health_checked();
    }
}

void gateway_supervisor_t::on_health_checked() noexcept {
    if (!ready) {
        ready = true;
        report_summary();
        auto timeout = r::pt::milliseconds{supervisor_config.poll_interval};
        poll_timer = start_timer(timeout, *this, &gateway_supervisor_t::on_poll_timer);
        resources->acquire(resource::timer);
    }
    if (auto r = write_directory(); !r) {
        LOG_WARN(log, "cannot publish directory into {}: {}", directory_file.string(), r.error().message());
    }
}

void gateway_supervisor_t::report_summary() noexcept {
    std::size_t healthy = 0;
    for (auto &gateway : gateways) {
        auto &name = gateway->get_name();
        if (gateway->is_healthy()) {
            ++healthy;
            LOG_INFO(log, "gateway '{}' started, address: {}", name, gateway->get_address());
        } else if (gateway->is_optional()) {
            LOG_WARN(log, "optional gateway '{}' is not available", name);
        } else {
            LOG_ERROR(log, "gateway '{}' failed to start", name);
        }
    }
    send<payload::gateways_ready_t>(get_address(), healthy, gateways.size());
}

model::directory_t gateway_supervisor_t::get_directory() const noexcept {
    return model::make_directory(gateways, supervisor_config.host_alias);
}

void gateway_supervisor_t::on_directory_request(message::directory_request_t &message) noexcept {
    LOG_TRACE(log, "on_directory_request");
    reply_to(message, get_directory());
}

auto gateway_supervisor_t::write_directory() noexcept -> outcome::result<void> {
    if (directory_file.empty()) {
        return outcome::success();
    }
    auto directory = get_directory();
    if (published && *published == directory) {
        return outcome::success();
    }

    auto tmp_path = directory_file;
    tmp_path += ".tmp";
    {
        auto out = bfs::ofstream(tmp_path, std::ios::binary | std::ios::trunc);
        out << model::serialize(directory);
        out.close();
        if (!out) {
            return utils::make_error_code(utils::error_code_t::directory_write_failure);
        }
    }

    sys::error_code ec;
    bfs::rename(tmp_path, directory_file, ec);
    if (ec) {
        return ec;
    }
    LOG_DEBUG(log, "published {} gateway(s) into {}", directory.size(), directory_file.string());
    published = std::move(directory);
    return outcome::success();
}
