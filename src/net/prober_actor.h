// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#pragma once

#include "messages.h"
#include "utils/log.h"
#include "utils/uri.h"
#include <rotor.hpp>
#include <unordered_map>
#include "gatewarden-export.h"

namespace gatewarden {
namespace net {

struct prober_actor_config_t : public r::actor_config_t {
    using r::actor_config_t::actor_config_t;
    r::pt::time_duration probe_timeout;
};

template <typename Actor> struct prober_actor_config_builder_t : r::actor_config_builder_t<Actor> {
    using builder_t = typename Actor::template config_builder_t<Actor>;
    using parent_t = r::actor_config_builder_t<Actor>;
    using parent_t::parent_t;

    builder_t &&probe_timeout(const pt::time_duration &value) && noexcept {
        parent_t::config.probe_timeout = value;
        return std::move(*static_cast<typename parent_t::builder_t *>(this));
    }
};

/* answers probe requests: single HTTP GET, any response means healthy,
 * everything else (bad address, i/o error, timeout) means unhealthy */
struct GATEWARDEN_API prober_actor_t : public r::actor_base_t {
    using config_t = prober_actor_config_t;
    template <typename Actor> using config_builder_t = prober_actor_config_builder_t<Actor>;

    explicit prober_actor_t(config_t &config);

    void configure(r::plugin::plugin_base_t &plugin) noexcept override;
    void shutdown_start() noexcept override;

    struct probe_t;
    using probe_ptr_t = r::intrusive_ptr_t<probe_t>;

  private:
    using request_ptr_t = r::intrusive_ptr_t<message::probe_request_t>;
    using probes_t = std::unordered_map<r::request_id_t, probe_ptr_t>;
    using strand_t = asio::io_context::strand;

    void on_probe(message::probe_request_t &req) noexcept;
    void on_timer(r::request_id_t, bool cancelled) noexcept;

    void on_resolve(probe_ptr_t probe, const sys::error_code &ec, tcp::resolver::results_type results) noexcept;
    void on_connect(probe_ptr_t probe, const sys::error_code &ec) noexcept;
    void on_write(probe_ptr_t probe, const sys::error_code &ec) noexcept;
    void on_read(probe_ptr_t probe, const sys::error_code &ec) noexcept;
    void on_io_error(probe_ptr_t &probe, const sys::error_code &ec) noexcept;
    void finish(probe_t &probe, bool healthy) noexcept;

    utils::logger_t log;
    strand_t &strand;
    pt::time_duration probe_timeout;
    probes_t probes;
};

} // namespace net
} // namespace gatewarden
