// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#include "prober_actor.h"
#include "names.h"
#include "constants.h"
#include "utils/error_code.h"

using namespace gatewarden::net;

namespace {
namespace resource {
r::plugin::resource_id_t io = 0;
r::plugin::resource_id_t timer = 1;
} // namespace resource
} // namespace

struct prober_actor_t::probe_t : r::arc_base_t<probe_t> {
    using parser_t = http::response_parser<http::empty_body>;

    probe_t(request_ptr_t request_, utils::uri_ptr_t url_, strand_t &strand) noexcept
        : request{std::move(request_)}, url{std::move(url_)}, resolver{strand.context()}, sock{strand.context()} {}

    void cancel() noexcept {
        sys::error_code ec;
        resolver.cancel();
        if (sock.is_open()) {
            sock.cancel(ec);
            sock.close(ec);
        }
    }

    request_ptr_t request;
    utils::uri_ptr_t url;
    tcp::resolver resolver;
    tcp::socket sock;
    http::request<http::empty_body> http_request;
    boost::beast::flat_buffer rx_buff;
    parser_t parser;
    r::request_id_t timer_id = 0;
    bool done = false;
};

prober_actor_t::prober_actor_t(config_t &config)
    : r::actor_base_t{config}, strand{static_cast<ra::supervisor_asio_t *>(config.supervisor)->get_strand()},
      probe_timeout{config.probe_timeout} {}

void prober_actor_t::configure(r::plugin::plugin_base_t &plugin) noexcept {
    r::actor_base_t::configure(plugin);
    plugin.with_casted<r::plugin::address_maker_plugin_t>([&](auto &p) {
        p.set_identity(names::prober, false);
        log = utils::get_logger(identity);
    });
    plugin.with_casted<r::plugin::registry_plugin_t>([&](auto &p) { p.register_name(names::prober, get_address()); });
    plugin.with_casted<r::plugin::starter_plugin_t>([&](auto &p) { p.subscribe_actor(&prober_actor_t::on_probe); });
}

void prober_actor_t::on_probe(message::probe_request_t &req) noexcept {
    auto &address = req.payload.request_payload.url;
    LOG_TRACE(log, "on_probe, url = {}", address);

    if (state != r::state_t::OPERATIONAL) {
        reply_to(req, false);
        return;
    }

    // https endpoints get the same plain GET: only reachability of the port matters here,
    // a TLS server answering with an alert is reported as not reachable
    auto url = utils::parse(address);
    if (!url || (url->scheme() != "http" && url->scheme() != "https") || !url->has_port()) {
        LOG_DEBUG(log, "cannot probe malformed address '{}'", address);
        reply_to(req, false);
        return;
    }

    auto probe = probe_ptr_t(new probe_t(&req, std::move(url), strand));
    auto &http_req = probe->http_request;
    http_req.method(http::verb::get);
    http_req.version(11);
    http_req.target(probe->url->target());
    http_req.set(http::field::host, std::string(probe->url->encoded_host_and_port()));
    http_req.set(http::field::user_agent, constants::client_name);
    http_req.set(http::field::connection, "close");

    auto timer_id = start_timer(probe_timeout, *this, &prober_actor_t::on_timer);
    resources->acquire(resource::timer);
    probe->timer_id = timer_id;
    probes.emplace(timer_id, probe);

    auto host = std::string(probe->url->host());
    auto port = std::string(probe->url->port());
    auto self = r::intrusive_ptr_t<prober_actor_t>(this);
    probe->resolver.async_resolve(host, port, [self, probe](const sys::error_code &ec, auto results) mutable {
        self->strand.post([self, probe = std::move(probe), ec, results = std::move(results)]() mutable {
            self->on_resolve(std::move(probe), ec, std::move(results));
            self->supervisor->do_process();
        });
    });
    resources->acquire(resource::io);
}

void prober_actor_t::on_resolve(probe_ptr_t probe, const sys::error_code &ec,
                                tcp::resolver::results_type results) noexcept {
    resources->release(resource::io);
    if (ec) {
        return on_io_error(probe, ec);
    }
    if (probe->done) {
        return;
    }
    auto self = r::intrusive_ptr_t<prober_actor_t>(this);
    asio::async_connect(probe->sock, results, [self, probe](const sys::error_code &ec, const auto &) mutable {
        self->strand.post([self, probe = std::move(probe), ec]() mutable {
            self->on_connect(std::move(probe), ec);
            self->supervisor->do_process();
        });
    });
    resources->acquire(resource::io);
}

void prober_actor_t::on_connect(probe_ptr_t probe, const sys::error_code &ec) noexcept {
    resources->release(resource::io);
    if (ec) {
        return on_io_error(probe, ec);
    }
    if (probe->done) {
        return;
    }
    auto self = r::intrusive_ptr_t<prober_actor_t>(this);
    http::async_write(probe->sock, probe->http_request, [self, probe](const sys::error_code &ec, std::size_t) mutable {
        self->strand.post([self, probe = std::move(probe), ec]() mutable {
            self->on_write(std::move(probe), ec);
            self->supervisor->do_process();
        });
    });
    resources->acquire(resource::io);
}

void prober_actor_t::on_write(probe_ptr_t probe, const sys::error_code &ec) noexcept {
    resources->release(resource::io);
    if (ec) {
        return on_io_error(probe, ec);
    }
    if (probe->done) {
        return;
    }
    auto self = r::intrusive_ptr_t<prober_actor_t>(this);
    auto &p = *probe;
    http::async_read_header(p.sock, p.rx_buff, p.parser, [self, probe](const sys::error_code &ec, std::size_t) mutable {
        self->strand.post([self, probe = std::move(probe), ec]() mutable {
            self->on_read(std::move(probe), ec);
            self->supervisor->do_process();
        });
    });
    resources->acquire(resource::io);
}

void prober_actor_t::on_read(probe_ptr_t probe, const sys::error_code &ec) noexcept {
    resources->release(resource::io);
    if (ec) {
        return on_io_error(probe, ec);
    }
    if (probe->done) {
        return;
    }
    auto status = probe->parser.get().result_int();
    LOG_TRACE(log, "{} responded with {}", probe->request->payload.request_payload.url, status);
    finish(*probe, true);
}

void prober_actor_t::on_io_error(probe_ptr_t &probe, const sys::error_code &ec) noexcept {
    if (probe->done) {
        return;
    }
    LOG_DEBUG(log, "{} is not reachable: {}", probe->request->payload.request_payload.url, ec.message());
    finish(*probe, false);
}

void prober_actor_t::on_timer(r::request_id_t timer_id, bool cancelled) noexcept {
    resources->release(resource::timer);
    auto it = probes.find(timer_id);
    if (it == probes.end()) {
        return;
    }
    auto probe = it->second;
    probes.erase(it);
    if (!cancelled) {
        on_io_error(probe, utils::make_error_code(utils::error_code_t::timed_out));
    }
}

void prober_actor_t::finish(probe_t &probe, bool healthy) noexcept {
    probe.done = true;
    reply_to(*probe.request, healthy);
    probe.cancel();
    auto it = probes.find(probe.timer_id);
    if (it != probes.end()) {
        cancel_timer(probe.timer_id);
    }
}

void prober_actor_t::shutdown_start() noexcept {
    LOG_TRACE(log, "shutdown_start, {} probe(s) in progress", probes.size());
    auto copy = probes;
    for (auto &it : copy) {
        auto &probe = *it.second;
        if (!probe.done) {
            finish(probe, false);
        }
    }
    r::actor_base_t::shutdown_start();
}
