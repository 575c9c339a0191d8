// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#include "test-utils.h"
#include "access.h"

#include "net/prober_actor.h"
#include "net/names.h"
#include <boost/beast/core/bind_handler.hpp>
#include <optional>

using namespace std::chrono_literals;

using namespace gatewarden;
using namespace gatewarden::test;
using namespace gatewarden::net;

using finish_callback_t = std::function<void()>;
using response_callback_t = std::function<void(message::probe_response_t &message)>;

auto timeout = r::pt::time_duration{r::pt::millisec{500}};
auto probe_timeout = r::pt::time_duration{r::pt::millisec{100}};
auto host = "127.0.0.1";

struct supervisor_t : ra::supervisor_asio_t {
    using ra::supervisor_asio_t::supervisor_asio_t;

    void configure(r::plugin::plugin_base_t &plugin) noexcept override {
        ra::supervisor_asio_t::configure(plugin);
        plugin.with_casted<r::plugin::address_maker_plugin_t>([&](auto &p) {
            p.set_identity("supervisor", false);
            log = utils::get_logger(identity);
        });
    }

    void shutdown_finish() noexcept override {
        LOG_DEBUG(log, "shutdown_finish()");
        ra::supervisor_asio_t::shutdown_finish();
        if (finish_callback) {
            finish_callback();
        }
    }

    utils::logger_t log;
    finish_callback_t finish_callback;
};
using supervisor_ptr_t = r::intrusive_ptr_t<supervisor_t>;

struct client_actor_t : r::actor_base_t {
    using r::actor_base_t::actor_base_t;

    void configure(r::plugin::plugin_base_t &plugin) noexcept override {
        r::actor_base_t::configure(plugin);
        plugin.with_casted<r::plugin::address_maker_plugin_t>([&](auto &p) {
            p.set_identity("client", false);
            log = utils::get_logger(identity);
        });
        plugin.with_casted<r::plugin::registry_plugin_t>(
            [&](auto &p) { p.discover_name(names::prober, prober, true).link(true); });
        plugin.with_casted<r::plugin::starter_plugin_t>(
            [&](auto &p) { p.subscribe_actor(&client_actor_t::on_response); });
    }

    void probe(std::string url) { request<payload::probe_request_t>(prober, std::move(url)).send(timeout); }

    void on_response(message::probe_response_t &message) noexcept {
        LOG_DEBUG(log, "on_response");
        ++responses;
        if (response_callback) {
            response_callback(message);
        }
    }

    r::address_ptr_t prober;
    utils::logger_t log;
    response_callback_t response_callback;
    int responses = 0;
};
using client_actor_ptr_t = r::intrusive_ptr_t<client_actor_t>;

struct fixture_t {
    using acceptor_t = asio::ip::tcp::acceptor;
    using response_opt_t = std::optional<http::response<http::string_body>>;

    fixture_t() noexcept : ctx(io_ctx), acceptor(io_ctx), peer_sock(io_ctx) {
        test::init_logging();
        log = utils::get_logger("fixture");
    }

    virtual ~fixture_t() = default;

    void run() noexcept {
        auto strand = std::make_shared<asio::io_context::strand>(io_ctx);
        sup = ctx.create_supervisor<supervisor_t>().strand(strand).timeout(timeout).create_registry().finish();
        sup->finish_callback = [&]() { finish(); };
        sup->start();
        sup->do_process();
        CHECK(static_cast<r::actor_base_t *>(sup.get())->access<to::state>() == r::state_t::OPERATIONAL);

        prober_actor = sup->create_actor<prober_actor_t>().probe_timeout(probe_timeout).timeout(timeout).finish();
        sup->do_process();
        CHECK(static_cast<r::actor_base_t *>(prober_actor.get())->access<to::state>() == r::state_t::OPERATIONAL);

        auto ep = asio::ip::tcp::endpoint(asio::ip::make_address(host), 0);
        acceptor.open(ep.protocol());
        acceptor.bind(ep);
        acceptor.listen();
        listening_ep = acceptor.local_endpoint();
        LOG_INFO(log, "acceptor is listening on {}:{}", listening_ep.address().to_string(), listening_ep.port());
        acceptor.async_accept(peer_sock, [this](auto ec) { on_accept(ec); });

        client_actor = sup->create_actor<client_actor_t>().timeout(timeout).finish();
        client_actor->response_callback = [this](auto &res) { on_response(res); };
        io_ctx.run_for(1ms);
        sup->do_process();
        CHECK(static_cast<r::actor_base_t *>(client_actor.get())->access<to::state>() == r::state_t::OPERATIONAL);

        main();

        sup->do_shutdown();
        sup->do_process();
        io_ctx.run();

        CHECK(static_cast<r::actor_base_t *>(prober_actor.get())->access<to::state>() == r::state_t::SHUT_DOWN);
        CHECK(static_cast<r::actor_base_t *>(sup.get())->access<to::state>() == r::state_t::SHUT_DOWN);
    }

    std::string make_url(std::string_view path, std::uint16_t port) {
        return fmt::format("http://{}:{}{}", host, port, path);
    }

    std::string make_url(std::string_view path) { return make_url(path, listening_ep.port()); }

    /* probes the url and waits for the single response */
    void probe(std::string url) {
        client_actor->probe(std::move(url));
        sup->do_process();
        while (!client_actor->responses) {
            if (!io_ctx.run_one_for(1s)) {
                FAIL("no response");
                return;
            }
        }
    }

    virtual void finish() {
        LOG_DEBUG(log, "finish");
        auto ec = sys::error_code();
        acceptor.cancel(ec);
        if (ec) {
            LOG_DEBUG(log, "error cancelling acceptor: {}", ec.message());
        }
        peer_sock.close(ec);
        if (ec) {
            LOG_DEBUG(log, "error closing peer: {}", ec.message());
        }
    }

    virtual void main() noexcept {}

    virtual void on_accept(const sys::error_code &ec) noexcept {
        if (ec) {
            LOG_DEBUG(log, "on_accept, ec: {}", ec.message());
            return;
        }
        LOG_INFO(log, "on_accept");
        auto handler = boost::beast::bind_front_handler(&fixture_t::on_read, this);
        http::async_read(peer_sock, rx_buff, request, std::move(handler));
    }

    virtual void on_read(const sys::error_code &ec, std::size_t bytes) noexcept {
        if (ec) {
            LOG_DEBUG(log, "on_read, ec: {}", ec.message());
            return;
        }
        auto target = request.target();
        LOG_DEBUG(log, "on_read, {} bytes, target = {}", bytes, std::string_view(target.data(), target.size()));
        CHECK(request.method() == http::verb::get);
        auto res_opt = handle_request();
        if (res_opt) {
            response = std::move(*res_opt);
            http::async_write(peer_sock, *response, [this](auto ec, auto bytes) { on_write(ec, bytes); });
        }
    }

    virtual void on_write(const sys::error_code &ec, std::size_t bytes) noexcept {
        if (ec) {
            LOG_DEBUG(log, "on_write, ec: {}", ec.message());
            return;
        }
        LOG_DEBUG(log, "on_write, {} bytes", bytes);
    }

    virtual response_opt_t handle_request() noexcept {
        http::response<http::string_body> res{http::status::ok, request.version()};
        res.set(http::field::content_type, "text/event-stream");
        res.keep_alive(false);
        res.body() = "event: endpoint\ndata: /message\n\n";
        res.prepare_payload();
        return res;
    }

    virtual void on_response(message::probe_response_t &message) noexcept {
        CHECK(!message.payload.ee);
        healthy = !message.payload.ee && message.payload.res.healthy;
    }

    asio::io_context io_ctx{1};
    ra::system_context_asio_t ctx;
    acceptor_t acceptor;
    supervisor_ptr_t sup;
    asio::ip::tcp::endpoint listening_ep;
    utils::logger_t log;
    asio::ip::tcp::socket peer_sock;
    r::actor_ptr_t prober_actor;
    client_actor_ptr_t client_actor;
    http::request<http::string_body> request;
    response_opt_t response;
    boost::beast::flat_buffer rx_buff;
    std::optional<bool> healthy;
};

void test_start_and_shutdown() {
    struct F : fixture_t {
        void main() noexcept override {}
    };
    F().run();
}

void test_healthy() {
    struct F : fixture_t {
        void main() noexcept override {
            probe(make_url("/sse"));
            REQUIRE(healthy);
            CHECK(*healthy);
            REQUIRE(request.target() == "/sse");
            auto host_header = request[http::field::host];
            auto expected_host = fmt::format("{}:{}", host, listening_ep.port());
            CHECK(std::string(host_header.data(), host_header.size()) == expected_host);
        }
    };
    F().run();
}

void test_error_status_is_healthy() {
    struct F : fixture_t {
        response_opt_t handle_request() noexcept override {
            http::response<http::string_body> res{http::status::service_unavailable, request.version()};
            res.keep_alive(false);
            res.prepare_payload();
            return res;
        }

        void main() noexcept override {
            probe(make_url("/sse?session=1"));
            REQUIRE(healthy);
            CHECK(*healthy);
            CHECK(request.target() == "/sse?session=1");
        }
    };
    F().run();
}

void test_connection_refused() {
    struct F : fixture_t {
        void main() noexcept override {
            auto sock = asio::ip::tcp::acceptor(io_ctx, asio::ip::tcp::endpoint(asio::ip::make_address(host), 0));
            auto port = sock.local_endpoint().port();
            sock.close();
            probe(make_url("/sse", port));
            REQUIRE(healthy);
            CHECK(!*healthy);
        }
    };
    F().run();
}

void test_malformed_address() {
    struct F : fixture_t {
        void main() noexcept override {
            probe("definitely not an url");
            REQUIRE(healthy);
            CHECK(!*healthy);
        }
    };
    F().run();
}

void test_no_response() {
    struct F : fixture_t {
        response_opt_t handle_request() noexcept override { return {}; }

        void main() noexcept override {
            probe(make_url("/sse"));
            REQUIRE(healthy);
            CHECK(!*healthy);
        }
    };
    F().run();
}

int _init() {
    REGISTER_TEST_CASE(test_start_and_shutdown, "test_start_and_shutdown", "[net]");
    REGISTER_TEST_CASE(test_healthy, "test_healthy", "[net]");
    REGISTER_TEST_CASE(test_error_status_is_healthy, "test_error_status_is_healthy", "[net]");
    REGISTER_TEST_CASE(test_connection_refused, "test_connection_refused", "[net]");
    REGISTER_TEST_CASE(test_malformed_address, "test_malformed_address", "[net]");
    REGISTER_TEST_CASE(test_no_response, "test_no_response", "[net]");
    return 1;
}

static int v = _init();
