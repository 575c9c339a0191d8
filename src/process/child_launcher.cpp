// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#include "child_launcher.h"
#include "command.h"
#include "utils/error_code.h"
#include "utils/log.h"
#include <boost/algorithm/string/trim.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/process/async.hpp>
#include <boost/process/async_pipe.hpp>
#include <boost/process/child.hpp>
#include <boost/process/io.hpp>
#include <cerrno>
#include <cstring>
#include <signal.h>

namespace gatewarden::process {

namespace asio = boost::asio;

namespace {

using strand_t = asio::io_context::strand;

// longer output without a newline is forwarded in pieces
static const constexpr std::size_t max_line = 64 * 1024;

struct child_process_t final : process_t {
    child_process_t(std::string_view name, std::uint32_t generation, ra::supervisor_asio_t &supervisor_,
                    process_observer_t &observer_) noexcept
        : process_t(name, generation), supervisor{supervisor_}, strand{supervisor.get_strand()},
          observer{&observer_}, out_pipe{strand.context()}, err_pipe{strand.context()} {
        log = utils::get_logger(fmt::format("gateway.{}", name));
    }

    ~child_process_t() {
        if (child.valid() && !finished) {
            child.detach();
        }
    }

    void spawn(const std::string &helper, const config::process_config_t &config) noexcept;
    void terminate() noexcept override;

    void read(bp::async_pipe &pipe, std::string &buff) noexcept;
    void on_read(std::string &buff, const sys::error_code &ec) noexcept;
    void on_exit(int exit_code, const std::error_code &ec) noexcept;
    void finish(int exit_code, const sys::error_code &ec) noexcept;
    void flush_line(std::string_view line) noexcept;

    ra::supervisor_asio_t &supervisor;
    strand_t &strand;
    process_observer_t *observer;
    utils::logger_t log;
    bp::async_pipe out_pipe;
    bp::async_pipe err_pipe;
    std::string out_buff;
    std::string err_buff;
    bp::child child;
    bool finished = false;
};

using child_process_ptr_t = boost::intrusive_ptr<child_process_t>;

} // namespace

void child_process_t::spawn(const std::string &helper, const config::process_config_t &config) noexcept {
    auto helper_path = resolve_command(helper);
    auto command_line = make_command_line(config);
    auto port = std::to_string(config.port);
    LOG_INFO(log, "spawning helper, port: {}, helper: {}, command: {}", config.port, helper_path, command_line);

    std::error_code ec;
    try {
        auto env = make_environment(config.env);
        auto args = std::vector<std::string>{"--stdio", command_line, "--port", port};
        child = bp::child(helper_path, bp::args(args), env, bp::std_in.close(), bp::std_out > out_pipe,
                          bp::std_err > err_pipe, strand.context(),
                          bp::on_exit([self = child_process_ptr_t(this)](int code, const std::error_code &ec) {
                              self->on_exit(code, ec);
                          }),
                          ec);
    } catch (const std::system_error &ex) {
        ec = ex.code();
    }

    if (ec) {
        auto self = child_process_ptr_t(this);
        asio::post(strand, [self = std::move(self), ec = utils::adapt(ec)]() { self->finish(-1, ec); });
        return;
    }

    read(out_pipe, out_buff);
    read(err_pipe, err_buff);
}

void child_process_t::read(bp::async_pipe &pipe, std::string &buff) noexcept {
    auto self = child_process_ptr_t(this);
    asio::async_read_until(pipe, asio::dynamic_buffer(buff, max_line), '\n',
                           [self = std::move(self), &buff, &pipe](const sys::error_code &ec, std::size_t bytes) {
                               if (!ec) {
                                   self->flush_line(std::string_view(buff).substr(0, bytes));
                                   buff.erase(0, bytes);
                                   self->read(pipe, buff);
                               } else if (ec == asio::error::not_found) {
                                   self->flush_line(buff);
                                   buff.clear();
                                   self->read(pipe, buff);
                               } else {
                                   self->on_read(buff, ec);
                               }
                           });
}

void child_process_t::on_read(std::string &buff, const sys::error_code &ec) noexcept {
    if (!buff.empty()) {
        flush_line(buff);
        buff.clear();
    }
    if (ec != asio::error::eof && ec != asio::error::operation_aborted && ec != asio::error::broken_pipe) {
        LOG_TRACE(log, "output reading error: {}", ec.message());
    }
}

void child_process_t::flush_line(std::string_view line) noexcept {
    auto copy = boost::algorithm::trim_copy(std::string(line));
    if (!copy.empty()) {
        LOG_DEBUG(log, "{}", copy);
    }
}

void child_process_t::on_exit(int exit_code, const std::error_code &ec) noexcept {
    auto self = child_process_ptr_t(this);
    asio::post(strand, [self = std::move(self), exit_code, ec = utils::adapt(ec)]() { self->finish(exit_code, ec); });
}

void child_process_t::finish(int exit_code, const sys::error_code &ec) noexcept {
    if (finished) {
        return;
    }
    finished = true;
    auto observer = this->observer;
    this->observer = nullptr;
    if (!observer) {
        return;
    }
    if (ec && !child.valid()) {
        observer->on_spawn_error(*this, ec);
    } else {
        observer->on_exit(*this, exit_code);
    }
    supervisor.do_process();
}

void child_process_t::terminate() noexcept {
    observer = nullptr;
    if (child.valid() && !finished) {
        auto pid = child.id();
        LOG_DEBUG(log, "sending SIGTERM to {}", pid);
        if (::kill(pid, SIGTERM) != 0) {
            LOG_WARN(log, "cannot terminate process {}: {}", pid, std::strerror(errno));
        }
        child.detach();
    }
}

child_launcher_t::child_launcher_t(ra::supervisor_asio_t &supervisor_, std::string helper_) noexcept
    : supervisor{supervisor_}, helper{std::move(helper_)} {}

process_ptr_t child_launcher_t::launch(std::string_view name, std::uint32_t generation,
                                       const config::process_config_t &config, process_observer_t &observer) noexcept {
    auto process = child_process_ptr_t(new child_process_t(name, generation, supervisor, observer));
    process->spawn(helper, config);
    return process;
}

} // namespace gatewarden::process
