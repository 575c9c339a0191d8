// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#pragma once

#include <boost/asio.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <rotor/asio.hpp>

#include <cstdint>
#include <string>

#include "model/directory.h"

namespace gatewarden::net {

namespace r = rotor;
namespace ra = rotor::asio;
namespace asio = boost::asio;
namespace pt = boost::posix_time;
namespace http = boost::beast::http;
namespace sys = boost::system;

using tcp = asio::ip::tcp;

namespace payload {

struct probe_response_t {
    bool healthy;
};

/* single bounded reachability check of the address */
struct probe_request_t {
    using response_t = probe_response_t;
    std::string url;
};

struct process_exited_t {
    std::string name;
    std::uint32_t generation;
    int exit_code;
};

struct spawn_failed_t {
    std::string name;
    std::uint32_t generation;
    sys::error_code ec;
};

struct directory_response_t {
    model::directory_t directory;
};

struct directory_request_t {
    using response_t = directory_response_t;
};

/* the first health pass after startup grace is complete */
struct gateways_ready_t {
    std::size_t healthy;
    std::size_t total;
};

} // namespace payload

namespace message {

using probe_request_t = r::request_traits_t<payload::probe_request_t>::request::message_t;
using probe_response_t = r::request_traits_t<payload::probe_request_t>::response::message_t;

using directory_request_t = r::request_traits_t<payload::directory_request_t>::request::message_t;
using directory_response_t = r::request_traits_t<payload::directory_request_t>::response::message_t;

using process_exited_t = r::message_t<payload::process_exited_t>;
using spawn_failed_t = r::message_t<payload::spawn_failed_t>;
using gateways_ready_t = r::message_t<payload::gateways_ready_t>;

} // namespace message

} // namespace gatewarden::net
