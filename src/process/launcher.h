// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <boost/intrusive_ptr.hpp>
#include <boost/smart_ptr/intrusive_ref_counter.hpp>
#include <boost/system/error_code.hpp>
#include "config/gateway.h"
#include "gatewarden-export.h"

namespace gatewarden::process {

namespace sys = boost::system;

struct process_t;
using process_ptr_t = boost::intrusive_ptr<process_t>;

/* single launched instance of the helper; it is never reused */
struct GATEWARDEN_API process_t : boost::intrusive_ref_counter<process_t, boost::thread_unsafe_counter> {
    process_t(std::string_view name, std::uint32_t generation) noexcept;
    virtual ~process_t() = default;

    /* graceful termination request (SIGTERM), no events are
     * delivered to the observer afterwards */
    virtual void terminate() noexcept = 0;

    inline const std::string &get_name() const noexcept { return name; }
    inline std::uint32_t get_generation() const noexcept { return generation; }

  protected:
    std::string name;
    std::uint32_t generation;
};

/* receives exactly one terminal event per process; events are never
 * delivered from within launch() */
struct process_observer_t {
    virtual ~process_observer_t() = default;
    virtual void on_exit(process_t &process, int exit_code) noexcept = 0;
    virtual void on_spawn_error(process_t &process, const sys::error_code &ec) noexcept = 0;
};

struct launcher_t;
using launcher_ptr_t = boost::intrusive_ptr<launcher_t>;

struct GATEWARDEN_API launcher_t : boost::intrusive_ref_counter<launcher_t, boost::thread_unsafe_counter> {
    virtual ~launcher_t() = default;

    virtual process_ptr_t launch(std::string_view name, std::uint32_t generation,
                                 const config::process_config_t &config, process_observer_t &observer) noexcept = 0;
};

} // namespace gatewarden::process
