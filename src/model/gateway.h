// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <boost/intrusive_ptr.hpp>
#include <boost/smart_ptr/intrusive_ref_counter.hpp>
#include <boost/multi_index_container.hpp>
#include <boost/multi_index/hashed_index.hpp>
#include <boost/multi_index/global_fun.hpp>
#include <boost/multi_index/sequenced_index.hpp>
#include <boost/system/error_code.hpp>
#include "config/gateway.h"
#include "process/launcher.h"
#include "gatewarden-export.h"

namespace gatewarden::model {

namespace sys = boost::system;

enum class health_t { unknown, healthy, unhealthy };

enum class transition_t { none, became_healthy, became_unhealthy };

/* min(base * 2^attempt, max) */
GATEWARDEN_API std::uint32_t restart_delay(std::uint32_t attempt, std::uint32_t base, std::uint32_t max) noexcept;

struct gateway_t;
using gateway_ptr_t = boost::intrusive_ptr<gateway_t>;

struct GATEWARDEN_API gateway_t : boost::intrusive_ref_counter<gateway_t, boost::thread_unsafe_counter> {
    explicit gateway_t(config::gateway_config_t config) noexcept;

    inline const std::string &get_name() const noexcept { return config.name; }
    inline const config::gateway_config_t &get_config() const noexcept { return config; }
    inline bool is_optional() const noexcept { return config.optional; }
    inline bool is_owned() const noexcept { return std::holds_alternative<config::process_config_t>(config.kind); }
    const config::process_config_t *get_process_config() const noexcept;

    /* missing command or port of owned gateway */
    inline const sys::error_code &get_misconfiguration() const noexcept { return misconfiguration; }

    /* loopback "/sse" endpoint for owned gateways, declared url otherwise */
    inline const std::string &get_address() const noexcept { return address; }

    inline health_t get_health() const noexcept { return health; }
    inline bool is_healthy() const noexcept { return health == health_t::healthy; }
    transition_t update_health(bool healthy) noexcept;

    inline std::uint32_t get_restart_count() const noexcept { return restart_count; }

    inline const process::process_ptr_t &get_process() const noexcept { return process; }
    inline std::uint32_t get_generation() const noexcept { return generation; }
    std::uint32_t next_generation() noexcept;
    void assign(process::process_ptr_t process) noexcept;
    bool is_current(std::uint32_t generation) const noexcept;

    /* clears process handle and marks unhealthy; returns the attempt number
     * which should be used for the restart delay */
    std::uint32_t on_process_gone() noexcept;

    /* drops the handle without waiting, e.g. on shutdown */
    process::process_ptr_t release_process() noexcept;

  private:
    config::gateway_config_t config;
    std::string address;
    sys::error_code misconfiguration;
    health_t health = health_t::unknown;
    std::uint32_t restart_count = 0;
    std::uint32_t generation = 0;
    process::process_ptr_t process;
};

namespace details {

namespace mi = boost::multi_index;

inline const std::string &get_gateway_name(const gateway_ptr_t &item) noexcept { return item->get_name(); }

struct hash_op_t {
    std::size_t operator()(std::string_view v) const noexcept { return std::hash<std::string_view>()(v); }
};

struct eq_op_t {
    bool operator()(std::string_view s1, std::string_view s2) const noexcept { return s1 == s2; }
};

// clang-format off
using gateways_container_t = mi::multi_index_container<
    gateway_ptr_t,
    mi::indexed_by<
        mi::sequenced<>,
        mi::hashed_unique<
            mi::global_fun<const gateway_ptr_t &, const std::string &, &get_gateway_name>,
            hash_op_t,
            eq_op_t
        >
    >
>;
// clang-format on

} // namespace details

/* gateways in declaration order, with lookup by name */
struct GATEWARDEN_API gateways_map_t : details::gateways_container_t {
    using parent_t = details::gateways_container_t;

    bool put(gateway_ptr_t item) noexcept;
    gateway_ptr_t by_name(std::string_view name) const noexcept;
};

} // namespace gatewarden::model
