// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#pragma once

#include "log.h"
#include "config/log.h"
#include <boost/outcome.hpp>
#include <spdlog/sinks/dist_sink.h>
#include "gatewarden-export.h"

namespace gatewarden::utils {

namespace outcome = boost::outcome_v2;

using dist_sink_t = std::shared_ptr<spdlog::sinks::dist_sink_mt>;
using sink_t = spdlog::sink_ptr;

/* keeps the temporal sink attached to the root logger until
 * the real sinks from the configuration are in place */
struct GATEWARDEN_API bootstrap_guard_t {
    bootstrap_guard_t(dist_sink_t dist_sink, sink_t sink);
    ~bootstrap_guard_t();

  private:
    dist_sink_t dist_sink;
    sink_t sink;
};
using bootstrap_guard_ptr_t = std::unique_ptr<bootstrap_guard_t>;

GATEWARDEN_API outcome::result<void> init_loggers(const config::log_configs_t &configs) noexcept;
GATEWARDEN_API void finalize_loggers() noexcept;

GATEWARDEN_API dist_sink_t create_root_logger() noexcept;
GATEWARDEN_API bootstrap_guard_ptr_t bootstrap(dist_sink_t &, spdlog::level::level_enum level) noexcept;

} // namespace gatewarden::utils
