// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#pragma once

#include "launcher.h"
#include <rotor/asio.hpp>

namespace gatewarden::process {

namespace ra = rotor::asio;

/* spawns the helper as `<helper> --stdio "<command line>" --port <port>`,
 * with closed stdin and stdout/stderr forwarded line by line into the
 * "gateway.<name>" logger; events are delivered via the supervisor strand */
struct GATEWARDEN_API child_launcher_t : launcher_t {
    child_launcher_t(ra::supervisor_asio_t &supervisor, std::string helper) noexcept;

    process_ptr_t launch(std::string_view name, std::uint32_t generation, const config::process_config_t &config,
                         process_observer_t &observer) noexcept override;

  private:
    ra::supervisor_asio_t &supervisor;
    std::string helper;
};

} // namespace gatewarden::process
