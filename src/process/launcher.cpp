// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#include "launcher.h"

namespace gatewarden::process {

process_t::process_t(std::string_view name_, std::uint32_t generation_) noexcept
    : name{name_}, generation{generation_} {}

} // namespace gatewarden::process
