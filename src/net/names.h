// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#pragma once

#include "gatewarden-export.h"

namespace gatewarden::net {

struct GATEWARDEN_API names {
    static const char *prober;
    static const char *gateways;
};

} // namespace gatewarden::net
