// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#include "names.h"

using namespace gatewarden::net;

const char *names::prober = "gw.prober";
const char *names::gateways = "gw.supervisor";
