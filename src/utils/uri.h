// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#pragma once

#include "gatewarden-export.h"
#include <string>
#include <string_view>
#include <boost/url.hpp>
#include <boost/intrusive_ptr.hpp>
#include <boost/smart_ptr/intrusive_ref_counter.hpp>

namespace gatewarden::utils {

struct uri_t;
using uri_ptr_t = boost::intrusive_ptr<uri_t>;

/* absolute url; for http(s) schemes the port is always present */
struct GATEWARDEN_API uri_t : boost::intrusive_ref_counter<uri_t, boost::thread_unsafe_counter>, boost::urls::url {
    using parent_t = boost::urls::url;
    uri_t(boost::urls::url_view view);

    /* path + query, suitable for the http request line */
    std::string target() const;
};

GATEWARDEN_API uri_ptr_t parse(std::string_view string) noexcept;

/* replaces host component of the url if it is equal to `from`, leaving
 * all other components intact; unparseable input is returned as is */
GATEWARDEN_API std::string rewrite_host(std::string_view url, std::string_view from, std::string_view to) noexcept;

} // namespace gatewarden::utils
