// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#include "uri.h"

namespace gatewarden::utils {

uri_t::uri_t(boost::urls::url_view view) : parent_t(view) {
    if (!has_port()) {
        if (scheme() == "http") {
            set_port_number(80);
        } else if (scheme() == "https") {
            set_port_number(443);
        }
    }
}

std::string uri_t::target() const {
    auto r = std::string(encoded_path());
    if (r.empty()) {
        r = "/";
    }
    if (has_query()) {
        r += "?";
        r += encoded_query();
    }
    return r;
}

uri_ptr_t parse(std::string_view str) noexcept {
    auto result = boost::urls::parse_uri(str);
    if (result && result.value().has_authority() && !result.value().host().empty()) {
        return new uri_t(result.value());
    }
    return {};
}

std::string rewrite_host(std::string_view str, std::string_view from, std::string_view to) noexcept {
    auto result = boost::urls::parse_uri(str);
    if (!result) {
        return std::string(str);
    }
    auto url = boost::urls::url(result.value());
    if (url.encoded_host() != from) {
        return std::string(str);
    }
    url.set_host(to);
    return std::string(url.buffer());
}

} // namespace gatewarden::utils
