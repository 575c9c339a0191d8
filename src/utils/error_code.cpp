// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#include "error_code.h"
#include <map>

namespace gatewarden::utils::detail {

const char *error_code_category::name() const noexcept { return "gatewarden_error"; }

std::string error_code_category::message(int c) const {
    std::string r;
    switch (static_cast<error_code_t>(c)) {
    case error_code_t::success:
        r = "success";
        break;
    case error_code_t::cant_determine_config_dir:
        r = "config dir cannot be determined";
        break;
    case error_code_t::malformed_json:
        r = "malformed json";
        break;
    case error_code_t::incorrect_json:
        r = "incorrect json";
        break;
    case error_code_t::unknown_gateway_type:
        r = "unknown gateway type";
        break;
    case error_code_t::missing_gateway_name:
        r = "gateway name is missing";
        break;
    case error_code_t::missing_command:
        r = "command is missing";
        break;
    case error_code_t::missing_port:
        r = "port is missing";
        break;
    case error_code_t::timed_out:
        r = "timeout occurred";
        break;
    case error_code_t::unknown_sink:
        r = "unknown sink";
        break;
    case error_code_t::cannot_open_sink:
        r = "sink cannot be opened";
        break;
    case error_code_t::misconfigured_default_logger:
        r = "default logger is missing or has no sinks";
        break;
    case error_code_t::directory_write_failure:
        r = "directory file cannot be written";
        break;
    default:
        r = "unknown";
    }
    r += " (";
    r += std::to_string(c) + ")";
    return r;
}

} // namespace gatewarden::utils::detail

namespace gatewarden::utils {

const static detail::error_code_category category;

const detail::error_code_category &error_code_category() { return category; }

boost::system::error_code adapt(const std::error_code &ec) noexcept {
    struct category_adapter_t : public boost::system::error_category {
        category_adapter_t(const std::error_category &category) : m_category(category) {}

        const char *name() const noexcept { return m_category.name(); }

        std::string message(int ev) const { return m_category.message(ev); }

      private:
        const std::error_category &m_category;
    };

    using map_t = std::map<std::string, category_adapter_t>;
    static thread_local map_t name2cat;
    auto result = name2cat.emplace(ec.category().name(), ec.category());
    auto &category = result.first->second;
    return boost::system::error_code(ec.value(), category);
}

} // namespace gatewarden::utils
