// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#pragma once
#include <string>
#include <system_error>
#include <boost/system/error_code.hpp>
#include "gatewarden-export.h"

namespace gatewarden::utils {

enum class error_code_t {
    success = 0,
    cant_determine_config_dir,
    malformed_json,
    incorrect_json,
    unknown_gateway_type,
    missing_gateway_name,
    missing_command,
    missing_port,
    timed_out,
    unknown_sink,
    cannot_open_sink,
    misconfigured_default_logger,
    directory_write_failure,
};

namespace detail {

class error_code_category : public boost::system::error_category {
    virtual const char *name() const noexcept override;
    virtual std::string message(int c) const override;
};

} // namespace detail

GATEWARDEN_API const detail::error_code_category &error_code_category();

inline boost::system::error_code make_error_code(error_code_t e) {
    return {static_cast<int>(e), error_code_category()};
}

GATEWARDEN_API boost::system::error_code adapt(const std::error_code &ec) noexcept;

} // namespace gatewarden::utils

namespace std {
template <> struct is_error_code_enum<gatewarden::utils::error_code_t> : std::true_type {};
} // namespace std

namespace boost {
namespace system {

template <> struct is_error_code_enum<gatewarden::utils::error_code_t> : std::true_type {
    static const bool value = true;
};

} // namespace system
} // namespace boost
