#pragma once

/** \file logging.hpp
 *  \brief spdlog setup for the library's default logger.
 */

#include <expected>
#include <string>
#include <string_view>

#include <spdlog/common.h>

#include "tessera/error.hpp"

namespace tessera::logging {

struct LogConfig {
    std::string level{"info"};          /**< trace|debug|info|warn|error|critical|off */
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [tessera] %v"};
    bool install_console_logger{true};  /**< replace the default logger with a stderr color sink */
};

/** \brief Parse a level name (case-insensitive; "warning", "err", "none" accepted). */
auto parse_level(std::string_view name) -> std::expected<spdlog::level::level_enum, core::error>;

/** \brief Apply a LogConfig to spdlog. Errors: precondition_failed on an unknown level. */
auto configure(const LogConfig& config) -> std::expected<void, core::error>;

} // namespace tessera::logging
