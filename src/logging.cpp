#include "tessera/logging.hpp"

#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "tessera/core/platform_utils.hpp"

namespace tessera::logging {

auto parse_level(std::string_view name) -> std::expected<spdlog::level::level_enum, core::error> {
    using core::iequals;
    if (iequals(name, "trace")) return spdlog::level::trace;
    if (iequals(name, "debug")) return spdlog::level::debug;
    if (iequals(name, "info")) return spdlog::level::info;
    if (iequals(name, "warn") || iequals(name, "warning")) return spdlog::level::warn;
    if (iequals(name, "error") || iequals(name, "err")) return spdlog::level::err;
    if (iequals(name, "critical")) return spdlog::level::critical;
    if (iequals(name, "off") || iequals(name, "none")) return spdlog::level::off;
    return core::fail(core::error_code::precondition_failed, "unknown log level '" + std::string(name) + "'",
                      "logging");
}

auto configure(const LogConfig& config) -> std::expected<void, core::error> {
    auto level = parse_level(config.level);
    if (!level) return std::unexpected(level.error());

    if (config.install_console_logger) {
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto logger = std::make_shared<spdlog::logger>("tessera", std::move(sink));
        spdlog::set_default_logger(std::move(logger));
    }
    spdlog::set_pattern(config.pattern);
    spdlog::set_level(*level);
    spdlog::flush_on(spdlog::level::warn);
    return {};
}

} // namespace tessera::logging
