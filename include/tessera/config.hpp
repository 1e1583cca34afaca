#pragma once

/** \file config.hpp
 *  \brief Engine configuration: defaults, validation and environment overrides.
 *
 * Recognized environment variables:
 *   TESSERA_APPLY_MODE  sync | async
 *   TESSERA_DATA_DIR    directory for collection logs (empty = in memory)
 *   TESSERA_LOG_LEVEL   trace | debug | info | warn | error | critical | off
 *   TESSERA_RRF_K       positive number
 *   TESSERA_EF_SEARCH   positive integer
 */

#include <expected>

#include "tessera/collection/collection.hpp"
#include "tessera/error.hpp"
#include "tessera/logging.hpp"

namespace tessera {

struct EngineConfig {
    collection::CollectionOptions collections{};   /**< defaults for every new collection */
    logging::LogConfig log{};
    bool configure_logging{false};                 /**< Engine::open applies `log` to spdlog */
};

/** \brief Errors: precondition_failed naming the offending field. */
auto validate(const EngineConfig& config) -> std::expected<void, core::error>;

/** \brief Overlay TESSERA_* variables. Errors: precondition_failed on unparsable values. */
auto apply_env_overrides(EngineConfig& config) -> std::expected<void, core::error>;

} // namespace tessera
