#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling; transports map them 1:1 to their own status.
 * - Human-readable message and originating component for diagnostics.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace tessera::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,
  data_integrity = 3001,
  precondition_failed = 4001,
  not_found = 6001,
  already_exists = 6002,
  invalid_schema = 6101,
  schema_mismatch = 6102,
  invalid_query = 6201,
  cancelled = 8001,
  internal = 9001,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "store.wal" */
};

/** \brief Stable lowercase name of a code ("not_found", "schema_mismatch", ...). */
auto to_string(error_code code) noexcept -> std::string_view;

/** \brief "component: code: message" rendering for logs. */
auto describe(const error& e) -> std::string;

/** \brief Shorthand for building an unexpected error value. */
inline auto fail(error_code code, std::string message, std::string component)
    -> std::unexpected<error> {
  return std::unexpected(error{code, std::move(message), std::move(component)});
}

} // namespace tessera::core
