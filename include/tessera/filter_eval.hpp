#pragma once

/** \file filter_eval.hpp
 *  \brief In-memory evaluation of filter_expr against document payloads.
 */

#include <expected>

#include "tessera/error.hpp"
#include "tessera/filter_expr.hpp"

namespace tessera::filter_eval {

// Reject malformed expressions (empty paths, ordering against Null/Array/Object) with invalid_query.
auto validate(const filter_expr& expr) -> std::expected<void, core::error>;

// Evaluate whether a payload matches the expression.
// Missing fields: eq/in/ordering are false, ne is true.
auto matches(const filter_expr& expr, const Payload& payload) -> bool;

} // namespace tessera::filter_eval
