#pragma once

/** \file filter_expr.hpp
 *  \brief Filter expression AST for payload predicates.
 *
 * Use cases: compile to Roaring bitmaps of store handles and push them into both indexes.
 * Ownership: this AST is value-semantic and self-contained.
 * Paths are dotted ("meta.lang") and resolve through nested payload objects.
 */

#include <string>
#include <variant>
#include <vector>

#include "tessera/document.hpp"

namespace tessera {

enum class compare_op { eq, ne, gt, gte, lt, lte };

/** \brief field <op> value. Ordering ops compare numbers (Int and Float mixed), strings or bools. */
struct compare {
  std::string path;   /**< dotted payload path */
  compare_op op{compare_op::eq};
  PayloadValue value;
};

/** \brief field value is one of values. */
struct in_set {
  std::string path;
  std::vector<PayloadValue> values;
};

/** \brief field is present (a Null value counts as present). */
struct exists {
  std::string path;
};

/** \brief Recursive filter expression. */
struct filter_expr {
  struct and_t { std::vector<filter_expr> children; };
  struct or_t  { std::vector<filter_expr> children; };
  struct not_t { std::vector<filter_expr> children; };

  std::variant<compare, in_set, exists, and_t, or_t, not_t> node; /**< root node */
};

namespace filter {

inline auto eq(std::string path, PayloadValue v) -> filter_expr { return {compare{std::move(path), compare_op::eq, std::move(v)}}; }
inline auto ne(std::string path, PayloadValue v) -> filter_expr { return {compare{std::move(path), compare_op::ne, std::move(v)}}; }
inline auto gt(std::string path, PayloadValue v) -> filter_expr { return {compare{std::move(path), compare_op::gt, std::move(v)}}; }
inline auto gte(std::string path, PayloadValue v) -> filter_expr { return {compare{std::move(path), compare_op::gte, std::move(v)}}; }
inline auto lt(std::string path, PayloadValue v) -> filter_expr { return {compare{std::move(path), compare_op::lt, std::move(v)}}; }
inline auto lte(std::string path, PayloadValue v) -> filter_expr { return {compare{std::move(path), compare_op::lte, std::move(v)}}; }
inline auto in(std::string path, std::vector<PayloadValue> vs) -> filter_expr { return {in_set{std::move(path), std::move(vs)}}; }
inline auto has(std::string path) -> filter_expr { return {exists{std::move(path)}}; }
inline auto all_of(std::vector<filter_expr> cs) -> filter_expr { return {filter_expr::and_t{std::move(cs)}}; }
inline auto any_of(std::vector<filter_expr> cs) -> filter_expr { return {filter_expr::or_t{std::move(cs)}}; }
inline auto negate(filter_expr c) -> filter_expr { return {filter_expr::not_t{{std::move(c)}}}; }

} // namespace filter

} // namespace tessera
