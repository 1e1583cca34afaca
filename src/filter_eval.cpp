#include "tessera/filter_eval.hpp"

#include <algorithm>
#include <optional>

namespace tessera::filter_eval {

namespace {

auto equal_values(const PayloadValue& a, const PayloadValue& b) -> bool {
  if (a.is_number() && b.is_number()) return *a.as_double() == *b.as_double();
  return a == b;
}

// -1, 0, 1 for comparable pairs; nullopt otherwise
auto order(const PayloadValue& a, const PayloadValue& b) -> std::optional<int> {
  if (a.is_number() && b.is_number()) {
    const double x = *a.as_double();
    const double y = *b.as_double();
    if (x < y) return -1;
    if (x > y) return 1;
    if (x == y) return 0;
    return std::nullopt; // NaN
  }
  if (const auto* s = a.as_string()) {
    if (const auto* t = b.as_string()) return s->compare(*t) < 0 ? -1 : (*s == *t ? 0 : 1);
    return std::nullopt;
  }
  if (std::holds_alternative<bool>(a.value) && std::holds_alternative<bool>(b.value)) {
    const bool x = std::get<bool>(a.value);
    const bool y = std::get<bool>(b.value);
    return x == y ? 0 : (x ? 1 : -1);
  }
  return std::nullopt;
}

auto orderable(const PayloadValue& v) -> bool {
  return v.is_number() || v.as_string() != nullptr || std::holds_alternative<bool>(v.value);
}

auto matches_compare(const compare& c, const Payload& payload) -> bool {
  const PayloadValue* v = lookup_path(payload, c.path);
  if (c.op == compare_op::ne) return v == nullptr || !equal_values(*v, c.value);
  if (v == nullptr) return false;
  if (c.op == compare_op::eq) return equal_values(*v, c.value);

  const auto o = order(*v, c.value);
  if (!o) return false;
  switch (c.op) {
    case compare_op::gt: return *o > 0;
    case compare_op::gte: return *o >= 0;
    case compare_op::lt: return *o < 0;
    case compare_op::lte: return *o <= 0;
    default: return false;
  }
}

} // namespace

auto validate(const filter_expr& e) -> std::expected<void, core::error> {
  const auto bad = [](std::string msg) { return core::fail(core::error_code::invalid_query, std::move(msg), "filter"); };

  if (const auto* c = std::get_if<compare>(&e.node)) {
    if (c->path.empty()) return bad("filter path must not be empty");
    if (c->op != compare_op::eq && c->op != compare_op::ne && !orderable(c->value)) {
      return bad("ordering filter on '" + c->path + "' needs a number, string or bool");
    }
    return {};
  }
  if (const auto* in = std::get_if<in_set>(&e.node)) {
    if (in->path.empty()) return bad("filter path must not be empty");
    return {};
  }
  if (const auto* ex = std::get_if<exists>(&e.node)) {
    if (ex->path.empty()) return bad("filter path must not be empty");
    return {};
  }

  const std::vector<filter_expr>* children = nullptr;
  if (const auto* a = std::get_if<filter_expr::and_t>(&e.node)) children = &a->children;
  else if (const auto* o = std::get_if<filter_expr::or_t>(&e.node)) children = &o->children;
  else children = &std::get<filter_expr::not_t>(e.node).children;
  for (const auto& c : *children) {
    if (auto r = validate(c); !r) return r;
  }
  return {};
}

auto matches(const filter_expr& e, const Payload& payload) -> bool {
  if (std::holds_alternative<compare>(e.node)) {
    return matches_compare(std::get<compare>(e.node), payload);
  } else if (std::holds_alternative<in_set>(e.node)) {
    const auto& in = std::get<in_set>(e.node);
    const PayloadValue* v = lookup_path(payload, in.path);
    if (v == nullptr) return false;
    return std::any_of(in.values.begin(), in.values.end(),
                       [&](const PayloadValue& candidate) { return equal_values(*v, candidate); });
  } else if (std::holds_alternative<exists>(e.node)) {
    return lookup_path(payload, std::get<exists>(e.node).path) != nullptr;
  } else if (std::holds_alternative<filter_expr::and_t>(e.node)) {
    const auto& a = std::get<filter_expr::and_t>(e.node);
    for (const auto& c : a.children) if (!matches(c, payload)) return false;
    return true; // and([]) == true
  } else if (std::holds_alternative<filter_expr::or_t>(e.node)) {
    const auto& o = std::get<filter_expr::or_t>(e.node);
    for (const auto& c : o.children) if (matches(c, payload)) return true;
    return false; // or([]) == false
  } else if (std::holds_alternative<filter_expr::not_t>(e.node)) {
    const auto& n = std::get<filter_expr::not_t>(e.node);
    bool v = true; // not([]) == true
    for (const auto& c : n.children) v = v && (!matches(c, payload));
    return v;
  }
  return false;
}

} // namespace tessera::filter_eval
