#include "tessera/index/metric.hpp"
#include "tessera/core/platform_utils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <type_traits>

namespace tessera::index {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

auto make_variant(MetricKind kind) noexcept -> DistanceMetric::variant_type {
    switch (kind) {
        case MetricKind::Dot: return DotMetric{};
        case MetricKind::Euclidean: return EuclideanMetric{};
        case MetricKind::Cosine: break;
    }
    return CosineMetric{};
}

} // namespace

DistanceMetric::DistanceMetric(MetricKind kind) noexcept : metric_(make_variant(kind)) {}

auto DistanceMetric::parse(std::string_view name) -> std::expected<DistanceMetric, core::error> {
    using core::iequals;
    if (iequals(name, "cosine") || iequals(name, "cos")) return DistanceMetric(MetricKind::Cosine);
    if (iequals(name, "dot") || iequals(name, "ip") || iequals(name, "inner_product")) {
        return DistanceMetric(MetricKind::Dot);
    }
    if (iequals(name, "euclidean") || iequals(name, "l2")) return DistanceMetric(MetricKind::Euclidean);
    return core::fail(core::error_code::invalid_schema,
                      "unknown metric '" + std::string(name) + "'", "index.metric");
}

auto DistanceMetric::kind() const noexcept -> MetricKind {
    return std::visit([](const auto& m) { return std::decay_t<decltype(m)>::kind; }, metric_);
}

auto DistanceMetric::name() const noexcept -> std::string_view {
    return to_string(kind());
}

auto DistanceMetric::higher_is_better() const noexcept -> bool {
    return std::visit([](const auto& m) { return std::decay_t<decltype(m)>::higher_is_better; }, metric_);
}

auto DistanceMetric::prepare(std::span<float> v) const noexcept -> void {
    if (!std::holds_alternative<CosineMetric>(metric_)) return;
    const float norm = kernels::l2_norm(v);
    if (norm <= 0.0f || !std::isfinite(norm)) return;
    for (float& x : v) x /= norm;
}

auto DistanceMetric::key(std::span<const float> a, std::span<const float> b) const noexcept -> float {
    return std::visit(overloaded{
        [&](const EuclideanMetric&) { return kernels::l2_sq(a, b); },
        [&](const auto&) { return -kernels::inner_product(a, b); },
    }, metric_);
}

auto DistanceMetric::score_from_key(float key) const noexcept -> float {
    return std::visit(overloaded{
        [&](const EuclideanMetric&) { return std::sqrt(std::max(key, 0.0f)); },
        [&](const auto&) { return -key; },
    }, metric_);
}

auto DistanceMetric::score_raw(std::span<const float> a, std::span<const float> b) const noexcept -> float {
    if (a.size() != b.size()) return std::numeric_limits<float>::quiet_NaN();
    return std::visit(overloaded{
        [&](const CosineMetric&) {
            const float denom = kernels::l2_norm(a) * kernels::l2_norm(b);
            return denom > 0.0f ? kernels::inner_product(a, b) / denom : 0.0f;
        },
        [&](const DotMetric&) { return kernels::inner_product(a, b); },
        [&](const EuclideanMetric&) { return std::sqrt(kernels::l2_sq(a, b)); },
    }, metric_);
}

auto DistanceMetric::compare(float a, float b) const noexcept -> Preference {
    if (a == b) return Preference::equal;
    const bool a_ahead = higher_is_better() ? (a > b) : (a < b);
    return a_ahead ? Preference::better : Preference::worse;
}

auto to_string(MetricKind kind) noexcept -> std::string_view {
    switch (kind) {
        case MetricKind::Cosine: return "Cosine";
        case MetricKind::Dot: return "Dot";
        case MetricKind::Euclidean: return "Euclidean";
    }
    return "Cosine";
}

} // namespace tessera::index
