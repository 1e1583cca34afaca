#pragma once

/** \file metric.hpp
 *  \brief Similarity metrics as a tagged variant with a uniform comparison contract.
 *
 * Each metric exposes two views of the same relation:
 * - a native score reported to callers (similarity for Cosine/Dot, L2 distance for Euclidean)
 * - a rank key where lower is always better, used by heaps inside the indexes
 *
 * Cosine operates on normalized vectors: callers run prepare() on stored and query vectors
 * once, after which the hot path is a plain inner product. Zero vectors stay zero and score 0.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <string_view>
#include <variant>

#include "tessera/error.hpp"
#include "tessera/kernels/distance.hpp"

namespace tessera::index {

/** \brief Metric identifiers as they appear in schemas. */
enum class MetricKind : std::uint8_t { Cosine = 0, Dot = 1, Euclidean = 2 };

/** \brief Outcome of comparing two native scores. */
enum class Preference : std::int8_t { worse = -1, equal = 0, better = 1 };

struct CosineMetric {
    static constexpr MetricKind kind = MetricKind::Cosine;
    static constexpr bool higher_is_better = true;
};

struct DotMetric {
    static constexpr MetricKind kind = MetricKind::Dot;
    static constexpr bool higher_is_better = true;
};

struct EuclideanMetric {
    static constexpr MetricKind kind = MetricKind::Euclidean;
    static constexpr bool higher_is_better = false;
};

/** \brief Metric-agnostic facade used by the indexes and the query engine. */
class DistanceMetric {
public:
    using variant_type = std::variant<CosineMetric, DotMetric, EuclideanMetric>;

    DistanceMetric() = default;
    explicit DistanceMetric(MetricKind kind) noexcept;

    /** \brief Parse "Cosine" | "Dot" | "Euclidean" (case-insensitive; aliases cos, ip, l2). */
    static auto parse(std::string_view name) -> std::expected<DistanceMetric, core::error>;

    auto kind() const noexcept -> MetricKind;
    auto name() const noexcept -> std::string_view;
    auto higher_is_better() const noexcept -> bool;

    /** \brief Normalize in place for Cosine; no-op for the other metrics. */
    auto prepare(std::span<float> v) const noexcept -> void;

    /** \brief Lower-is-better key between two prepared vectors. */
    auto key(std::span<const float> a, std::span<const float> b) const noexcept -> float;

    /** \brief Native score corresponding to a key produced by key(). */
    auto score_from_key(float key) const noexcept -> float;

    /** \brief Native score between two raw (unprepared) vectors; NaN when the lengths differ. */
    auto score_raw(std::span<const float> a, std::span<const float> b) const noexcept -> float;

    /** \brief better if native score a ranks ahead of b under this metric. */
    auto compare(float a, float b) const noexcept -> Preference;

    friend bool operator==(const DistanceMetric& a, const DistanceMetric& b) noexcept {
        return a.kind() == b.kind();
    }

private:
    variant_type metric_{CosineMetric{}};
};

auto to_string(MetricKind kind) noexcept -> std::string_view;

} // namespace tessera::index
