/** \file metric_test.cpp
 *  \brief Unit tests for the metric facade.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <cmath>
#include <vector>

#include "tessera/index/metric.hpp"

using namespace tessera::index;
using Catch::Matchers::WithinAbs;

TEST_CASE("metric names parse case-insensitively with aliases", "[metric]") {
    REQUIRE(DistanceMetric::parse("Cosine")->kind() == MetricKind::Cosine);
    REQUIRE(DistanceMetric::parse("COS")->kind() == MetricKind::Cosine);
    REQUIRE(DistanceMetric::parse("dot")->kind() == MetricKind::Dot);
    REQUIRE(DistanceMetric::parse("ip")->kind() == MetricKind::Dot);
    REQUIRE(DistanceMetric::parse("Euclidean")->kind() == MetricKind::Euclidean);
    REQUIRE(DistanceMetric::parse("L2")->kind() == MetricKind::Euclidean);

    auto bad = DistanceMetric::parse("manhattan");
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == tessera::core::error_code::invalid_schema);
}

TEST_CASE("native scores and their ordering", "[metric]") {
    const std::vector<float> a{1.0f, 0.0f};
    const std::vector<float> b{0.6f, 0.8f};

    SECTION("cosine is similarity, higher is better") {
        DistanceMetric m(MetricKind::Cosine);
        REQUIRE(m.higher_is_better());
        REQUIRE_THAT(m.score_raw(a, b), WithinAbs(0.6, 1e-6));
        REQUIRE(m.compare(0.9f, 0.1f) == Preference::better);
    }

    SECTION("cosine against a zero vector scores zero") {
        DistanceMetric m(MetricKind::Cosine);
        const std::vector<float> zero{0.0f, 0.0f};
        REQUIRE(m.score_raw(a, zero) == 0.0f);
    }

    SECTION("dot is the raw inner product") {
        DistanceMetric m(MetricKind::Dot);
        const std::vector<float> c{2.0f, 3.0f};
        REQUIRE_THAT(m.score_raw(c, b), WithinAbs(3.6, 1e-5));
    }

    SECTION("euclidean is a distance, lower is better") {
        DistanceMetric m(MetricKind::Euclidean);
        REQUIRE_FALSE(m.higher_is_better());
        const std::vector<float> origin{0.0f, 0.0f};
        const std::vector<float> p{3.0f, 4.0f};
        REQUIRE_THAT(m.score_raw(origin, p), WithinAbs(5.0, 1e-6));
        REQUIRE(m.compare(1.0f, 2.0f) == Preference::better);
        REQUIRE(m.compare(2.0f, 2.0f) == Preference::equal);
    }
}

TEST_CASE("vectors of different lengths have no score", "[metric]") {
    const std::vector<float> short_vec{1.0f, 0.0f};
    const std::vector<float> long_vec(64, 1.0f);
    for (auto kind : {MetricKind::Cosine, MetricKind::Dot, MetricKind::Euclidean}) {
        DistanceMetric m(kind);
        REQUIRE(std::isnan(m.score_raw(long_vec, short_vec)));
        REQUIRE(std::isnan(m.score_raw(short_vec, long_vec)));
    }
}

TEST_CASE("keys round trip to native scores", "[metric]") {
    std::vector<float> a{3.0f, 4.0f};
    std::vector<float> b{4.0f, 3.0f};

    DistanceMetric cosine(MetricKind::Cosine);
    auto pa = a;
    auto pb = b;
    cosine.prepare(pa);
    cosine.prepare(pb);
    REQUIRE_THAT(cosine.score_from_key(cosine.key(pa, pb)), WithinAbs(cosine.score_raw(a, b), 1e-6));

    DistanceMetric l2(MetricKind::Euclidean);
    REQUIRE_THAT(l2.score_from_key(l2.key(a, b)), WithinAbs(l2.score_raw(a, b), 1e-6));
}
