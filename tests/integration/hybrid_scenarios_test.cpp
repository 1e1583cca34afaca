/** \file hybrid_scenarios_test.cpp
 *  \brief End-to-end behaviour through the Engine facade.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/generators/catch_generators_adapters.hpp>
#include <catch2/generators/catch_generators_random.hpp>
#include <catch2/generators/catch_generators_range.hpp>

#include <algorithm>
#include <cmath>
#include <random>
#include <set>
#include <string>
#include <vector>

#include "tessera/engine.hpp"
#include "tessera/index/metric.hpp"

using namespace tessera;
using collection::CollectionSchema;
using collection::TextFieldDef;

namespace {

DocumentId sid(const char* s) { return DocumentId{std::string(s)}; }

EngineConfig quiet_config() {
    EngineConfig config;
    config.collections.maintenance.enabled = false;
    return config;
}

CollectionSchema schema(std::string name, std::int64_t dim, index::MetricKind metric) {
    CollectionSchema s;
    s.name = std::move(name);
    s.dimension = dim;
    s.metric = metric;
    s.text_fields = {TextFieldDef{"text", false}};
    return s;
}

Document text_doc(DocumentId id, std::vector<float> v, std::string text) {
    return Document{std::move(id), std::move(v), Payload{{"text", std::move(text)}}};
}

auto ids_of(const search::SearchResponse& r) -> std::vector<DocumentId> {
    std::vector<DocumentId> out;
    for (const auto& h : r.hits) out.push_back(h.id);
    return out;
}

auto load_pets(Engine& engine) -> void {
    REQUIRE(engine.create_collection(schema("pets", 2, index::MetricKind::Cosine)).has_value());
    REQUIRE(engine.upsert("pets", text_doc(sid("A"), {1.0f, 0.0f}, "cat dog")).has_value());
    REQUIRE(engine.upsert("pets", text_doc(sid("B"), {0.0f, 1.0f}, "dog")).has_value());
    REQUIRE(engine.upsert("pets", text_doc(sid("C"), {0.9f, 0.1f}, "cat")).has_value());
}

auto random_vectors(std::size_t n, std::size_t dim, std::uint32_t seed) -> std::vector<std::vector<float>> {
    std::mt19937 rng(seed);
    std::normal_distribution<float> dist(0.0f, 1.0f);
    std::vector<std::vector<float>> out(n, std::vector<float>(dim));
    for (auto& v : out) {
        for (auto& x : v) x = dist(rng);
    }
    return out;
}

} // namespace

TEST_CASE("hybrid search ranks the double match above the non-match", "[scenario]") {
    auto engine = Engine::open(quiet_config());
    REQUIRE(engine.has_value());
    load_pets(*engine);

    search::Query q;
    q.vector = std::vector<float>{1.0f, 0.0f};
    q.text = "cat";
    q.top_k = 2;
    auto r = engine->search("pets", q);
    REQUIRE(r.has_value());
    REQUIRE(r->hits.size() == 2);

    const auto ids = ids_of(*r);
    REQUIRE(std::find(ids.begin(), ids.end(), sid("C")) != ids.end());
    REQUIRE(std::find(ids.begin(), ids.end(), sid("A")) != ids.end());
    REQUIRE(std::find(ids.begin(), ids.end(), sid("B")) == ids.end());

    // With room for everyone B still trails C
    q.top_k = 3;
    auto all = ids_of(*engine->search("pets", q));
    REQUIRE(all.size() == 3);
    const auto pos = [&](const DocumentId& id) { return std::find(all.begin(), all.end(), id) - all.begin(); };
    REQUIRE(pos(sid("C")) < pos(sid("B")));
}

TEST_CASE("a deleted document drops out of vector results", "[scenario][tombstone]") {
    auto engine = Engine::open(quiet_config());
    REQUIRE(engine.has_value());
    load_pets(*engine);
    REQUIRE(*engine->remove("pets", sid("B")));

    search::Query q;
    q.vector = std::vector<float>{1.0f, 0.0f};
    q.top_k = 3;
    auto r = engine->search("pets", q);
    REQUIRE(r.has_value());
    const auto ids = ids_of(*r);
    REQUIRE(std::set<DocumentId>(ids.begin(), ids.end()) == std::set<DocumentId>{sid("A"), sid("C")});
    REQUIRE(ids.size() == 2);
}

TEST_CASE("creating a collection twice fails", "[property]") {
    const auto metric = GENERATE(index::MetricKind::Cosine, index::MetricKind::Dot, index::MetricKind::Euclidean);
    const auto dim = GENERATE(1, 3, 128);

    auto engine = Engine::open(quiet_config());
    REQUIRE(engine->create_collection(schema("twice", dim, metric)).has_value());
    auto again = engine->create_collection(schema("twice", dim, metric));
    REQUIRE_FALSE(again.has_value());
    REQUIRE(again.error().code == core::error_code::already_exists);
    REQUIRE(engine->list_collections() == std::vector<std::string>{"twice"});
}

TEST_CASE("deleted documents never come back", "[property][tombstone]") {
    const auto seed = GENERATE(take(3, random(1u, 100000u)));
    const auto mode = GENERATE(collection::ApplyMode::Sync, collection::ApplyMode::Async);
    auto config = quiet_config();
    config.collections.apply_mode = mode;
    auto engine = Engine::open(config);
    REQUIRE(engine->create_collection(schema("del", 8, index::MetricKind::Cosine)).has_value());

    const auto vecs = random_vectors(120, 8, seed);
    const std::vector<std::string> words{"alpha", "beta", "gamma", "delta"};
    for (std::size_t i = 0; i < vecs.size(); ++i) {
        REQUIRE(engine->upsert("del", text_doc(DocumentId{std::uint64_t{i + 1}}, vecs[i], words[i % words.size()]))
                    .has_value());
    }
    std::set<DocumentId> deleted;
    for (std::uint64_t i = 1; i <= 120; i += 3) {
        REQUIRE(*engine->remove("del", DocumentId{i}));
        deleted.insert(DocumentId{i});
    }

    for (std::size_t sample = 0; sample < 10; ++sample) {
        search::Query q;
        q.vector = vecs[sample * 7];
        q.text = words[sample % words.size()];
        q.top_k = 120;
        for (int variant = 0; variant < 3; ++variant) {
            search::Query v = q;
            if (variant == 1) v.text.reset();
            if (variant == 2) v.vector.reset();
            auto r = engine->search("del", v);
            REQUIRE(r.has_value());
            for (const auto& h : r->hits) REQUIRE_FALSE(deleted.contains(h.id));
        }
    }
}

TEST_CASE("vector search over all documents matches brute force", "[property]") {
    const auto metric = GENERATE(index::MetricKind::Cosine, index::MetricKind::Dot, index::MetricKind::Euclidean);
    constexpr std::size_t n = 40;
    constexpr std::size_t dim = 6;

    auto engine = Engine::open(quiet_config());
    REQUIRE(engine->create_collection(schema("exact", dim, metric)).has_value());
    const auto vecs = random_vectors(n, dim, 42);
    for (std::size_t i = 0; i < n; ++i) {
        REQUIRE(engine->upsert("exact", text_doc(DocumentId{std::uint64_t{i + 1}}, vecs[i], "x")).has_value());
    }

    const auto query = random_vectors(1, dim, 7)[0];
    search::Query q;
    q.vector = query;
    q.top_k = static_cast<std::int64_t>(n + 5);
    auto r = engine->search("exact", q);
    REQUIRE(r.has_value());
    REQUIRE(r->hits.size() == n);

    const auto ids = ids_of(*r);
    REQUIRE(std::set<DocumentId>(ids.begin(), ids.end()).size() == n);

    const index::DistanceMetric m(metric);
    std::vector<float> expected;
    for (const auto& v : vecs) expected.push_back(m.score_raw(query, v));
    for (std::size_t i = 0; i + 1 < r->hits.size(); ++i) {
        REQUIRE(m.compare(r->hits[i].score, r->hits[i + 1].score) != index::Preference::worse);
    }
    for (const auto& h : r->hits) {
        const auto idx = std::get<std::uint64_t>(h.id) - 1;
        REQUIRE(std::fabs(h.score - expected[idx]) < 1e-4f);
    }
}

TEST_CASE("text search skips documents without shared terms", "[property][bm25]") {
    auto engine = Engine::open(quiet_config());
    REQUIRE(engine->create_collection(schema("lex", 2, index::MetricKind::Cosine)).has_value());
    REQUIRE(engine->upsert("lex", text_doc(sid("near"), {1.0f, 0.0f}, "completely unrelated words")).has_value());
    REQUIRE(engine->upsert("lex", text_doc(sid("far"), {-1.0f, 0.0f}, "the quick fox")).has_value());

    search::Query q;
    q.text = "fox";
    q.top_k = 10;
    REQUIRE(ids_of(*engine->search("lex", q)) == std::vector<DocumentId>{sid("far")});

    // In a hybrid query the nearest neighbour still comes from the vector side only
    q.vector = std::vector<float>{1.0f, 0.0f};
    auto r = engine->search("lex", q);
    for (const auto& h : r->hits) {
        if (h.id == sid("near")) {
            REQUIRE(h.text_rank == 0);
            REQUIRE_FALSE(h.text_score.has_value());
        }
    }
}

TEST_CASE("fused order respects agreement between sources", "[property][fusion]") {
    auto engine = Engine::open(quiet_config());
    REQUIRE(engine->create_collection(schema("mono", 2, index::MetricKind::Cosine)).has_value());
    REQUIRE(engine->upsert("mono", text_doc(sid("best"), {1.0f, 0.0f}, "apple apple")).has_value());
    REQUIRE(engine->upsert("mono", text_doc(sid("mid"), {0.8f, 0.6f}, "apple pie and more words here")).has_value());
    REQUIRE(engine->upsert("mono", text_doc(sid("low"), {0.0f, 1.0f}, "banana")).has_value());

    search::Query q;
    q.vector = std::vector<float>{1.0f, 0.0f};
    q.text = "apple";
    q.top_k = 3;
    auto r = engine->search("mono", q);
    REQUIRE(r.has_value());
    for (std::size_t i = 0; i < r->hits.size(); ++i) {
        for (std::size_t j = 0; j < r->hits.size(); ++j) {
            const auto& a = r->hits[i];
            const auto& b = r->hits[j];
            const bool a_vec_better = a.vector_rank != 0 && (b.vector_rank == 0 || a.vector_rank < b.vector_rank);
            const bool a_txt_better = a.text_rank != 0 && (b.text_rank == 0 || a.text_rank < b.text_rank);
            if (a_vec_better && a_txt_better) REQUIRE(a.score >= b.score);
        }
    }
    REQUIRE(r->hits[0].id == sid("best"));
}

TEST_CASE("repeating an upsert is idempotent", "[property]") {
    auto engine = Engine::open(quiet_config());
    REQUIRE(engine->create_collection(schema("idem", 3, index::MetricKind::Euclidean)).has_value());
    const Document d = text_doc(sid("x"), {1.0f, 2.0f, 3.0f}, "same words same words");

    REQUIRE(engine->upsert("idem", d)->created);
    const auto once = *engine->stats("idem");
    auto q = search::Query{};
    q.text = "same";
    const auto score_once = engine->search("idem", q)->hits.at(0).score;

    REQUIRE_FALSE(engine->upsert("idem", d)->created);
    const auto twice = *engine->stats("idem");
    REQUIRE(twice.documents == once.documents);
    REQUIRE(twice.vector_live == once.vector_live);
    REQUIRE(twice.vector_tombstones == once.vector_tombstones);
    REQUIRE(twice.lexical_documents == once.lexical_documents);
    REQUIRE(engine->search("idem", q)->hits.at(0).score == score_once);
    REQUIRE(*engine->get("idem", sid("x")) == d);
}

TEST_CASE("the process-wide engine follows initialize and teardown", "[engine]") {
    REQUIRE(global().error().code == core::error_code::precondition_failed);
    REQUIRE(initialize(quiet_config()).has_value());
    REQUIRE(initialize(quiet_config()).error().code == core::error_code::already_exists);

    auto* engine = *global();
    load_pets(*engine);
    REQUIRE(engine->list_collections() == std::vector<std::string>{"pets"});

    teardown();
    REQUIRE_FALSE(global().has_value());
    REQUIRE(initialize(quiet_config()).has_value());
    REQUIRE((*global())->list_collections().empty());
    teardown();
}

TEST_CASE("engine operations on unknown collections", "[engine]") {
    auto engine = Engine::open(quiet_config());
    search::Query q;
    q.text = "x";
    REQUIRE(engine->search("nope", q).error().code == core::error_code::not_found);
    REQUIRE(engine->upsert("nope", text_doc(sid("a"), {1}, "x")).error().code == core::error_code::not_found);
    REQUIRE(engine->drop_collection("nope").error().code == core::error_code::not_found);
    REQUIRE(engine->stats("nope").error().code == core::error_code::not_found);

    auto bad = quiet_config();
    bad.collections.hybrid.rrf_k = -1.0f;
    REQUIRE(Engine::open(bad).error().code == core::error_code::precondition_failed);
}
