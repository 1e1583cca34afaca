/** \file document_store_test.cpp
 *  \brief Document store: handles, versions, scans, filters and log replay.
 */

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include "tessera/store/document_store.hpp"

using namespace tessera;
using namespace tessera::store;
namespace fs = std::filesystem;

namespace {

Document make_doc(std::uint64_t id, std::vector<float> v, std::string lang = "en") {
    return Document{DocumentId{id}, std::move(v), Payload{{"lang", std::move(lang)}, {"n", static_cast<std::int64_t>(id)}}};
}

fs::path fresh_path(const std::string& name) {
    auto dir = fs::temp_directory_path() / "tessera_store_tests";
    fs::create_directories(dir);
    auto p = dir / name;
    std::error_code ec;
    fs::remove_all(p, ec);
    fs::remove(fs::path(p.string() + ".compact"), ec);
    return p;
}

} // namespace

TEST_CASE("upsert assigns stable handles", "[store]") {
    auto store = DocumentStore::open(StoreOptions{});
    REQUIRE(store.has_value());

    auto a = store->upsert(make_doc(1, {1, 0}));
    auto b = store->upsert(make_doc(2, {0, 1}));
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(a->handle != b->handle);
    REQUIRE_FALSE(a->previous.has_value());
    REQUIRE(b->version > a->version);

    SECTION("re-upsert keeps the handle and reports the previous content") {
        auto again = store->upsert(make_doc(1, {0.5f, 0.5f}, "de"));
        REQUIRE(again->handle == a->handle);
        REQUIRE(again->previous.has_value());
        REQUIRE(again->previous->vector == std::vector<float>{1, 0});
        REQUIRE(store->get(DocumentId{std::uint64_t{1}})->vector == std::vector<float>{0.5f, 0.5f});
        REQUIRE(store->size() == 2);
    }

    SECTION("an id upserted after a delete gets a fresh handle") {
        auto removed = store->remove(DocumentId{std::uint64_t{1}});
        REQUIRE(removed->removed);
        REQUIRE(removed->handle == a->handle);
        REQUIRE_FALSE(store->is_live(a->handle));
        REQUIRE_FALSE(store->get_by_handle(a->handle).has_value());

        auto back = store->upsert(make_doc(1, {1, 1}));
        REQUIRE(back->handle != a->handle);
        REQUIRE(store->handle_of(DocumentId{std::uint64_t{1}}) == back->handle);
    }
}

TEST_CASE("lookups and removal of unknown ids", "[store]") {
    auto store = DocumentStore::open(StoreOptions{});
    auto missing = store->get(DocumentId{std::string("nope")});
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().code == core::error_code::not_found);

    auto r = store->remove(DocumentId{std::string("nope")});
    REQUIRE(r.has_value());
    REQUIRE_FALSE(r->removed);

    auto bad = store->upsert(Document{DocumentId{std::uint64_t{0}}, {1.0f}, {}});
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == core::error_code::schema_mismatch);
}

TEST_CASE("scan is lazy and restartable", "[store]") {
    auto store = DocumentStore::open(StoreOptions{});
    for (std::uint64_t i = 1; i <= 10; ++i) REQUIRE(store->upsert(make_doc(i, {1, 0})).has_value());
    REQUIRE(store->remove(DocumentId{std::uint64_t{4}})->removed);

    auto cursor = store->scan();
    std::vector<DocumentId> seen;
    while (auto sd = cursor.next()) seen.push_back(sd->document.id);
    REQUIRE(seen.size() == 9);
    REQUIRE_FALSE(cursor.next().has_value());

    cursor.reset();
    auto first = cursor.next();
    REQUIRE(first.has_value());
    REQUIRE(first->document.id == DocumentId{std::uint64_t{1}});

    // Writes behind the cursor are allowed while it is open
    REQUIRE(store->upsert(make_doc(11, {0, 1})).has_value());
    std::size_t rest = 0;
    while (cursor.next()) ++rest;
    REQUIRE(rest == 9);
}

TEST_CASE("filter_handles compiles payload predicates", "[store][filter]") {
    auto store = DocumentStore::open(StoreOptions{});
    REQUIRE(store->upsert(make_doc(1, {1, 0}, "en")).has_value());
    REQUIRE(store->upsert(make_doc(2, {1, 0}, "de")).has_value());
    REQUIRE(store->upsert(make_doc(3, {1, 0}, "en")).has_value());
    REQUIRE(store->remove(DocumentId{std::uint64_t{3}})->removed);

    auto en = store->filter_handles(filter::eq("lang", "en"));
    REQUIRE(en.has_value());
    REQUIRE(en->cardinality() == 1);
    REQUIRE(en->contains(*store->handle_of(DocumentId{std::uint64_t{1}})));

    auto big = store->filter_handles(filter::gte("n", 2));
    REQUIRE(big->cardinality() == 1);

    auto bad = store->filter_handles(filter::gt("", 1));
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == core::error_code::invalid_query);

    REQUIRE(store->live_handles().cardinality() == 2);
}

TEST_CASE("the log replays on reopen", "[store][wal]") {
    const auto path = fresh_path("replay.wal");
    std::uint32_t handle_of_two = 0;
    {
        auto store = DocumentStore::open(StoreOptions{path, false});
        REQUIRE(store.has_value());
        REQUIRE(store->upsert(make_doc(1, {1, 0})).has_value());
        handle_of_two = store->upsert(make_doc(2, {0, 1}))->handle;
        REQUIRE(store->upsert(make_doc(1, {0.5f, 0.5f}, "fr")).has_value());
        REQUIRE(store->remove(DocumentId{std::uint64_t{2}})->removed);
        REQUIRE(store->upsert(Document{DocumentId{std::string("s")}, {2, 2}, {}}).has_value());
        REQUIRE(store->flush(true).has_value());
    }
    auto reopened = DocumentStore::open(StoreOptions{path, false});
    REQUIRE(reopened.has_value());
    REQUIRE(reopened->size() == 2);
    REQUIRE(reopened->stats().replayed_frames == 5);
    REQUIRE_FALSE(reopened->contains(DocumentId{std::uint64_t{2}}));
    REQUIRE_FALSE(reopened->is_live(handle_of_two));
    auto one = reopened->get(DocumentId{std::uint64_t{1}});
    REQUIRE(one->vector == std::vector<float>{0.5f, 0.5f});
    REQUIRE(*one->payload.at("lang").as_string() == "fr");
    REQUIRE(reopened->contains(DocumentId{std::string("s")}));
}

TEST_CASE("a torn tail is truncated on open", "[store][wal]") {
    const auto path = fresh_path("torn.wal");
    {
        auto store = DocumentStore::open(StoreOptions{path, false});
        REQUIRE(store->upsert(make_doc(1, {1, 0})).has_value());
        REQUIRE(store->upsert(make_doc(2, {0, 1})).has_value());
        REQUIRE(store->flush(true).has_value());
    }
    std::error_code ec;
    fs::resize_file(path, fs::file_size(path) - 3, ec);
    REQUIRE(!ec);

    {
        auto store = DocumentStore::open(StoreOptions{path, false});
        REQUIRE(store.has_value());
        REQUIRE(store->size() == 1);
        REQUIRE(store->stats().truncated_bytes > 0);
        // The log stays appendable after truncation
        REQUIRE(store->upsert(make_doc(3, {1, 1})).has_value());
        REQUIRE(store->flush(true).has_value());
    }
    auto again = DocumentStore::open(StoreOptions{path, false});
    REQUIRE(again->size() == 2);
    REQUIRE(again->contains(DocumentId{std::uint64_t{3}}));
}

TEST_CASE("log compaction keeps only live documents", "[store][wal]") {
    const auto path = fresh_path("compact.wal");
    {
        auto store = DocumentStore::open(StoreOptions{path, false});
        for (std::uint64_t i = 1; i <= 20; ++i) REQUIRE(store->upsert(make_doc(i, {1, 0})).has_value());
        for (std::uint64_t i = 1; i <= 20; ++i) REQUIRE(store->upsert(make_doc(i, {0, 1})).has_value());
        for (std::uint64_t i = 1; i <= 10; ++i) REQUIRE(store->remove(DocumentId{i})->removed);
        const auto before = fs::file_size(path);
        REQUIRE(store->compact_log().has_value());
        REQUIRE(fs::file_size(path) < before);
        REQUIRE(store->upsert(make_doc(99, {1, 1})).has_value());
        REQUIRE(store->flush(true).has_value());
    }
    auto reopened = DocumentStore::open(StoreOptions{path, false});
    REQUIRE(reopened->size() == 11);
    REQUIRE(reopened->get(DocumentId{std::uint64_t{15}})->vector == std::vector<float>{0, 1});
    REQUIRE(reopened->contains(DocumentId{std::uint64_t{99}}));
}

TEST_CASE("dead slots are reclaimed by compaction and reopen", "[store][wal]") {
    const auto path = fresh_path("slots.wal");
    {
        auto store = DocumentStore::open(StoreOptions{path, false});
        for (std::uint64_t i = 1; i <= 100; ++i) {
            REQUIRE(store->upsert(make_doc(i, {1, 0}, i % 2 == 0 ? "en" : "de")).has_value());
            if (i > 5) REQUIRE(store->remove(DocumentId{i})->removed);
        }
        REQUIRE(store->stats().slots == 100);
        REQUIRE(store->size() == 5);
        REQUIRE(store->filter_handles(filter::eq("lang", "en"))->cardinality() == 2);
        REQUIRE(store->live_handles().cardinality() == 5);
        REQUIRE(store->compact_log().has_value());
    }
    auto reopened = DocumentStore::open(StoreOptions{path, false});
    REQUIRE(reopened->stats().slots == 5);
    REQUIRE(reopened->live_handles().maximum() == 4);
    REQUIRE(reopened->filter_handles(filter::eq("lang", "de"))->cardinality() == 3);
}

TEST_CASE("writes fail while the log cannot be reopened", "[store][wal]") {
    const auto path = fresh_path("blocked.wal");
    auto store = DocumentStore::open(StoreOptions{path, false});
    REQUIRE(store->upsert(make_doc(1, {1, 0})).has_value());

    // Put a non-empty directory where the log lives so the compacted log cannot replace it
    fs::remove(path);
    fs::create_directories(path / "blocker");

    auto compacted = store->compact_log();
    REQUIRE_FALSE(compacted.has_value());
    REQUIRE(compacted.error().code == core::error_code::io_failed);
    REQUIRE_FALSE(fs::exists(fs::path(path.string() + ".compact")));

    auto write = store->upsert(make_doc(2, {0, 1}));
    REQUIRE_FALSE(write.has_value());
    REQUIRE(write.error().code == core::error_code::io_failed);
    REQUIRE(store->remove(DocumentId{std::uint64_t{1}}).error().code == core::error_code::io_failed);
    REQUIRE(store->flush().error().code == core::error_code::io_failed);
    REQUIRE(store->size() == 1);
    REQUIRE_FALSE(store->contains(DocumentId{std::uint64_t{2}}));

    // Writes resume once the path is usable again
    fs::remove_all(path);
    REQUIRE(store->upsert(make_doc(2, {0, 1})).has_value());
    REQUIRE(store->flush(true).has_value());
    auto reopened = DocumentStore::open(StoreOptions{path, false});
    REQUIRE(reopened->stats().replayed_frames == 1);
    REQUIRE(reopened->contains(DocumentId{std::uint64_t{2}}));
}

TEST_CASE("concurrent writers on distinct ids", "[store][concurrency]") {
    auto store = DocumentStore::open(StoreOptions{});
    std::vector<std::thread> threads;
    for (std::uint64_t t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            for (std::uint64_t i = 0; i < 250; ++i) (void)store->upsert(make_doc(t * 1000 + i + 1, {1, 0}));
        });
    }
    for (auto& th : threads) th.join();
    REQUIRE(store->size() == 1000);
    REQUIRE(store->version() == 1000);
}
