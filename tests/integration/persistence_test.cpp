/** \file persistence_test.cpp
 *  \brief Collections that log to a data directory survive engine restarts.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "tessera/engine.hpp"

using namespace tessera;
using collection::CollectionSchema;
using collection::TextFieldDef;
namespace fs = std::filesystem;

namespace {

fs::path fresh_dir(const std::string& name) {
    auto dir = fs::temp_directory_path() / "tessera_persistence_tests" / name;
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir);
    return dir;
}

EngineConfig config_for(const fs::path& dir, collection::ApplyMode mode = collection::ApplyMode::Sync) {
    EngineConfig config;
    config.collections.data_dir = dir;
    config.collections.apply_mode = mode;
    config.collections.maintenance.enabled = false;
    return config;
}

CollectionSchema notes_schema() {
    CollectionSchema s;
    s.name = "notes";
    s.dimension = 3;
    s.metric = index::MetricKind::Dot;
    s.text_fields = {TextFieldDef{"title", true}, TextFieldDef{"body", false}};
    return s;
}

Document note(std::uint64_t id, std::string title, std::string body) {
    return Document{DocumentId{id},
                    {static_cast<float>(id), 1.0f, 0.0f},
                    Payload{{"title", std::move(title)}, {"body", std::move(body)}, {"rank", static_cast<std::int64_t>(id)}}};
}

search::Query text(std::string q) {
    search::Query out;
    out.text = std::move(q);
    out.top_k = 10;
    return out;
}

} // namespace

TEST_CASE("documents survive an engine restart", "[persistence]") {
    const auto dir = fresh_dir("restart");
    const auto mode = GENERATE(collection::ApplyMode::Sync, collection::ApplyMode::Async);
    {
        auto engine = Engine::open(config_for(dir, mode));
        REQUIRE(engine->create_collection(notes_schema()).has_value());
        for (std::uint64_t i = 1; i <= 30; ++i) {
            REQUIRE(engine->upsert("notes", note(i, "title " + std::to_string(i), "body text")).has_value());
        }
        REQUIRE(engine->upsert("notes", note(5, "rewritten", "changed")).has_value());
        REQUIRE(*engine->remove("notes", DocumentId{std::uint64_t{7}}));
        REQUIRE(engine->flush("notes", true).has_value());
    }

    auto engine = Engine::open(config_for(dir, mode));
    REQUIRE(engine->create_collection(notes_schema()).has_value());
    auto s = *engine->stats("notes");
    REQUIRE(s.documents == 29);
    REQUIRE(s.vector_live == 29);
    REQUIRE(s.lexical_documents == 29);
    REQUIRE(s.store.replayed_frames == 32);
    REQUIRE(s.store.truncated_bytes == 0);

    REQUIRE(engine->get("notes", DocumentId{std::uint64_t{7}}).error().code == core::error_code::not_found);
    const auto five = *engine->get("notes", DocumentId{std::uint64_t{5}});
    REQUIRE(*five.payload.at("title").as_string() == "rewritten");

    auto r = engine->search("notes", text("rewritten"));
    REQUIRE(r->hits.size() == 1);
    REQUIRE(r->hits[0].id == DocumentId{std::uint64_t{5}});
    REQUIRE(engine->search("notes", text("changed"))->hits.size() == 1);

    search::Query filtered = text("title body");
    filtered.filter = filter::lte("rank", 3);
    REQUIRE(engine->search("notes", filtered)->hits.size() == 3);
}

TEST_CASE("a torn log tail is dropped on reopen", "[persistence][wal]") {
    const auto dir = fresh_dir("torn");
    {
        auto engine = Engine::open(config_for(dir));
        REQUIRE(engine->create_collection(notes_schema()).has_value());
        REQUIRE(engine->upsert("notes", note(1, "first", "")).has_value());
        REQUIRE(engine->upsert("notes", note(2, "second", "")).has_value());
        REQUIRE(engine->flush("notes", true).has_value());
    }
    const auto wal = dir / "notes.wal";
    const auto clean_size = fs::file_size(wal);
    {
        // Shorter than a frame header
        std::ofstream out(wal, std::ios::binary | std::ios::app);
        const char junk[] = {0x40, 0x00, 0x00, 0x00, 0x01, 0x02, 0x03};
        out.write(junk, sizeof(junk));
    }
    REQUIRE(fs::file_size(wal) == clean_size + 7);

    {
        auto engine = Engine::open(config_for(dir));
        REQUIRE(engine->create_collection(notes_schema()).has_value());
        auto s = *engine->stats("notes");
        REQUIRE(s.documents == 2);
        REQUIRE(s.store.truncated_bytes == 7);
        REQUIRE(fs::file_size(wal) == clean_size);

        // New writes append after the valid prefix
        REQUIRE(engine->upsert("notes", note(3, "third", "")).has_value());
        REQUIRE(engine->flush("notes", true).has_value());
    }

    auto engine = Engine::open(config_for(dir));
    REQUIRE(engine->create_collection(notes_schema()).has_value());
    REQUIRE(engine->stats("notes")->documents == 3);
    REQUIRE(engine->stats("notes")->store.truncated_bytes == 0);
}

TEST_CASE("a log written under another schema is rejected", "[persistence]") {
    const auto dir = fresh_dir("schema_change");
    const auto wal = dir / "notes.wal";
    {
        auto engine = Engine::open(config_for(dir));
        REQUIRE(engine->create_collection(notes_schema()).has_value());
        for (std::uint64_t i = 1; i <= 3; ++i) {
            REQUIRE(engine->upsert("notes", note(i, "kept", "")).has_value());
        }
        REQUIRE(engine->flush("notes", true).has_value());
    }
    const auto logged = fs::file_size(wal);

    auto wider = notes_schema();
    wider.dimension = 64;
    auto renamed_field = notes_schema();
    renamed_field.text_fields = {TextFieldDef{"heading", true}};
    const auto changed = GENERATE_COPY(wider, renamed_field);
    {
        auto engine = Engine::open(config_for(dir));
        auto created = engine->create_collection(changed);
        REQUIRE_FALSE(created.has_value());
        REQUIRE(created.error().code == core::error_code::schema_mismatch);
        REQUIRE(engine->stats("notes").error().code == core::error_code::not_found);
        REQUIRE(engine->list_collections().empty());
    }
    REQUIRE(fs::file_size(wal) == logged);

    auto engine = Engine::open(config_for(dir));
    REQUIRE(engine->create_collection(notes_schema()).has_value());
    REQUIRE(engine->stats("notes")->documents == 3);

    search::Query q;
    q.vector = std::vector<float>{1.0f, 1.0f, 0.0f};
    q.top_k = 5;
    REQUIRE(engine->search("notes", q)->hits.size() == 3);
}

TEST_CASE("log compaction keeps only live documents", "[persistence][wal]") {
    const auto dir = fresh_dir("compact");
    const auto wal = dir / "notes.wal";
    {
        auto engine = Engine::open(config_for(dir));
        REQUIRE(engine->create_collection(notes_schema()).has_value());
        for (int round = 0; round < 5; ++round) {
            for (std::uint64_t i = 1; i <= 20; ++i) {
                REQUIRE(engine->upsert("notes", note(i, "round " + std::to_string(round), "")).has_value());
            }
        }
        for (std::uint64_t i = 11; i <= 20; ++i) REQUIRE(*engine->remove("notes", DocumentId{i}));
        REQUIRE(engine->flush("notes", true).has_value());
        const auto before = fs::file_size(wal);

        auto report = engine->compact("notes");
        REQUIRE(report.has_value());
        REQUIRE(report->log_compacted);
        REQUIRE(fs::file_size(wal) < before);
        REQUIRE_FALSE(fs::exists(fs::path(wal.string() + ".compact")));
    }

    auto engine = Engine::open(config_for(dir));
    REQUIRE(engine->create_collection(notes_schema()).has_value());
    auto s = *engine->stats("notes");
    REQUIRE(s.documents == 10);
    REQUIRE(s.store.replayed_frames == 10);
    REQUIRE(*engine->get("notes", DocumentId{std::uint64_t{4}})->payload.at("title").as_string() == "round 4");
}

TEST_CASE("dropping a collection removes its log", "[persistence]") {
    const auto dir = fresh_dir("drop");
    auto engine = Engine::open(config_for(dir));
    REQUIRE(engine->create_collection(notes_schema()).has_value());
    REQUIRE(engine->upsert("notes", note(1, "x", "")).has_value());
    REQUIRE(engine->flush("notes", true).has_value());
    REQUIRE(fs::exists(dir / "notes.wal"));

    REQUIRE(engine->drop_collection("notes").has_value());
    REQUIRE_FALSE(fs::exists(dir / "notes.wal"));

    // The name starts empty again
    REQUIRE(engine->create_collection(notes_schema()).has_value());
    REQUIRE(engine->stats("notes")->documents == 0);
}
