#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>
#include <string>

#include "tessera/collection/schema.hpp"

using namespace tessera;
using namespace tessera::collection;

namespace {

CollectionSchema articles() {
    return CollectionSchema{"articles", 3, index::MetricKind::Cosine,
                            {TextFieldDef{"title", true}, TextFieldDef{"body", false}}};
}

} // namespace

TEST_CASE("schema validation", "[schema]") {
    REQUIRE(validate_schema(articles()).has_value());

    auto s = articles();
    SECTION("empty name") {
        s.name.clear();
        REQUIRE(validate_schema(s).error().code == core::error_code::invalid_schema);
    }
    SECTION("path-unsafe name") {
        s.name = "../escape";
        REQUIRE(validate_schema(s).error().code == core::error_code::invalid_schema);
    }
    SECTION("non-positive dimension") {
        s.dimension = 0;
        REQUIRE(validate_schema(s).error().code == core::error_code::invalid_schema);
        s.dimension = -4;
        REQUIRE(validate_schema(s).error().code == core::error_code::invalid_schema);
    }
    SECTION("duplicate text fields") {
        s.text_fields.push_back(TextFieldDef{"title", false});
        REQUIRE(validate_schema(s).error().code == core::error_code::invalid_schema);
    }
    SECTION("empty text field name") {
        s.text_fields.push_back(TextFieldDef{"", false});
        REQUIRE(validate_schema(s).error().code == core::error_code::invalid_schema);
    }
    SECTION("no text fields is allowed") {
        s.text_fields.clear();
        REQUIRE(validate_schema(s).has_value());
    }
}

TEST_CASE("document validation extracts text fields", "[schema]") {
    const auto s = articles();
    Document doc{DocumentId{std::string("a")}, {1, 2, 3},
                 Payload{{"title", "Hello"}, {"body", "World"}, {"other", 5}}};

    auto texts = validate_document(s, doc);
    REQUIRE(texts.has_value());
    REQUIRE(texts->size() == 2);
    REQUIRE(texts->at("title") == "Hello");

    SECTION("optional field may be absent or null") {
        doc.payload.erase("body");
        REQUIRE(validate_document(s, doc)->size() == 1);
        doc.payload["body"] = nullptr;
        REQUIRE(validate_document(s, doc)->size() == 1);
    }
    SECTION("required field missing") {
        doc.payload.erase("title");
        REQUIRE(validate_document(s, doc).error().code == core::error_code::schema_mismatch);
    }
    SECTION("text field with a non-string value") {
        doc.payload["body"] = 12;
        REQUIRE(validate_document(s, doc).error().code == core::error_code::schema_mismatch);
    }
    SECTION("wrong vector length") {
        doc.vector.push_back(4);
        REQUIRE(validate_document(s, doc).error().code == core::error_code::schema_mismatch);
    }
    SECTION("non-finite component") {
        doc.vector[1] = std::numeric_limits<float>::infinity();
        REQUIRE(validate_document(s, doc).error().code == core::error_code::schema_mismatch);
    }
    SECTION("invalid id") {
        doc.id = DocumentId{std::uint64_t{0}};
        REQUIRE(validate_document(s, doc).error().code == core::error_code::schema_mismatch);
    }
}
