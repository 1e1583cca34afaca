#include "tessera/collection/schema.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace tessera::collection {

namespace {

// Names double as file names under the data directory
auto is_safe_name(const std::string& name) -> bool {
    if (name.empty() || name.front() == '.' || name.size() > 255) return false;
    return std::all_of(name.begin(), name.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
               c == '_' || c == '-' || c == '.';
    });
}

} // namespace

auto CollectionSchema::text_field_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(text_fields.size());
    for (const auto& f : text_fields) names.push_back(f.name);
    return names;
}

auto validate_schema(const CollectionSchema& schema) -> std::expected<void, core::error> {
    using core::error_code;
    if (schema.name.empty()) {
        return core::fail(error_code::invalid_schema, "collection name must not be empty", "collection.schema");
    }
    if (!is_safe_name(schema.name)) {
        return core::fail(error_code::invalid_schema,
                          "collection name '" + schema.name + "' must use [A-Za-z0-9_.-] and not start with '.'",
                          "collection.schema");
    }
    if (schema.dimension <= 0) {
        return core::fail(error_code::invalid_schema,
                          "dimension must be > 0, got " + std::to_string(schema.dimension), "collection.schema");
    }
    if (schema.dimension > static_cast<std::int64_t>(UINT32_MAX)) {
        return core::fail(error_code::invalid_schema, "dimension too large", "collection.schema");
    }
    std::unordered_set<std::string> seen;
    for (const auto& field : schema.text_fields) {
        if (field.name.empty()) {
            return core::fail(error_code::invalid_schema, "text field name must not be empty", "collection.schema");
        }
        if (!seen.insert(field.name).second) {
            return core::fail(error_code::invalid_schema,
                              "duplicate text field '" + field.name + "'", "collection.schema");
        }
    }
    return {};
}

auto validate_document(const CollectionSchema& schema, const Document& doc)
    -> std::expected<std::map<std::string, std::string>, core::error> {
    using core::error_code;
    if (auto v = validate_id(doc.id); !v) return std::unexpected(v.error());

    if (doc.vector.size() != static_cast<std::size_t>(schema.dimension)) {
        return core::fail(error_code::schema_mismatch,
                          "vector length " + std::to_string(doc.vector.size()) + " != dimension " +
                              std::to_string(schema.dimension),
                          "collection.schema");
    }
    if (!std::all_of(doc.vector.begin(), doc.vector.end(), [](float x) { return std::isfinite(x); })) {
        return core::fail(error_code::schema_mismatch, "vector contains non-finite values", "collection.schema");
    }

    std::map<std::string, std::string> texts;
    for (const auto& field : schema.text_fields) {
        auto it = doc.payload.find(field.name);
        if (it == doc.payload.end() || it->second.is_null()) {
            if (field.required) {
                return core::fail(error_code::schema_mismatch,
                                  "required text field '" + field.name + "' is missing", "collection.schema");
            }
            continue;
        }
        const auto* text = it->second.as_string();
        if (text == nullptr) {
            return core::fail(error_code::schema_mismatch,
                              "text field '" + field.name + "' must be a string", "collection.schema");
        }
        texts.emplace(field.name, *text);
    }
    return texts;
}

} // namespace tessera::collection
