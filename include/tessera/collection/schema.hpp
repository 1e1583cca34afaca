#pragma once

/** \file schema.hpp
 *  \brief Collection schema and write-time validation.
 */

#include <cstdint>
#include <expected>
#include <map>
#include <string>
#include <vector>

#include "tessera/document.hpp"
#include "tessera/error.hpp"
#include "tessera/index/metric.hpp"

namespace tessera::collection {

/** \brief A payload field indexed for lexical search. */
struct TextFieldDef {
    std::string name;
    bool required{false};   /**< upserts without this field are rejected */
};

/** \brief Immutable shape of a collection. */
struct CollectionSchema {
    std::string name;
    std::int64_t dimension{0};
    index::MetricKind metric{index::MetricKind::Cosine};
    std::vector<TextFieldDef> text_fields;

    auto text_field_names() const -> std::vector<std::string>;
};

/** \brief Errors: invalid_schema for an empty or path-unsafe name, dimension <= 0, or empty or
 *  duplicate text field names. */
auto validate_schema(const CollectionSchema& schema) -> std::expected<void, core::error>;

/** \brief Check a document against a schema and extract its indexed text fields.
 *
 * Errors: schema_mismatch for an invalid id, wrong vector length, non-finite components, a
 * missing required text field, or a text field holding something other than a string. A Null
 * value counts as absent.
 */
auto validate_document(const CollectionSchema& schema, const Document& doc)
    -> std::expected<std::map<std::string, std::string>, core::error>;

} // namespace tessera::collection
