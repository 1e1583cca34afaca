#pragma once

/** \file document.hpp
 *  \brief Document identifiers, payload values and documents.
 *
 * Ids are caller supplied: a positive integer or a non-empty string. Ordering puts every integer
 * id before every string id, which gives result lists a deterministic tie-break.
 * Payloads are open key/value trees; nested objects are addressed with dotted paths.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "tessera/error.hpp"

namespace tessera {

/** \brief Caller-supplied document identifier. */
using DocumentId = std::variant<std::uint64_t, std::string>;

/** \brief Rejects integer 0 and the empty string. */
auto validate_id(const DocumentId& id) -> std::expected<void, core::error>;

/** \brief Plain rendering for logs and messages ("42", "doc-a"). */
auto to_string(const DocumentId& id) -> std::string;

struct DocumentIdHash {
    auto operator()(const DocumentId& id) const noexcept -> std::size_t {
        return std::hash<DocumentId>{}(id);
    }
};

/** \brief Dynamic payload value. */
struct PayloadValue {
    using Array = std::vector<PayloadValue>;
    using Object = std::map<std::string, PayloadValue>;
    using variant_type = std::variant<std::monostate, bool, std::int64_t, double, std::string, Array, Object>;

    variant_type value;

    PayloadValue() = default;
    PayloadValue(std::nullptr_t) {}
    PayloadValue(bool b) : value(b) {}
    PayloadValue(int i) : value(static_cast<std::int64_t>(i)) {}
    PayloadValue(std::int64_t i) : value(i) {}
    PayloadValue(double d) : value(d) {}
    PayloadValue(const char* s) : value(std::string(s)) {}
    PayloadValue(std::string s) : value(std::move(s)) {}
    PayloadValue(Array a) : value(std::move(a)) {}
    PayloadValue(Object o) : value(std::move(o)) {}

    auto is_null() const noexcept -> bool { return std::holds_alternative<std::monostate>(value); }
    auto is_number() const noexcept -> bool {
        return std::holds_alternative<std::int64_t>(value) || std::holds_alternative<double>(value);
    }
    auto as_string() const noexcept -> const std::string* { return std::get_if<std::string>(&value); }
    auto as_object() const noexcept -> const Object* { return std::get_if<Object>(&value); }
    auto as_array() const noexcept -> const Array* { return std::get_if<Array>(&value); }
    /** \brief Numeric view of Int or Float values. */
    auto as_double() const noexcept -> std::optional<double>;

    friend bool operator==(const PayloadValue& a, const PayloadValue& b) = default;
};

using Payload = PayloadValue::Object;

/** \brief Resolve a dotted path ("meta.author.name") inside a payload; nullptr when absent. */
auto lookup_path(const Payload& payload, std::string_view path) -> const PayloadValue*;

/** \brief A stored document. */
struct Document {
    DocumentId id;
    std::vector<float> vector;
    Payload payload;

    friend bool operator==(const Document&, const Document&) = default;
};

} // namespace tessera
