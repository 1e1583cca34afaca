#include "tessera/document.hpp"

#include <string>

namespace tessera {

auto validate_id(const DocumentId& id) -> std::expected<void, core::error> {
    if (const auto* n = std::get_if<std::uint64_t>(&id); n && *n == 0) {
        return core::fail(core::error_code::schema_mismatch, "document id 0 is reserved", "document");
    }
    if (const auto* s = std::get_if<std::string>(&id); s && s->empty()) {
        return core::fail(core::error_code::schema_mismatch, "document id must not be empty", "document");
    }
    return {};
}

auto to_string(const DocumentId& id) -> std::string {
    if (const auto* n = std::get_if<std::uint64_t>(&id)) return std::to_string(*n);
    return std::get<std::string>(id);
}

auto PayloadValue::as_double() const noexcept -> std::optional<double> {
    if (const auto* i = std::get_if<std::int64_t>(&value)) return static_cast<double>(*i);
    if (const auto* d = std::get_if<double>(&value)) return *d;
    return std::nullopt;
}

auto lookup_path(const Payload& payload, std::string_view path) -> const PayloadValue* {
    if (path.empty()) return nullptr;
    const Payload* current = &payload;
    const PayloadValue* found = nullptr;
    while (true) {
        const auto dot = path.find('.');
        const std::string_view part = path.substr(0, dot);
        auto it = current->find(std::string(part));
        if (it == current->end()) return nullptr;
        found = &it->second;
        if (dot == std::string_view::npos) return found;
        current = found->as_object();
        if (current == nullptr) return nullptr;
        path.remove_prefix(dot + 1);
    }
}

} // namespace tessera
