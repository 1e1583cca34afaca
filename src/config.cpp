#include "tessera/config.hpp"

#include <charconv>
#include <cmath>
#include <string>

#include "tessera/core/platform_utils.hpp"

namespace tessera {

namespace {

auto invalid(std::string message) -> std::unexpected<core::error> {
    return core::fail(core::error_code::precondition_failed, std::move(message), "config");
}

template <typename T>
auto parse_number(const std::string& text, const char* name) -> std::expected<T, core::error> {
    T value{};
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return invalid(std::string(name) + ": cannot parse '" + text + "'");
    }
    return value;
}

} // namespace

auto validate(const EngineConfig& config) -> std::expected<void, core::error> {
    const auto& c = config.collections;
    if (c.hnsw.M < 2) return invalid("hnsw.M must be >= 2");
    if (c.hnsw.efConstruction < c.hnsw.M) return invalid("hnsw.efConstruction must be >= hnsw.M");
    if (c.hnsw.max_M != 0 && c.hnsw.max_M < c.hnsw.M) return invalid("hnsw.max_M must be 0 or >= hnsw.M");
    if (!(c.bm25.k1 >= 0.0f) || !std::isfinite(c.bm25.k1)) return invalid("bm25.k1 must be finite and >= 0");
    if (!(c.bm25.b >= 0.0f && c.bm25.b <= 1.0f)) return invalid("bm25.b must be in [0, 1]");
    if (c.tokenizer.min_length == 0 || c.tokenizer.min_length > c.tokenizer.max_length) {
        return invalid("tokenizer lengths must satisfy 1 <= min_length <= max_length");
    }
    if (!(c.hybrid.rrf_k > 0.0f) || !std::isfinite(c.hybrid.rrf_k)) return invalid("hybrid.rrf_k must be > 0");
    if (c.hybrid.candidate_factor == 0) return invalid("hybrid.candidate_factor must be > 0");
    if (c.hybrid.ef_search == 0) return invalid("hybrid.ef_search must be > 0");
    if (!(c.maintenance.tombstone_ratio > 0.0f && c.maintenance.tombstone_ratio <= 1.0f)) {
        return invalid("maintenance.tombstone_ratio must be in (0, 1]");
    }
    if (c.maintenance.interval.count() <= 0) return invalid("maintenance.interval must be > 0");
    if (auto lvl = logging::parse_level(config.log.level); !lvl) return std::unexpected(lvl.error());
    return {};
}

auto apply_env_overrides(EngineConfig& config) -> std::expected<void, core::error> {
    if (auto v = core::safe_getenv("TESSERA_APPLY_MODE"); v && !v->empty()) {
        auto mode = collection::parse_apply_mode(*v);
        if (!mode) return std::unexpected(mode.error());
        config.collections.apply_mode = *mode;
    }
    if (auto v = core::safe_getenv("TESSERA_DATA_DIR")) {
        config.collections.data_dir = *v;
    }
    if (auto v = core::safe_getenv("TESSERA_LOG_LEVEL"); v && !v->empty()) {
        if (auto lvl = logging::parse_level(*v); !lvl) return std::unexpected(lvl.error());
        config.log.level = *v;
    }
    if (auto v = core::safe_getenv("TESSERA_RRF_K"); v && !v->empty()) {
        auto k = parse_number<float>(*v, "TESSERA_RRF_K");
        if (!k) return std::unexpected(k.error());
        if (!(*k > 0.0f) || !std::isfinite(*k)) return invalid("TESSERA_RRF_K must be > 0");
        config.collections.hybrid.rrf_k = *k;
    }
    if (auto v = core::safe_getenv("TESSERA_EF_SEARCH"); v && !v->empty()) {
        auto ef = parse_number<std::uint32_t>(*v, "TESSERA_EF_SEARCH");
        if (!ef) return std::unexpected(ef.error());
        if (*ef == 0) return invalid("TESSERA_EF_SEARCH must be > 0");
        config.collections.hybrid.ef_search = *ef;
    }
    return {};
}

} // namespace tessera
