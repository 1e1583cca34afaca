/** \file config_test.cpp
 *  \brief Configuration validation, environment overrides and logger setup.
 */

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <string>

#include <spdlog/spdlog.h>

#include "tessera/config.hpp"
#include "tessera/logging.hpp"

using namespace tessera;

namespace {

// Sets a variable for the lifetime of the guard.
class EnvGuard {
public:
    EnvGuard(const char* name, const char* value) : name_(name) { ::setenv(name, value, 1); }
    ~EnvGuard() { ::unsetenv(name_); }
    EnvGuard(const EnvGuard&) = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

private:
    const char* name_;
};

} // namespace

TEST_CASE("defaults validate", "[config]") {
    EngineConfig config;
    REQUIRE(validate(config).has_value());
    REQUIRE(config.collections.apply_mode == collection::ApplyMode::Sync);
    REQUIRE(config.collections.hybrid.rrf_k == 60.0f);
    REQUIRE(config.collections.data_dir.empty());
}

TEST_CASE("validation names the offending field", "[config]") {
    EngineConfig config;

    SECTION("hnsw") {
        config.collections.hnsw.M = 1;
        auto r = validate(config);
        REQUIRE(r.error().code == core::error_code::precondition_failed);
        REQUIRE(r.error().message.find("hnsw.M") != std::string::npos);
    }
    SECTION("bm25") {
        config.collections.bm25.b = 1.5f;
        REQUIRE(validate(config).error().message.find("bm25.b") != std::string::npos);
    }
    SECTION("rrf") {
        config.collections.hybrid.rrf_k = 0.0f;
        REQUIRE(validate(config).error().message.find("rrf_k") != std::string::npos);
    }
    SECTION("maintenance") {
        config.collections.maintenance.tombstone_ratio = 0.0f;
        REQUIRE_FALSE(validate(config).has_value());
    }
    SECTION("log level") {
        config.log.level = "loud";
        REQUIRE(validate(config).error().code == core::error_code::precondition_failed);
    }
}

TEST_CASE("environment overrides apply", "[config][env]") {
    EnvGuard mode("TESSERA_APPLY_MODE", "Async");
    EnvGuard dir("TESSERA_DATA_DIR", "/tmp/tessera-env");
    EnvGuard level("TESSERA_LOG_LEVEL", "debug");
    EnvGuard rrf("TESSERA_RRF_K", "30.5");
    EnvGuard ef("TESSERA_EF_SEARCH", "256");

    EngineConfig config;
    REQUIRE(apply_env_overrides(config).has_value());
    REQUIRE(config.collections.apply_mode == collection::ApplyMode::Async);
    REQUIRE(config.collections.data_dir == "/tmp/tessera-env");
    REQUIRE(config.log.level == "debug");
    REQUIRE(config.collections.hybrid.rrf_k == 30.5f);
    REQUIRE(config.collections.hybrid.ef_search == 256);
    REQUIRE(validate(config).has_value());
}

TEST_CASE("bad environment values are rejected", "[config][env]") {
    EngineConfig config;
    SECTION("apply mode") {
        EnvGuard g("TESSERA_APPLY_MODE", "eventually");
        REQUIRE(apply_env_overrides(config).error().code == core::error_code::precondition_failed);
    }
    SECTION("rrf_k not a number") {
        EnvGuard g("TESSERA_RRF_K", "sixty");
        REQUIRE_FALSE(apply_env_overrides(config).has_value());
    }
    SECTION("rrf_k negative") {
        EnvGuard g("TESSERA_RRF_K", "-1");
        REQUIRE_FALSE(apply_env_overrides(config).has_value());
    }
    SECTION("ef_search trailing junk") {
        EnvGuard g("TESSERA_EF_SEARCH", "64x");
        REQUIRE_FALSE(apply_env_overrides(config).has_value());
    }
    REQUIRE(config.collections.hybrid.rrf_k == 60.0f);
}

TEST_CASE("log levels parse with aliases", "[config][logging]") {
    REQUIRE(*logging::parse_level("INFO") == spdlog::level::info);
    REQUIRE(*logging::parse_level("warning") == spdlog::level::warn);
    REQUIRE(*logging::parse_level("err") == spdlog::level::err);
    REQUIRE(*logging::parse_level("none") == spdlog::level::off);
    REQUIRE(logging::parse_level("verbose").error().code == core::error_code::precondition_failed);
}

TEST_CASE("configure installs the default logger", "[config][logging]") {
    logging::LogConfig config;
    config.level = "warn";
    REQUIRE(logging::configure(config).has_value());
    REQUIRE(spdlog::default_logger()->name() == "tessera");
    REQUIRE(spdlog::get_level() == spdlog::level::warn);

    config.level = "bogus";
    REQUIRE_FALSE(logging::configure(config).has_value());
    REQUIRE(spdlog::get_level() == spdlog::level::warn);

    config.level = "info";
    REQUIRE(logging::configure(config).has_value());
}
