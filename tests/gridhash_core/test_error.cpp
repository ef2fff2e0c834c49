// gridhash_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <gridhash/core/error.hpp>
#include <string>

using namespace gridhash_core;

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error construction", "[core][error]") {
    SECTION("from string") {
        Error err("Test error");
        REQUIRE(err.message() == "Test error");
        REQUIRE(err.code() == ErrorCode::Unknown);
    }

    SECTION("from code and message") {
        Error err(ErrorCode::ParseError, "Bad json");
        REQUIRE(err.code() == ErrorCode::ParseError);
        REQUIRE(err.message() == "Bad json");
    }

    SECTION("with context") {
        Error err = Error("Base error").with_context("key", "value");
        auto* ctx = err.get_context("key");
        REQUIRE(ctx != nullptr);
        REQUIRE(*ctx == "value");
        REQUIRE(err.get_context("missing") == nullptr);
    }
}

TEST_CASE("SpatialError factory methods", "[core][error]") {
    SECTION("invalid_configuration") {
        Error err = SpatialError::invalid_configuration("spacing must be > 0");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.is<SpatialError>());
        REQUIRE(err.as<SpatialError>()->kind == SpatialError::Kind::InvalidConfiguration);
        REQUIRE(err.message().find("spacing") != std::string::npos);
    }

    SECTION("capacity_exceeded") {
        Error err = SpatialError::capacity_exceeded(2, 1);
        REQUIRE(err.code() == ErrorCode::CapacityExceeded);
        const auto* spatial = err.as<SpatialError>();
        REQUIRE(spatial != nullptr);
        REQUIRE(spatial->required == 2);
        REQUIRE(spatial->capacity == 1);
    }

    SECTION("malformed_entity") {
        Error err = SpatialError::malformed_entity(7, "extent is negative");
        REQUIRE(err.code() == ErrorCode::ValidationError);
        REQUIRE(err.as<SpatialError>()->entity_index == 7);
        REQUIRE(err.message().find("index 7") != std::string::npos);
    }

    SECTION("generic error is not spatial") {
        Error err("plain");
        REQUIRE_FALSE(err.is<SpatialError>());
        REQUIRE(err.as<SpatialError>() == nullptr);
    }
}

TEST_CASE("Error chain formatting", "[core][error]") {
    SECTION("spatial error includes kind and payload") {
        Error err = SpatialError::capacity_exceeded(9, 4);
        std::string chain = build_error_chain(err);
        REQUIRE(chain.find("[CapacityExceeded]") != std::string::npos);
        REQUIRE(chain.find("required: 9") != std::string::npos);
        REQUIRE(chain.find("capacity: 4") != std::string::npos);
    }

    SECTION("context is appended") {
        Error err(ErrorCode::IOError, "Failed to open");
        err.with_context("path", "grid.json");
        std::string chain = build_error_chain(err);
        REQUIRE(chain.find("[IOError] Failed to open") != std::string::npos);
        REQUIRE(chain.find("path=\"grid.json\"") != std::string::npos);
    }
}

TEST_CASE("Error statistics", "[core][error]") {
    debug::reset_error_stats();
    REQUIRE(debug::total_error_count() == 0);

    debug::record_error(SpatialError::capacity_exceeded(3, 2));
    debug::record_error(SpatialError::malformed_entity(0, "extent is negative"));
    debug::record_error(Error("generic"));

    REQUIRE(debug::total_error_count() == 3);
    REQUIRE(debug::spatial_error_count(SpatialError::Kind::CapacityExceeded) == 1);
    REQUIRE(debug::spatial_error_count(SpatialError::Kind::MalformedEntity) == 1);
    REQUIRE(debug::spatial_error_count(SpatialError::Kind::InvalidConfiguration) == 0);
    REQUIRE(debug::error_stats_summary().find("CapacityExceeded: 1") != std::string::npos);

    debug::reset_error_stats();
    REQUIRE(debug::total_error_count() == 0);
}

// =============================================================================
// Result<T> Tests
// =============================================================================

TEST_CASE("Result construction", "[core][result]") {
    SECTION("Ok with value") {
        Result<int> r = Ok(42);
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
        REQUIRE(r.value() == 42);
    }

    SECTION("Ok void") {
        Result<void> r = Ok();
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
    }

    SECTION("Err with message") {
        Result<int> r = Err<int>(std::string("failed"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().message() == "failed");
    }

    SECTION("Err void from spatial error") {
        Result<void> r = Error(SpatialError::capacity_exceeded(2, 1));
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::CapacityExceeded);
    }
}

TEST_CASE("Result value access", "[core][result]") {
    SECTION("value_or on Err") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE(r.value_or(0) == 0);
    }

    SECTION("unwrap on Ok") {
        Result<int> r = Ok(42);
        REQUIRE(r.unwrap() == 42);
    }

    SECTION("unwrap on Err throws") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE_THROWS_AS(r.unwrap(), std::runtime_error);

        Result<void> v = Err(Error("error"));
        REQUIRE_THROWS_AS(v.unwrap(), std::runtime_error);
    }
}

TEST_CASE("Result map operations", "[core][result]") {
    SECTION("map on Ok") {
        Result<int> r = Ok(21);
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == 42);
    }

    SECTION("map on Err keeps error") {
        Result<int> r = Err<int>(Error(ErrorCode::ParseError, "error"));
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_err());
        REQUIRE(r2.error().code() == ErrorCode::ParseError);
    }

    SECTION("and_then on Ok") {
        Result<int> r = Ok(42);
        auto r2 = r.and_then([](int x) -> Result<std::string> {
            return Ok(std::to_string(x));
        });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == "42");
    }
}
