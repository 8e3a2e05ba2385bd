#include <catch2/catch_test_macros.hpp>
#include "waypoint/core/result.hpp"

#include <stdexcept>

using namespace waypoint::core;

TEST_CASE("Result with value", "[result]") {
    auto result = Result<int, std::string>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.value() == 42);
}

TEST_CASE("Result with error", "[result]") {
    auto result = Result<int, std::string>::err("something went wrong");

    REQUIRE_FALSE(result.is_ok());
    REQUIRE(result.is_err());
    REQUIRE(result.error() == "something went wrong");
}

TEST_CASE("Result void success", "[result]") {
    auto result = Result<void, Error>::ok();

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
}

TEST_CASE("Result void error carries code and context", "[result]") {
    auto result = Result<void, Error>::err(ErrorCode::ConcurrencyTimeout, "Session is busy", "sess_1");

    REQUIRE(result.is_err());
    REQUIRE(result.error().code == ErrorCode::ConcurrencyTimeout);
    REQUIRE(result.error().full_message() == "Session is busy [sess_1]");
    REQUIRE(result.error().is_retriable());
}

TEST_CASE("Result value on error throws", "[result]") {
    auto result = Result<int, Error>::err(ErrorCode::NotFound);

    REQUIRE_THROWS_AS(result.value(), std::logic_error);
}

TEST_CASE("Result map and and_then", "[result]") {
    auto doubled = Result<int, Error>::ok(21).map([](int v) { return v * 2; });
    REQUIRE(doubled.value() == 42);

    auto chained = Result<int, Error>::ok(1).and_then([](int) {
        return Result<std::string, Error>::err(ErrorCode::InvalidArgument, "bad");
    });
    REQUIRE(chained.is_err());
    REQUIRE(chained.error().code == ErrorCode::InvalidArgument);

    REQUIRE(Result<int, Error>::err(ErrorCode::Unknown).unwrap_or(7) == 7);
}

namespace {

Result<void, Error> fails_with(ErrorCode code) {
    return Result<void, Error>::err(code);
}

Result<void, Error> forwards(ErrorCode code, bool& reached_end) {
    WAYPOINT_TRY_VOID(fails_with(code));
    reached_end = true;
    return Result<void, Error>::ok();
}

}  // namespace

TEST_CASE("WAYPOINT_TRY_VOID returns early", "[result]") {
    bool reached_end = false;
    auto result = forwards(ErrorCode::PersistenceFailed, reached_end);

    REQUIRE(result.is_err());
    REQUIRE(result.error().code == ErrorCode::PersistenceFailed);
    REQUIRE_FALSE(reached_end);
}

TEST_CASE("Error code classification", "[result]") {
    REQUIRE(is_retriable(ErrorCode::ToolTimeout));
    REQUIRE(is_retriable(ErrorCode::NetworkError));
    REQUIRE_FALSE(is_retriable(ErrorCode::DiffValidationFailed));
    REQUIRE_FALSE(is_retriable(ErrorCode::ToolNotFound));
    REQUIRE(is_fatal(ErrorCode::StateCorrupted));
    REQUIRE_FALSE(is_fatal(ErrorCode::PersistenceFailed));
}
