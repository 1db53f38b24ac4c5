#include <catch2/catch_test_macros.hpp>

#include "llmgate/core/error.hpp"

TEST_CASE("Error creation and accessors", "[core][error]") {
    SECTION("basic error") {
        llmgate::Error err(llmgate::ErrorCode::NotFound, "resource not found");
        CHECK(err.code() == llmgate::ErrorCode::NotFound);
        CHECK(err.message() == "resource not found");
        CHECK(err.detail() == "");
        CHECK(err.what() == "resource not found");
    }

    SECTION("error with detail") {
        llmgate::Error err(llmgate::ErrorCode::DatabaseError,
                           "query failed", "disk I/O error");
        CHECK(err.code() == llmgate::ErrorCode::DatabaseError);
        CHECK(err.detail() == "disk I/O error");
        CHECK(err.what() == "query failed: disk I/O error");
    }
}

TEST_CASE("Result carries value or error", "[core][error]") {
    llmgate::Result<int> ok = 42;
    REQUIRE(ok.has_value());
    CHECK(*ok == 42);

    llmgate::Result<int> failed = std::unexpected(
        llmgate::make_error(llmgate::ErrorCode::InvalidArgument, "bad value"));
    REQUIRE_FALSE(failed.has_value());
    CHECK(failed.error().code() == llmgate::ErrorCode::InvalidArgument);
}

TEST_CASE("make_fail converts into any Result", "[core][error]") {
    llmgate::Result<std::string> r =
        llmgate::make_fail(llmgate::make_error(llmgate::ErrorCode::Cancelled, "stop"));
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code() == llmgate::ErrorCode::Cancelled);

    llmgate::Result<void> v = llmgate::ok_result();
    CHECK(v.has_value());
}

TEST_CASE("Error code names round-trip", "[core][error]") {
    using llmgate::ErrorCode;
    for (auto code : {ErrorCode::NoProviderAvailable, ErrorCode::ProviderNotInitialized,
                      ErrorCode::RequestIdMismatch, ErrorCode::Cancelled,
                      ErrorCode::ConnectionClosed, ErrorCode::LoadFailed}) {
        CHECK(llmgate::error_code_from_string(llmgate::error_code_to_string(code)) == code);
    }
    CHECK(llmgate::error_code_to_string(ErrorCode::NoProviderAvailable) ==
          "NO_PROVIDER_AVAILABLE");
    CHECK(llmgate::error_code_from_string("SOMETHING_ELSE") == ErrorCode::Unknown);
}

TEST_CASE("Distinct kinds for resolution failures", "[core][error]") {
    CHECK(llmgate::ErrorCode::NoProviderAvailable != llmgate::ErrorCode::ProviderNotInitialized);
    CHECK(llmgate::ErrorCode::Cancelled != llmgate::ErrorCode::TransportError);
}
