#include <catch2/catch_test_macros.hpp>
#include "core/import_types.hpp"
#include "core/result.hpp"

using namespace listall;

TEST_CASE("Result::ok creates a success result", "[result]") {
    auto result = Result<int>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.unwrap() == 42);
}

TEST_CASE("Result::err creates an error result", "[result]") {
    auto result = Result<int>::err(Error{"disk full", 13});

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().message == "disk full");
    REQUIRE(result.unwrap_err().code == 13);
}

TEST_CASE("Result::unwrap throws on error", "[result]") {
    auto result = Result<int>::err(Error{"error"});
    REQUIRE_THROWS_AS(result.unwrap(), std::runtime_error);

    auto success = Result<int>::ok(1);
    REQUIRE_THROWS_AS(success.unwrap_err(), std::runtime_error);
}

TEST_CASE("Result::unwrap on ImportError mentions the description", "[result]") {
    auto result = Result<int, ImportError>::err(ImportError::decoding_failed("lists: missing required field"));
    try {
        (void)result.unwrap();
        FAIL("unwrap did not throw");
    } catch (const std::runtime_error& e) {
        REQUIRE(std::string(e.what()).find("Failed to decode data: lists: missing required field") != std::string::npos);
    }
}

TEST_CASE("Result with the same value and error type", "[result]") {
    auto ok = Result<std::string, std::string>::ok("value");
    auto err = Result<std::string, std::string>::err("problem");

    REQUIRE(ok.is_ok());
    REQUIRE(ok.unwrap() == "value");
    REQUIRE(err.is_err());
    REQUIRE(err.unwrap_err() == "problem");
}

TEST_CASE("Result::value_or returns the fallback on error", "[result]") {
    REQUIRE(Result<int>::ok(42).value_or(0) == 42);
    REQUIRE(Result<int>::err(Error{"error"}).value_or(7) == 7);
}

TEST_CASE("Result::map and map_err", "[result]") {
    auto doubled = Result<int>::ok(21).map([](int x) { return x * 2; });
    REQUIRE(doubled.unwrap() == 42);

    auto untouched = Result<int>::err(Error{"error"}).map([](int x) { return x * 2; });
    REQUIRE(untouched.unwrap_err().message == "error");

    auto converted = Result<int>::err(Error{"locked", 5}).map_err([](const Error& e) {
        return ImportError::repository_error(e.message);
    });
    REQUIRE(converted.unwrap_err() == ImportError::repository_error("locked"));
}

TEST_CASE("Result::and_then chains and short-circuits", "[result]") {
    auto divide = [](int x) -> Result<int> {
        if (x == 0) return Result<int>::err(Error{"division by zero"});
        return Result<int>::ok(100 / x);
    };

    REQUIRE(Result<int>::ok(5).and_then(divide).unwrap() == 20);
    REQUIRE(Result<int>::ok(0).and_then(divide).unwrap_err().message == "division by zero");
    REQUIRE(Result<int>::err(Error{"first"}).and_then(divide).unwrap_err().message == "first");
}

TEST_CASE("Result<void> works correctly", "[result]") {
    auto ok_result = Result<void>::ok();
    auto err_result = Result<void>::err(Error{"error"});

    REQUIRE(ok_result.is_ok());
    REQUIRE(err_result.is_err());
    REQUIRE_NOTHROW(ok_result.unwrap());
    REQUIRE_THROWS(err_result.unwrap());

    int calls = 0;
    auto chained = ok_result.and_then([&] { ++calls; return Result<void>::err(Error{"second"}); })
                            .and_then([&] { ++calls; return Result<void>::ok(); });
    REQUIRE(calls == 1);
    REQUIRE(chained.unwrap_err().message == "second");
}

TEST_CASE("ImportError descriptions", "[result]") {
    REQUIRE(ImportError::invalid_data().describe() == "The provided data is invalid or corrupted");
    REQUIRE(ImportError::invalid_format().describe() == "The file format is not supported");
    REQUIRE(ImportError::decoding_failed("x").describe() == "Failed to decode data: x");
    REQUIRE(ImportError::validation_failed("y").describe() == "Data validation failed: y");
    REQUIRE(ImportError::repository_error("z").describe() == "Failed to save data: z");
    REQUIRE(ImportError::cancelled().describe() == "Import was cancelled");
    REQUIRE(error_kind_name(ImportError::Kind::DecodingFailed) == "decodingFailed");
}
