#include <catch2/catch_test_macros.hpp>
#include "core/result.hpp"

using namespace marginalia;

TEST_CASE("Result::ok creates a success result", "[result]") {
    auto result = Result<int>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.unwrap() == 42);
}

TEST_CASE("Result::err carries kind, code and message", "[result]") {
    auto result = Result<int>::err(Error::export_options("invalid_title", "Book title is required"));

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().kind == ErrorKind::ExportOptions);
    REQUIRE(result.unwrap_err().code == "invalid_title");
    REQUIRE(result.unwrap_err().message == "Book title is required");
}

TEST_CASE("Error::describe names the category", "[result]") {
    const auto error = Error::configuration("invalid_sort_field", "Unknown sort field: size");
    REQUIRE(error.describe() == "ConfigurationError (invalid_sort_field): Unknown sort field: size");
    REQUIRE(kind_name(ErrorKind::Validation) == "ValidationError");
    REQUIRE(kind_name(ErrorKind::Storage) == "StorageError");
}

TEST_CASE("Result::unwrap throws on error", "[result]") {
    auto result = Result<int>::err(Error::validation("x", "error"));

    REQUIRE_THROWS_AS(result.unwrap(), std::runtime_error);
}

TEST_CASE("Result::value_or returns default on error", "[result]") {
    auto ok_result = Result<int>::ok(42);
    auto err_result = Result<int>::err(Error::validation("x", "error"));

    REQUIRE(ok_result.value_or(0) == 42);
    REQUIRE(err_result.value_or(0) == 0);
}

TEST_CASE("Result::map transforms success value", "[result]") {
    auto mapped = Result<int>::ok(21).map([](int x) { return x * 2; });

    REQUIRE(mapped.is_ok());
    REQUIRE(mapped.unwrap() == 42);
}

TEST_CASE("Result::map propagates error", "[result]") {
    auto result = Result<int>::err(Error::storage("read_failed", "error"));
    auto mapped = result.map([](int x) { return x * 2; });

    REQUIRE(mapped.is_err());
    REQUIRE(mapped.unwrap_err().code == "read_failed");
}

TEST_CASE("Result::and_then chains operations", "[result]") {
    auto divide = [](int x) -> Result<int> {
        if (x == 0) return Result<int>::err(Error::validation("div", "division by zero"));
        return Result<int>::ok(100 / x);
    };

    REQUIRE(Result<int>::ok(5).and_then(divide).unwrap() == 20);
    REQUIRE(Result<int>::ok(0).and_then(divide).unwrap_err().message == "division by zero");
}

TEST_CASE("Result::match dispatches on state", "[result]") {
    auto ok = Result<int>::ok(1);
    auto err = Result<int>::err(Error::io("read_failed", "nope"));

    auto describe = [](const Result<int>& r) {
        return r.match([](int v) { return std::to_string(v); },
                       [](const Error& e) { return e.code; });
    };
    REQUIRE(describe(ok) == "1");
    REQUIRE(describe(err) == "read_failed");
}

TEST_CASE("Result<void> reports success and failure", "[result]") {
    auto ok = Result<void>::ok();
    auto err = Result<void>::err(Error::validation("empty_note", "Note content is required"));

    REQUIRE(ok.is_ok());
    REQUIRE(err.is_err());
    REQUIRE(err.unwrap_err().code == "empty_note");
    REQUIRE_THROWS_AS(err.unwrap(), std::runtime_error);

    auto chained = ok.and_then([]() { return Result<int>::ok(7); });
    REQUIRE(chained.unwrap() == 7);
}
