#include <catch2/catch.hpp>
#include <relpack/result.hpp>
#include <memory>
#include <string>

using namespace relpack;

static Result<int> parse_count(const std::string& s) {
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
        return RelpackError{RelpackError::Parse, "not a count: '" + s + "'"};
    }
    return Result<int>::ok(std::stoi(s));
}

// Sum of two counts, stopping at the first bad one
static Result<int> add_counts(const std::string& a, const std::string& b) {
    auto x = parse_count(a);
    RELPACK_TRY(x);
    auto y = parse_count(b);
    RELPACK_TRY(y);
    return Result<int>::ok(x.value() + y.value());
}

static Status require_positive(int n) {
    if (n <= 0) return RelpackError{RelpackError::InvalidArg, "must be positive"};
    return ok_status();
}

TEST_CASE("ok and err results", "[result]") {
    auto ok = Result<int>::ok(42);
    REQUIRE(ok.is_ok());
    REQUIRE(static_cast<bool>(ok));
    REQUIRE(ok.value() == 42);

    auto err = Result<int>::err(RelpackError{RelpackError::NotFound, "missing"});
    REQUIRE(err.is_err());
    REQUIRE_FALSE(static_cast<bool>(err));
    REQUIRE(err.error().code == RelpackError::NotFound);
    REQUIRE(err.error().message == "missing");
}

TEST_CASE("wrong-side access throws bad_variant_access", "[result]") {
    auto err = Result<int>::err(RelpackError{RelpackError::IO, "fail"});
    REQUIRE_THROWS_AS(err.value(), std::bad_variant_access);

    auto ok = Result<int>::ok(1);
    REQUIRE_THROWS_AS(ok.error(), std::bad_variant_access);
}

TEST_CASE("value_or falls back on error", "[result]") {
    REQUIRE(parse_count("7").value_or(-1) == 7);
    REQUIRE(parse_count("x").value_or(-1) == -1);
}

TEST_CASE("RELPACK_TRY propagates the first error", "[result]") {
    REQUIRE(add_counts("2", "3").value() == 5);

    auto r = add_counts("2", "oops");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message == "not a count: 'oops'");

    auto first = add_counts("bad", "oops");
    REQUIRE(first.error().message == "not a count: 'bad'");
}

TEST_CASE("context prefixes the error message", "[result]") {
    auto r = parse_count("abc").context("reading jobs");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message == "reading jobs: not a count: 'abc'");
    REQUIRE(r.error().code == RelpackError::Parse);

    auto ok = parse_count("1").context("reading jobs");
    REQUIRE(ok.value() == 1);
}

TEST_CASE("Status results", "[result]") {
    REQUIRE(require_positive(3).is_ok());
    auto s = require_positive(0);
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == RelpackError::InvalidArg);
}

TEST_CASE("move-only values", "[result]") {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(99));
    REQUIRE(*r.value() == 99);
    std::unique_ptr<int> owned = std::move(r).value();
    REQUIRE(*owned == 99);
}

TEST_CASE("RelpackError format", "[error]") {
    RelpackError e{RelpackError::ArchiveRewrite, "cannot rewrite app_linux.tar.gz",
                   "check free space in dist/", "dist/app_linux.tar.gz", 0};
    auto text = e.format();
    REQUIRE(text.find("error[ArchiveRewriteFailure]") != std::string::npos);
    REQUIRE(text.find("hint: check free space in dist/") != std::string::npos);
    REQUIRE(text.find("--> dist/app_linux.tar.gz") != std::string::npos);
    REQUIRE(text.find("dist/app_linux.tar.gz:") == std::string::npos);

    RelpackError plain{RelpackError::Parse, "unexpected token"};
    auto p = plain.format();
    REQUIRE(p == "error[Parse]: unexpected token");
}

TEST_CASE("RelpackError code names", "[error]") {
    REQUIRE(std::string(RelpackError::code_name(RelpackError::InvalidVersionFormat)) == "InvalidVersionFormat");
    REQUIRE(std::string(RelpackError::code_name(RelpackError::MissingInputDirectory)) == "MissingInputDirectory");
    REQUIRE(std::string(RelpackError::code_name(RelpackError::ArchiveWrite)) == "ArchiveWriteFailure");
    REQUIRE(std::string(RelpackError::code_name(RelpackError::ArchiveExtract)) == "ArchiveExtractFailure");
    REQUIRE(std::string(RelpackError::code_name(RelpackError::RecordValidation)) == "RecordValidationError");
    REQUIRE(std::string(RelpackError::code_name(RelpackError::MissingRecords)) == "MissingRecordsError");
    REQUIRE(std::string(RelpackError::code_name(RelpackError::ExternalTool)) == "ExternalToolFailure");
}
