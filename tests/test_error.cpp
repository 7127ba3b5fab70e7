#include <catch2/catch.hpp>
#include <akin/error.hpp>
#include <string>

using namespace akin;

TEST_CASE("format() includes kind, location and hint", "[error]") {
    AkinError e{AkinError::Syntax, "expected ';'", "declarations end with ';'",
                "traits.akin", 3, 14};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[Syntax]: expected ';'") != std::string::npos);
    REQUIRE(formatted.find("--> traits.akin:3:14") != std::string::npos);
    REQUIRE(formatted.find("hint: declarations end with ';'") != std::string::npos);
}

TEST_CASE("format() without hint or file", "[error]") {
    AkinError e{AkinError::IO, "could not open file"};
    auto formatted = e.format();
    REQUIRE(formatted == "error[IO]: could not open file");
}

TEST_CASE("format_with_source() underlines the span", "[error]") {
    std::string source = "let &a = [1];\nx = *b;\n";
    AkinError e{AkinError::UndeclaredVariable, "use of undeclared variable 'b'",
                "", "t.akin", 2, 5, 2};
    auto formatted = e.format_with_source(source);
    REQUIRE(formatted.find("--> t.akin:2:5") != std::string::npos);
    REQUIRE(formatted.find(" 2 | x = *b;") != std::string::npos);
    REQUIRE(formatted.find("   |     ^~") != std::string::npos);
}

TEST_CASE("format_with_source() skips the snippet for a missing line", "[error]") {
    AkinError e{AkinError::Syntax, "unexpected end", "", "t.akin", 9, 1};
    auto formatted = e.format_with_source("one line");
    REQUIRE(formatted.find("--> t.akin:9:1") != std::string::npos);
    REQUIRE(formatted.find(" | ") == std::string::npos);
}

TEST_CASE("code_name() for all codes", "[error]") {
    REQUIRE(std::string(AkinError::code_name(AkinError::Syntax)) == "Syntax");
    REQUIRE(std::string(AkinError::code_name(AkinError::DuplicateDeclaration)) == "DuplicateDeclaration");
    REQUIRE(std::string(AkinError::code_name(AkinError::UndeclaredVariable)) == "UndeclaredVariable");
    REQUIRE(std::string(AkinError::code_name(AkinError::TypeMismatch)) == "TypeMismatch");
    REQUIRE(std::string(AkinError::code_name(AkinError::LimitExceeded)) == "LimitExceeded");
    REQUIRE(std::string(AkinError::code_name(AkinError::IO)) == "IO");
    REQUIRE(std::string(AkinError::code_name(AkinError::Config)) == "Config");
    REQUIRE(std::string(AkinError::code_name(AkinError::InvalidArg)) == "InvalidArg");
}
