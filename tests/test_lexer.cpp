#include <catch2/catch.hpp>
#include <akin/lang/lexer.hpp>

using namespace akin;

// ===== Basic tokenization =====

TEST_CASE("lex empty string", "[lexer]") {
    auto r = lex("");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().empty());
}

TEST_CASE("lex whitespace and comments only", "[lexer]") {
    auto r = lex("  // line\n /* block */ \t\n");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().empty());
}

TEST_CASE("lex single identifier", "[lexer]") {
    auto r = lex("foo");
    REQUIRE(r.is_ok());
    auto& toks = r.value();
    REQUIRE(toks.size() == 1);
    REQUIRE(toks[0].kind == TokenKind::Identifier);
    REQUIRE(toks[0].text == "foo");
    REQUIRE_FALSE(toks[0].spaced);
    REQUIRE_FALSE(toks[0].joint);
}

TEST_CASE("lex simple statement", "[lexer]") {
    auto r = lex("res += *var;");
    REQUIRE(r.is_ok());
    auto& toks = r.value();
    REQUIRE(toks.size() == 5);
    CHECK(toks[0].is_ident("res"));
    CHECK(toks[1].is_punct("+="));
    CHECK(toks[2].is_punct("*"));
    CHECK(toks[3].is_ident("var"));
    CHECK(toks[4].is_punct(";"));
}

TEST_CASE("spaced flag records source whitespace", "[lexer]") {
    auto r = lex("foo(x) + y");
    REQUIRE(r.is_ok());
    auto& toks = r.value();
    REQUIRE(toks.size() == 6);
    CHECK_FALSE(toks[1].spaced);  // (
    CHECK_FALSE(toks[2].spaced);  // x
    CHECK_FALSE(toks[3].spaced);  // )
    CHECK(toks[4].spaced);        // +
    CHECK(toks[5].spaced);        // y
}

TEST_CASE("comments count as whitespace", "[lexer]") {
    auto r = lex("a/* c */b//x\nc");
    REQUIRE(r.is_ok());
    auto& toks = r.value();
    REQUIRE(toks.size() == 3);
    CHECK(toks[1].text == "b");
    CHECK(toks[1].spaced);
    CHECK(toks[2].text == "c");
    CHECK(toks[2].spaced);
}

TEST_CASE("block comments nest", "[lexer]") {
    auto r = lex("a /* outer /* inner */ still comment */ b");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 2);
    REQUIRE(r.value()[1].text == "b");
}

// ===== Identifiers =====

TEST_CASE("lex raw identifiers and lifetimes", "[lexer]") {
    auto r = lex("r#type 'a 'static");
    REQUIRE(r.is_ok());
    auto& toks = r.value();
    REQUIRE(toks.size() == 3);
    CHECK(toks[0].is_ident("r#type"));
    CHECK(toks[1].is_ident("'a"));
    CHECK(toks[2].is_ident("'static"));
}

TEST_CASE("lex UTF-8 identifiers", "[lexer]") {
    auto r = lex("h\xC3\xA9llo w\xC3\xB6rld");
    REQUIRE(r.is_ok());
    auto& toks = r.value();
    REQUIRE(toks.size() == 2);
    CHECK(toks[0].kind == TokenKind::Identifier);
    CHECK(toks[0].text == "h\xC3\xA9llo");
    // Continuation bytes do not advance the column
    CHECK(toks[1].pos.col == 7);
}

// ===== Literals =====

TEST_CASE("lex number literals", "[lexer]") {
    auto r = lex("42 0x1F 0b1010 1_000u32 1.5 2.5e-3 1e10f64");
    REQUIRE(r.is_ok());
    auto& toks = r.value();
    REQUIRE(toks.size() == 7);
    for (auto& t : toks) {
        CHECK(t.kind == TokenKind::Literal);
        CHECK(t.is_number());
    }
    CHECK(toks[1].text == "0x1F");
    CHECK(toks[3].text == "1_000u32");
    CHECK(toks[5].text == "2.5e-3");
}

TEST_CASE("range operator is not a fraction", "[lexer]") {
    auto r = lex("0..3 0..=3");
    REQUIRE(r.is_ok());
    auto& toks = r.value();
    REQUIRE(toks.size() == 6);
    CHECK(toks[0].text == "0");
    CHECK(toks[1].is_punct(".."));
    CHECK(toks[2].text == "3");
    CHECK(toks[4].is_punct("..="));
}

TEST_CASE("negative numbers fold only after non-operands", "[lexer]") {
    SECTION("after an operator") {
        auto r = lex("f(-1, = -2)");
        REQUIRE(r.is_ok());
        auto& toks = r.value();
        CHECK(toks[2].kind == TokenKind::Literal);
        CHECK(toks[2].text == "-1");
        CHECK(toks[5].text == "-2");
    }
    SECTION("binary minus") {
        auto r = lex("x -1");
        REQUIRE(r.is_ok());
        auto& toks = r.value();
        REQUIRE(toks.size() == 3);
        CHECK(toks[1].is_punct("-"));
        CHECK(toks[2].text == "1");
    }
}

TEST_CASE("lex string literals", "[lexer]") {
    auto r = lex(R"("plain" "esc \" quote" b"bytes" c"cstr")");
    REQUIRE(r.is_ok());
    auto& toks = r.value();
    REQUIRE(toks.size() == 4);
    CHECK(toks[0].text == "\"plain\"");
    CHECK(toks[1].text == R"("esc \" quote")");
    CHECK(toks[2].text == "b\"bytes\"");
    CHECK(toks[3].text == "c\"cstr\"");
    for (auto& t : toks) CHECK(t.is_string());
}

TEST_CASE("strings may span lines", "[lexer]") {
    auto r = lex("\"a\nb\" x");
    REQUIRE(r.is_ok());
    auto& toks = r.value();
    REQUIRE(toks.size() == 2);
    CHECK(toks[0].text == "\"a\nb\"");
    CHECK(toks[1].pos.line == 2);
}

TEST_CASE("lex raw strings", "[lexer]") {
    auto r = lex(R"##(r"a\b" r#"has "quotes""# br#"x"#)##");
    REQUIRE(r.is_ok());
    auto& toks = r.value();
    REQUIRE(toks.size() == 3);
    CHECK(toks[0].text == R"(r"a\b")");
    CHECK(toks[1].text == R"##(r#"has "quotes""#)##");
    CHECK(toks[2].text == R"##(br#"x"#)##");
    for (auto& t : toks) CHECK(t.kind == TokenKind::Literal);
}

TEST_CASE("lex char literals", "[lexer]") {
    auto r = lex(R"('a' '\n' '\'' '\u{1F600}' b'x')");
    REQUIRE(r.is_ok());
    auto& toks = r.value();
    REQUIRE(toks.size() == 5);
    for (auto& t : toks) CHECK(t.kind == TokenKind::Literal);
    CHECK(toks[2].text == R"('\'')");
    CHECK(toks[3].text == R"('\u{1F600}')");
    CHECK(toks[4].text == "b'x'");
}

// ===== Punctuation and groups =====

TEST_CASE("multi-character operators match longest first", "[lexer]") {
    auto r = lex("a..=b ... <<= :: -> => != && || >>");
    REQUIRE(r.is_ok());
    auto& toks = r.value();
    REQUIRE(toks.size() == 12);
    CHECK(toks[1].is_punct("..="));
    CHECK(toks[3].is_punct("..."));
    CHECK(toks[4].is_punct("<<="));
    CHECK(toks[5].is_punct("::"));
    CHECK(toks[6].is_punct("->"));
    CHECK(toks[7].is_punct("=>"));
    CHECK(toks[8].is_punct("!="));
    CHECK(toks[9].is_punct("&&"));
    CHECK(toks[10].is_punct("||"));
    CHECK(toks[11].is_punct(">>"));
}

TEST_CASE("lex group delimiters", "[lexer]") {
    auto r = lex("([{}])");
    REQUIRE(r.is_ok());
    auto& toks = r.value();
    REQUIRE(toks.size() == 6);
    CHECK(toks[0].is_open(Delimiter::Paren));
    CHECK(toks[1].is_open(Delimiter::Bracket));
    CHECK(toks[2].is_open(Delimiter::Brace));
    CHECK(toks[3].is_close(Delimiter::Brace));
    CHECK(toks[4].is_close(Delimiter::Bracket));
    CHECK(toks[5].is_close(Delimiter::Paren));
}

TEST_CASE("unbalanced delimiters are not an error for the lexer", "[lexer]") {
    auto r = lex("f(]");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 3);
}

// ===== Joint modifier =====

TEST_CASE("tilde sets joint on the next token", "[lexer]") {
    auto r = lex("_ ~*n name~x");
    REQUIRE(r.is_ok());
    auto& toks = r.value();
    REQUIRE(toks.size() == 5);
    CHECK(toks[1].is_punct("*"));
    CHECK(toks[1].joint);
    CHECK(toks[1].spaced);
    CHECK_FALSE(toks[2].joint);
    CHECK(toks[4].text == "x");
    CHECK(toks[4].joint);
}

TEST_CASE("tilde before whitespace is punctuation", "[lexer]") {
    auto r = lex("a ~ b~");
    REQUIRE(r.is_ok());
    auto& toks = r.value();
    REQUIRE(toks.size() == 4);
    CHECK(toks[1].is_punct("~"));
    CHECK_FALSE(toks[2].joint);
    CHECK(toks[3].is_punct("~"));
}

// ===== Positions and errors =====

TEST_CASE("token positions", "[lexer]") {
    auto r = lex("a\n  bc d", "t.akin");
    REQUIRE(r.is_ok());
    auto& toks = r.value();
    REQUIRE(toks.size() == 3);
    CHECK(toks[0].pos.file == "t.akin");
    CHECK(toks[1].pos.line == 2);
    CHECK(toks[1].pos.col == 3);
    CHECK(toks[2].pos.col == 6);
}

TEST_CASE("unterminated string", "[lexer]") {
    auto r = lex("x = \"oops", "bad.akin");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == AkinError::Syntax);
    REQUIRE(r.error().file == "bad.akin");
    REQUIRE(r.error().line == 1);
    REQUIRE(r.error().col == 5);
}

TEST_CASE("unterminated raw string", "[lexer]") {
    auto r = lex("r#\"never closed\"");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == AkinError::Syntax);
    REQUIRE(r.error().message.find("raw string") != std::string::npos);
}

TEST_CASE("unterminated char literal", "[lexer]") {
    auto r = lex("'\\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == AkinError::Syntax);
}

TEST_CASE("unterminated block comment", "[lexer]") {
    auto r = lex("a\n/* /* */ b");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == AkinError::Syntax);
    REQUIRE(r.error().line == 2);
    REQUIRE(r.error().col == 1);
}
