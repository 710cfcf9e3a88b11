#include <catch2/catch.hpp>
#include <ruleguard/lang/lexer.hpp>

using namespace ruleguard;

static LexResult lex_ok(const std::string& src) {
    auto r = lex(src, "<test>");
    REQUIRE(r.is_ok());
    return std::move(r).value();
}

// ===== Basic tokenization =====

TEST_CASE("lex empty string", "[lexer]") {
    auto r = lex_ok("");
    REQUIRE(r.tokens.size() == 1);
    REQUIRE(r.tokens[0].kind == TokenKind::Eof);
    REQUIRE(r.comments.empty());
}

TEST_CASE("lex identifiers and keywords", "[lexer]") {
    auto r = lex_ok("var module $el _x function");
    REQUIRE(r.tokens.size() == 6);
    CHECK(r.tokens[0].kind == TokenKind::Keyword);
    CHECK(r.tokens[1].kind == TokenKind::Identifier);
    CHECK(r.tokens[1].text == "module");
    CHECK(r.tokens[2].text == "$el");
    CHECK(r.tokens[3].text == "_x");
    CHECK(r.tokens[4].is_keyword("function"));
}

TEST_CASE("lex numbers", "[lexer]") {
    auto r = lex_ok("42 3.14 .5 1e10 2E-3 0xFF 0b101");
    for (size_t i = 0; i < 7; ++i) {
        CHECK(r.tokens[i].kind == TokenKind::Number);
    }
    CHECK(r.tokens[2].text == ".5");
    CHECK(r.tokens[4].text == "2E-3");
    CHECK(r.tokens[5].text == "0xFF");
}

TEST_CASE("lex strings with both quote styles", "[lexer]") {
    auto r = lex_ok("\"double\" 'single' 'it\\'s'");
    REQUIRE(r.tokens[0].kind == TokenKind::String);
    CHECK(r.tokens[0].text == "\"double\"");
    CHECK(r.tokens[1].text == "'single'");
    CHECK(r.tokens[2].text == "'it\\'s'");
}

TEST_CASE("lex template literal with substitution", "[lexer]") {
    auto r = lex_ok("`a ${ {b: 1}.b } c` x");
    REQUIRE(r.tokens[0].kind == TokenKind::Template);
    CHECK(r.tokens[0].text == "`a ${ {b: 1}.b } c`");
    CHECK(r.tokens[1].text == "x");
}

TEST_CASE("lex punctuators with longest match", "[lexer]") {
    auto r = lex_ok("a === b !== c => d >>>= e ... f ?. g");
    CHECK(r.tokens[1].is_punct("==="));
    CHECK(r.tokens[3].is_punct("!=="));
    CHECK(r.tokens[5].is_punct("=>"));
    CHECK(r.tokens[7].is_punct(">>>="));
    CHECK(r.tokens[9].is_punct("..."));
    CHECK(r.tokens[11].is_punct("?."));
}

TEST_CASE("conditional followed by a decimal is not optional chaining", "[lexer]") {
    auto r = lex_ok("a?.5:1");
    CHECK(r.tokens[1].is_punct("?"));
    CHECK(r.tokens[2].text == ".5");
}

// ===== Spans =====

TEST_CASE("token spans use 1-based lines and 0-based columns", "[lexer]") {
    auto r = lex_ok("foo\n  bar");
    const auto& foo = r.tokens[0].span;
    CHECK(foo.start.line == 1);
    CHECK(foo.start.col == 0);
    CHECK(foo.end.line == 1);
    CHECK(foo.end.col == 3);
    CHECK(foo.begin == 0);
    CHECK(foo.end_offset == 3);

    const auto& bar = r.tokens[1].span;
    CHECK(bar.start.line == 2);
    CHECK(bar.start.col == 2);
    CHECK(bar.begin == 6);
}

TEST_CASE("CRLF and lone CR both end a line", "[lexer]") {
    auto r = lex_ok("a\r\nb\rc");
    CHECK(r.tokens[0].span.start.line == 1);
    CHECK(r.tokens[1].span.start.line == 2);
    CHECK(r.tokens[2].span.start.line == 3);
    CHECK(r.tokens[2].span.start.col == 0);
}

// ===== Comments =====

TEST_CASE("line comments are kept apart from tokens", "[lexer]") {
    auto r = lex_ok("foo // note\nbar");
    REQUIRE(r.tokens.size() == 3);
    CHECK(r.tokens[0].text == "foo");
    CHECK(r.tokens[1].text == "bar");
    REQUIRE(r.comments.size() == 1);
    CHECK(r.comments[0].kind == CommentKind::Line);
    CHECK(r.comments[0].text == " note");
    CHECK(r.comments[0].span.start.line == 1);
    CHECK(r.comments[0].span.start.col == 4);
    CHECK(r.comments[0].span.end.line == 1);
}

TEST_CASE("block comment spans every line it covers", "[lexer]") {
    auto r = lex_ok("a; /* one\ntwo\nthree */ b;");
    REQUIRE(r.comments.size() == 1);
    const auto& c = r.comments[0];
    CHECK(c.kind == CommentKind::Block);
    CHECK(c.text == " one\ntwo\nthree ");
    CHECK(c.span.start.line == 1);
    CHECK(c.span.end.line == 3);
    CHECK(c.span.end.col == 8);
    CHECK(r.tokens[2].text == "b");
    CHECK(r.tokens[2].span.start.line == 3);
}

TEST_CASE("comments inside strings are not comments", "[lexer]") {
    auto r = lex_ok("x = '// not a comment /* nor this */';");
    CHECK(r.comments.empty());
    CHECK(r.tokens[2].kind == TokenKind::String);
}

TEST_CASE("division is a punctuator, not a comment", "[lexer]") {
    auto r = lex_ok("a / b");
    CHECK(r.comments.empty());
    CHECK(r.tokens[1].is_punct("/"));
}

// ===== Regular expressions =====

TEST_CASE("slash after an operator starts a regular expression", "[lexer]") {
    auto r = lex_ok("var re = /^\\s+$/g;");
    REQUIRE(r.tokens.size() == 6);
    CHECK(r.tokens[3].kind == TokenKind::RegExp);
    CHECK(r.tokens[3].text == "/^\\s+$/g");
    CHECK(r.tokens[4].is_punct(";"));
}

TEST_CASE("quotes inside a regular expression are not strings", "[lexer]") {
    auto r = lex_ok("var re = /'/;\nvar s = \"ok\";");
    CHECK(r.tokens[3].kind == TokenKind::RegExp);
    CHECK(r.tokens[3].text == "/'/");
    CHECK(r.tokens[8].kind == TokenKind::String);
}

TEST_CASE("slash inside a character class does not close the expression", "[lexer]") {
    auto r = lex_ok("x = /[/\\]]+/.test(y)");
    CHECK(r.tokens[2].kind == TokenKind::RegExp);
    CHECK(r.tokens[2].text == "/[/\\]]+/");
    CHECK(r.tokens[3].is_punct("."));
}

TEST_CASE("slash after a closing paren divides", "[lexer]") {
    auto r = lex_ok("(a) / 2 / b");
    CHECK(r.tokens[3].is_punct("/"));
    CHECK(r.tokens[5].is_punct("/"));
}

TEST_CASE("regular expression cut by a line break is a Lex error", "[lexer]") {
    auto r = lex("x = /abc\n/;");
    REQUIRE(r.is_err());
    CHECK(r.error().message == "unterminated regular expression literal");
    CHECK(r.error().line == 1);
    CHECK(r.error().col == 5);
}

// ===== File prologue =====

TEST_CASE("shebang line is a line comment", "[lexer]") {
    auto r = lex_ok("#!/usr/bin/env node\n'use strict';");
    REQUIRE(r.comments.size() == 1);
    CHECK(r.comments[0].kind == CommentKind::Line);
    CHECK(r.comments[0].text == "/usr/bin/env node");
    CHECK(r.comments[0].span.start.line == 1);
    CHECK(r.tokens[0].kind == TokenKind::String);
    CHECK(r.tokens[0].span.start.line == 2);
}

TEST_CASE("byte order mark is skipped", "[lexer]") {
    auto r = lex_ok("\xEF\xBB\xBF'use strict';");
    REQUIRE(r.tokens.size() == 3);
    CHECK(r.tokens[0].kind == TokenKind::String);
    CHECK(r.tokens[0].span.start.col == 0);
}

TEST_CASE("Unicode spaces separate tokens", "[lexer]") {
    auto r = lex_ok("a\xC2\xA0=\xE3\x80\x80" "1;");
    REQUIRE(r.tokens.size() == 5);
    CHECK(r.tokens[0].text == "a");
    CHECK(r.tokens[1].is_punct("="));
    CHECK(r.tokens[2].text == "1");
}

TEST_CASE("whitespace_length", "[lexer]") {
    CHECK(whitespace_length(" ", 0) == 1);
    CHECK(whitespace_length("\xC2\xA0", 0) == 2);
    CHECK(whitespace_length("\xE2\x80\x8A", 0) == 3);
    CHECK(whitespace_length("\xE2\x80\xA8", 0) == 3);
    CHECK(whitespace_length("\xE2\x81\x9F", 0) == 3);
    CHECK(whitespace_length("\xEF\xBB\xBF", 0) == 3);
    CHECK(whitespace_length("\xE2\x80\x8B", 0) == 0);
    CHECK(whitespace_length("x", 0) == 0);
    CHECK(whitespace_length("", 0) == 0);
}

// ===== Errors =====

TEST_CASE("unterminated string is a Lex error with position", "[lexer]") {
    auto r = lex("ok;\n  'open", "bad.js");
    REQUIRE(r.is_err());
    CHECK(r.error().code == RuleguardError::Lex);
    CHECK(r.error().file == "bad.js");
    CHECK(r.error().line == 2);
    CHECK(r.error().col == 3);
}

TEST_CASE("unterminated block comment is a Lex error", "[lexer]") {
    auto r = lex("/* never closed");
    REQUIRE(r.is_err());
    CHECK(r.error().message == "unterminated block comment");
}

TEST_CASE("unknown character is a Lex error", "[lexer]") {
    auto r = lex("a # b");
    REQUIRE(r.is_err());
    CHECK(r.error().code == RuleguardError::Lex);
    CHECK(r.error().message.find("'#'") != std::string::npos);
}

TEST_CASE("is_keyword", "[lexer]") {
    CHECK(is_keyword("return"));
    CHECK(is_keyword("typeof"));
    CHECK_FALSE(is_keyword("module"));
    CHECK_FALSE(is_keyword("context"));
}
