#include <catch2/catch_test_macros.hpp>

#include <chisel/lexer.hpp>

#include <string>
#include <vector>

using namespace chisel;

namespace {

    struct Lexed {
        std::vector<Token> tokens;
        ParseError error;
        bool ok {true};
    };

    Lexed lex_all(const std::string_view input, const Encoding enc = Encoding::Utf8) {
        StringSource src {input};
        Lexer lex(src, enc);

        Lexed out;
        Token tok;
        while (true) {
            if (!lex.next(tok)) {
                out.ok = false;
                out.error = lex.error();
                break;
            }
            out.tokens.push_back(tok);
            if (tok.kind == TokenKind::EndOfInput)
                break;
        }
        return out;
    }

    std::vector<TokenKind> kinds(const Lexed& l) {
        std::vector<TokenKind> out;
        for (const auto& t : l.tokens)
            out.push_back(t.kind);
        return out;
    }

    ParseError lex_error(const std::string_view input) {
        const auto l = lex_all(input);
        REQUIRE_FALSE(l.ok);
        return l.error;
    }

} // namespace

TEST_CASE("chisel lexer punctuation and literals", "[chisel][lexer]") {
    const auto l = lex_all(" { } [ ] : , true false null ");
    REQUIRE(l.ok);
    CHECK(kinds(l) ==
        std::vector {TokenKind::LeftBrace, TokenKind::RightBrace, TokenKind::LeftBracket, TokenKind::RightBracket, TokenKind::Colon, TokenKind::Comma, TokenKind::True,
            TokenKind::False, TokenKind::Null, TokenKind::EndOfInput});
}

TEST_CASE("chisel lexer spans", "[chisel][lexer]") {
    const auto l = lex_all("{\n  \"key\": -12.5e3\n}");
    REQUIRE(l.ok);
    REQUIRE(l.tokens.size() == 6);

    const auto& key = l.tokens[1];
    CHECK(key.kind == TokenKind::String);
    CHECK(key.text == "key");
    CHECK(key.span.start_offset == 4);
    CHECK(key.span.end_offset == 9);
    CHECK(key.span.line == 2);
    CHECK(key.span.column == 3);

    const auto& num = l.tokens[3];
    CHECK(num.kind == TokenKind::Number);
    CHECK(num.text == "-12.5e3");
    CHECK(num.span.start_offset == 11);
    CHECK(num.span.end_offset == 18);

    const auto& close = l.tokens[4];
    CHECK(close.span.line == 3);
    CHECK(close.span.column == 1);

    CHECK(l.tokens[5].kind == TokenKind::EndOfInput);
    CHECK(l.tokens[5].span.start_offset == 20);
}

TEST_CASE("chisel lexer string escapes", "[chisel][lexer]") {
    const auto l = lex_all(R"("a\"b\\c\/d\b\f\n\r\tAé😀")");
    REQUIRE(l.ok);
    CHECK(l.tokens[0].text == "a\"b\\c/d\b\f\n\r\tA\xC3\xA9\xF0\x9F\x98\x80");
}

TEST_CASE("chisel lexer keeps raw utf8 in strings", "[chisel][lexer]") {
    const auto l = lex_all("\"caf\xC3\xA9 \xE2\x82\xAC\"");
    REQUIRE(l.ok);
    CHECK(l.tokens[0].text == "caf\xC3\xA9 \xE2\x82\xAC");
}

TEST_CASE("chisel lexer string errors", "[chisel][lexer]") {
    SECTION("unterminated string reports the opening quote") {
        const auto e = lex_error(R"([ "abc)");
        CHECK(e.kind == ErrorKind::Lexical);
        CHECK(e.code == ErrorCode::UnterminatedString);
        CHECK(e.offset == 2);
    }

    SECTION("bare control character") {
        const auto e = lex_error("\"ab\tc\"");
        CHECK(e.code == ErrorCode::ControlCharacter);
        CHECK(e.offset == 3);
    }

    SECTION("unknown escape") {
        const auto e = lex_error(R"("a\qb")");
        CHECK(e.code == ErrorCode::InvalidEscape);
        CHECK(e.offset == 2);
    }

    SECTION("short unicode escape") {
        const auto e = lex_error(R"("\u12G4")");
        CHECK(e.code == ErrorCode::InvalidUnicodeEscape);
    }

    SECTION("unpaired high surrogate escape") {
        const auto e = lex_error(R"("\ud83d x")");
        CHECK(e.code == ErrorCode::InvalidUnicodeEscape);
    }

    SECTION("lone low surrogate escape") {
        const auto e = lex_error(R"("\ude00")");
        CHECK(e.code == ErrorCode::InvalidUnicodeEscape);
    }
}

TEST_CASE("chisel lexer numbers", "[chisel][lexer]") {
    const auto l = lex_all("0 -0 42 3.14 1e10 -2.5E-3 6E+2");
    REQUIRE(l.ok);

    std::vector<std::string> lexemes;
    for (const auto& t : l.tokens) {
        if (t.kind == TokenKind::Number)
            lexemes.push_back(t.text);
    }
    CHECK(lexemes == std::vector<std::string> {"0", "-0", "42", "3.14", "1e10", "-2.5E-3", "6E+2"});
}

TEST_CASE("chisel lexer malformed numbers", "[chisel][lexer]") {
    const auto is_bad_number = [](const std::string_view in, const std::size_t offset) {
        const auto e = lex_error(in);
        CHECK(e.kind == ErrorKind::Lexical);
        CHECK(e.code == ErrorCode::InvalidNumber);
        CHECK(e.offset == offset);
    };

    is_bad_number("01", 0);
    is_bad_number("[1.]", 1);
    is_bad_number("1e", 0);
    is_bad_number("1e+", 0);
    is_bad_number("-", 0);
    is_bad_number("-a", 0);
    is_bad_number(" 12abc", 1);
    is_bad_number("1.5.2", 0);
    is_bad_number("3-", 0);
}

TEST_CASE("chisel lexer literals", "[chisel][lexer]") {
    SECTION("case sensitive") {
        const auto e = lex_error("True");
        CHECK(e.code == ErrorCode::InvalidCharacter);
    }

    SECTION("misspelled") {
        const auto e = lex_error("[nul]");
        CHECK(e.code == ErrorCode::InvalidLiteral);
        CHECK(e.offset == 1);
    }

    SECTION("truncated") {
        const auto e = lex_error("fals");
        CHECK(e.code == ErrorCode::InvalidLiteral);
    }

    SECTION("adjacent literals split without a delimiter") {
        const auto l = lex_all("falsetruefalse");
        REQUIRE(l.ok);
        CHECK(kinds(l) == std::vector {TokenKind::False, TokenKind::True, TokenKind::False, TokenKind::EndOfInput});
    }
}

TEST_CASE("chisel lexer invalid characters", "[chisel][lexer]") {
    const auto e = lex_error("[1, @]");
    CHECK(e.kind == ErrorKind::Lexical);
    CHECK(e.code == ErrorCode::InvalidCharacter);
    CHECK(e.offset == 4);
    CHECK(e.column == 5);
}

TEST_CASE("chisel lexer forwards encoding errors", "[chisel][lexer]") {
    const auto e = lex_error("[\"a\xFF\"]");
    CHECK(e.kind == ErrorKind::Encoding);
    CHECK(e.offset == 3);
}

TEST_CASE("chisel lexer bad byte after a number fails before the number", "[chisel][lexer]") {
    const auto l = lex_all("12\xFF");
    REQUIRE_FALSE(l.ok);
    CHECK(l.tokens.empty());
    CHECK(l.error.kind == ErrorKind::Encoding);
    CHECK(l.error.offset == 2);

    const auto inner = lex_all("[3.5\xFF]");
    REQUIRE_FALSE(inner.ok);
    CHECK(kinds(inner) == std::vector {TokenKind::LeftBracket});
    CHECK(inner.error.kind == ErrorKind::Encoding);
    CHECK(inner.error.offset == 4);
}

TEST_CASE("chisel lexer utf16 input", "[chisel][lexer]") {
    const std::string bytes {"{\0\"\0k\0\"\0:\0" "1\0}\0", 14};
    const auto l = lex_all(bytes, Encoding::Utf16LE);
    REQUIRE(l.ok);
    REQUIRE(l.tokens.size() == 6);
    CHECK(l.tokens[1].text == "k");
    CHECK(l.tokens[1].span.start_offset == 2);
    CHECK(l.tokens[3].text == "1");
}
