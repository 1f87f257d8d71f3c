/*
 * chisel
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

#ifndef CHISEL_LEXER_HPP
#define CHISEL_LEXER_HPP

#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "config.hpp"
#include "decoder.hpp"
#include "error.hpp"
#include "source.hpp"

namespace chisel {

    enum class TokenKind : std::uint8_t {
        LeftBrace,
        RightBrace,
        LeftBracket,
        RightBracket,
        Colon,
        Comma,
        String,
        Number,
        True,
        False,
        Null,
        EndOfInput
    };

    [[nodiscard]] constexpr const char* token_kind_name(const TokenKind k) noexcept {
        switch (k) {
        case TokenKind::LeftBrace:
            return "'{'";
        case TokenKind::RightBrace:
            return "'}'";
        case TokenKind::LeftBracket:
            return "'['";
        case TokenKind::RightBracket:
            return "']'";
        case TokenKind::Colon:
            return "':'";
        case TokenKind::Comma:
            return "','";
        case TokenKind::String:
            return "string";
        case TokenKind::Number:
            return "number";
        case TokenKind::True:
            return "true";
        case TokenKind::False:
            return "false";
        case TokenKind::Null:
            return "null";
        case TokenKind::EndOfInput:
            return "end of input";
        }
        return "unknown";
    }

    struct Span {
        std::size_t start_offset {};
        std::size_t end_offset {};
        std::size_t line {1};
        std::size_t column {1};
    };

    // text: decoded UTF-8 for String, raw lexeme for Number, empty otherwise
    struct Token {
        TokenKind kind {TokenKind::EndOfInput};
        Span span {};
        std::string text {};
    };

    namespace detail {

        [[nodiscard]] CHISEL_FORCEINLINE constexpr bool is_ws(const char32_t c) noexcept {
            return c == U' ' || c == U'\t' || c == U'\n' || c == U'\r';
        }

        [[nodiscard]] CHISEL_FORCEINLINE constexpr bool is_digit(const char32_t c) noexcept {
            return c >= U'0' && c <= U'9';
        }

        [[nodiscard]] CHISEL_FORCEINLINE constexpr bool is_alpha(const char32_t c) noexcept {
            return (c >= U'a' && c <= U'z') || (c >= U'A' && c <= U'Z');
        }

        [[nodiscard]] CHISEL_FORCEINLINE constexpr int hex_value(const char32_t c) noexcept {
            if (c >= U'0' && c <= U'9')
                return static_cast<int>(c - U'0');
            if (c >= U'a' && c <= U'f')
                return static_cast<int>(c - U'a') + 10;
            if (c >= U'A' && c <= U'F')
                return static_cast<int>(c - U'A') + 10;
            return -1;
        }

    } // namespace detail

    template <ByteSource Source>
    class Lexer {
    public:
        explicit Lexer(Source& src, const Encoding enc = Encoding::Utf8): dec_(src, enc) { }

        Lexer(const Lexer&) = delete;
        Lexer& operator=(const Lexer&) = delete;

        // Refills tok with the next token. Returns false once an error was recorded;
        // the lexer stays failed from then on.
        [[nodiscard]] bool next(Token& tok) {
            if (!err_.ok())
                return false;

            tok.text.clear();

            while (true) {
                const auto st = peek();
                if (st == DecodeStatus::Error)
                    return decoder_failed();

                if (st == DecodeStatus::End) {
                    tok.kind = TokenKind::EndOfInput;
                    tok.span = Span {dec_.position(), dec_.position(), dec_.line(), dec_.column()};
                    return true;
                }

                if (!detail::is_ws(la_.value))
                    break;
                bump();
            }

            const CodePoint first = la_;
            tok.span = Span {first.offset, first.end_offset(), first.line, first.column};

            switch (first.value) {
            case U'{':
                return punct(tok, TokenKind::LeftBrace);
            case U'}':
                return punct(tok, TokenKind::RightBrace);
            case U'[':
                return punct(tok, TokenKind::LeftBracket);
            case U']':
                return punct(tok, TokenKind::RightBracket);
            case U':':
                return punct(tok, TokenKind::Colon);
            case U',':
                return punct(tok, TokenKind::Comma);
            case U'"':
                return lex_string(tok, first);
            case U't':
                return lex_literal(tok, first, "true", TokenKind::True);
            case U'f':
                return lex_literal(tok, first, "false", TokenKind::False);
            case U'n':
                return lex_literal(tok, first, "null", TokenKind::Null);
            default:
                break;
            }

            if (first.value == U'-' || detail::is_digit(first.value))
                return lex_number(tok, first);

            return fail(ErrorCode::InvalidCharacter, first, "unexpected character " + detail::describe_code_point(first.value));
        }

        [[nodiscard]] CHISEL_FORCEINLINE const ParseError& error() const noexcept {
            return err_;
        }

        [[nodiscard]] CHISEL_FORCEINLINE Encoding encoding() const noexcept {
            return dec_.encoding();
        }

    private:
        [[nodiscard]] CHISEL_FORCEINLINE DecodeStatus peek() {
            if (!has_la_) {
                la_status_ = dec_.next(la_);
                has_la_ = true;
            }
            return la_status_;
        }

        CHISEL_FORCEINLINE void bump() noexcept {
            has_la_ = false;
        }

        [[nodiscard]] bool decoder_failed() {
            err_ = dec_.error();
            return false;
        }

        [[nodiscard]] bool fail(const ErrorCode c, const CodePoint& at, std::string ctx) {
            err_.set(c, at.offset, at.line, at.column, std::move(ctx));
            return false;
        }

        [[nodiscard]] CHISEL_FORCEINLINE bool punct(Token& tok, const TokenKind k) noexcept {
            bump();
            tok.kind = k;
            return true;
        }

        [[nodiscard]] bool lex_literal(Token& tok, const CodePoint& first, const std::string_view word, const TokenKind k) {
            std::size_t end = first.offset;
            for (const char ch : word) {
                const auto st = peek();
                if (st == DecodeStatus::Error)
                    return decoder_failed();
                if (st == DecodeStatus::End || la_.value != static_cast<char32_t>(ch))
                    return fail(ErrorCode::InvalidLiteral, first, "expected literal '" + std::string(word) + "'");
                end = la_.end_offset();
                bump();
            }

            tok.kind = k;
            tok.span.end_offset = end;
            return true;
        }

        [[nodiscard]] bool unterminated(const CodePoint& open) {
            return fail(ErrorCode::UnterminatedString, open, "string not terminated before end of input");
        }

        [[nodiscard]] bool read_hex4(std::uint16_t& out, const CodePoint& open, const CodePoint& esc) {
            out = 0;
            for (int i = 0; i < 4; ++i) {
                const auto st = peek();
                if (st == DecodeStatus::Error)
                    return decoder_failed();
                if (st == DecodeStatus::End)
                    return unterminated(open);

                const int v = detail::hex_value(la_.value);
                if (v < 0)
                    return fail(ErrorCode::InvalidUnicodeEscape, esc, "\\u escape needs four hex digits");

                out = static_cast<std::uint16_t>(out << 4 | v);
                bump();
            }
            return true;
        }

        [[nodiscard]] bool expect_in_string(const char32_t want, const CodePoint& open, const CodePoint& esc) {
            const auto st = peek();
            if (st == DecodeStatus::Error)
                return decoder_failed();
            if (st == DecodeStatus::End)
                return unterminated(open);
            if (la_.value != want)
                return fail(ErrorCode::InvalidUnicodeEscape, esc, "high surrogate escape not followed by a low surrogate escape");
            bump();
            return true;
        }

        [[nodiscard]] bool lex_unicode_escape(std::string& out, const CodePoint& open, const CodePoint& esc) {
            std::uint16_t u1 {};
            if (!read_hex4(u1, open, esc))
                return false;

            std::uint32_t cp = u1;

            if (u1 >= 0xD800u && u1 <= 0xDBFFu) {
                if (!expect_in_string(U'\\', open, esc) || !expect_in_string(U'u', open, esc))
                    return false;

                std::uint16_t u2 {};
                if (!read_hex4(u2, open, esc))
                    return false;

                if (u2 < 0xDC00u || u2 > 0xDFFFu)
                    return fail(ErrorCode::InvalidUnicodeEscape, esc, "high surrogate escape not followed by a low surrogate escape");

                cp = 0x10000u + ((static_cast<std::uint32_t>(u1) - 0xD800u) << 10 | (static_cast<std::uint32_t>(u2) - 0xDC00u));
            } else if (u1 >= 0xDC00u && u1 <= 0xDFFFu) {
                return fail(ErrorCode::InvalidUnicodeEscape, esc, "unpaired low surrogate escape");
            }

            if (!detail::append_utf8(out, cp))
                return fail(ErrorCode::InvalidUnicodeEscape, esc, "escape does not name a Unicode scalar value");
            return true;
        }

        [[nodiscard]] bool lex_string(Token& tok, const CodePoint& open) {
            bump();
            auto& out = tok.text;

            while (true) {
                auto st = peek();
                if (st == DecodeStatus::Error)
                    return decoder_failed();
                if (st == DecodeStatus::End)
                    return unterminated(open);

                const CodePoint cur = la_;

                if (cur.value == U'"') {
                    bump();
                    tok.kind = TokenKind::String;
                    tok.span.end_offset = cur.end_offset();
                    return true;
                }

                if (cur.value < 0x20u)
                    return fail(ErrorCode::ControlCharacter, cur, "unescaped control character " + detail::describe_code_point(cur.value) + " in string");

                if (cur.value != U'\\') {
                    if (cur.value < 0x80u)
                        out.push_back(static_cast<char>(cur.value));
                    else
                        (void)detail::append_utf8(out, cur.value); // decoder only yields scalar values
                    bump();
                    continue;
                }

                bump();
                st = peek();
                if (st == DecodeStatus::Error)
                    return decoder_failed();
                if (st == DecodeStatus::End)
                    return unterminated(open);

                const char32_t e = la_.value;
                bump();

                switch (e) {
                case U'"':
                    out.push_back('"');
                    break;
                case U'\\':
                    out.push_back('\\');
                    break;
                case U'/':
                    out.push_back('/');
                    break;
                case U'b':
                    out.push_back('\b');
                    break;
                case U'f':
                    out.push_back('\f');
                    break;
                case U'n':
                    out.push_back('\n');
                    break;
                case U'r':
                    out.push_back('\r');
                    break;
                case U't':
                    out.push_back('\t');
                    break;
                case U'u':
                    if (!lex_unicode_escape(out, open, cur))
                        return false;
                    break;
                default:
                    return fail(ErrorCode::InvalidEscape, cur, "invalid escape \\" + detail::describe_code_point(e));
                }
            }
        }

        // appends the lookahead to the lexeme and moves on
        CHISEL_FORCEINLINE void take(std::string& lexeme, std::size_t& end) {
            lexeme.push_back(static_cast<char>(la_.value));
            end = la_.end_offset();
            bump();
        }

        [[nodiscard]] CHISEL_FORCEINLINE bool at_digit() {
            return peek() == DecodeStatus::Ok && detail::is_digit(la_.value);
        }

        [[nodiscard]] bool lex_number(Token& tok, const CodePoint& first) {
            auto& lexeme = tok.text;
            std::size_t end = first.offset;

            const auto bad = [&](const char* what) {
                if (la_status_ == DecodeStatus::Error)
                    return decoder_failed();
                return fail(ErrorCode::InvalidNumber, first, std::string(what) + " in number '" + lexeme + "'");
            };

            if (la_.value == U'-') {
                take(lexeme, end);
                if (!at_digit())
                    return bad("expected digit after '-'");
            }

            if (la_.value == U'0') {
                take(lexeme, end);
            } else {
                while (at_digit())
                    take(lexeme, end);
            }

            if (peek() == DecodeStatus::Ok && la_.value == U'.') {
                take(lexeme, end);
                if (!at_digit())
                    return bad("expected digit after '.'");
                while (at_digit())
                    take(lexeme, end);
            }

            if (peek() == DecodeStatus::Ok && (la_.value == U'e' || la_.value == U'E')) {
                take(lexeme, end);
                if (peek() == DecodeStatus::Ok && (la_.value == U'+' || la_.value == U'-'))
                    take(lexeme, end);
                if (!at_digit())
                    return bad("expected exponent digits");
                while (at_digit())
                    take(lexeme, end);
            }

            const auto st = peek();
            if (st == DecodeStatus::Error)
                return decoder_failed();
            if (st == DecodeStatus::Ok) {
                const char32_t c = la_.value;
                if (detail::is_digit(c) || detail::is_alpha(c) || c == U'.' || c == U'+' || c == U'-')
                    return fail(ErrorCode::InvalidNumber, first, "unexpected " + detail::describe_code_point(c) + " after number '" + lexeme + "'");
            }

            tok.kind = TokenKind::Number;
            tok.span.end_offset = end;
            return true;
        }

        Decoder<Source> dec_;

        CodePoint la_ {};
        DecodeStatus la_status_ {DecodeStatus::Ok};
        bool has_la_ {};

        ParseError err_ {};
    };

} // namespace chisel

#endif // CHISEL_LEXER_HPP
