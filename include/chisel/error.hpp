/*
 * chisel
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

#ifndef CHISEL_ERROR_HPP
#define CHISEL_ERROR_HPP

#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "config.hpp"

namespace chisel {

    enum class ErrorKind : std::uint8_t {
        None,
        Encoding,
        Lexical,
        Syntax,
        DepthExceeded,
        Io,
        Writer
    };

    enum class ErrorCode : std::uint8_t {
        None,
        // encoding
        InvalidByteSequence,
        TruncatedSequence,
        UnpairedSurrogate,
        // lexical
        InvalidCharacter,
        UnterminatedString,
        ControlCharacter,
        InvalidEscape,
        InvalidUnicodeEscape,
        InvalidNumber,
        InvalidLiteral,
        // syntax
        EmptyInput,
        UnexpectedToken,
        UnexpectedEnd,
        TrailingData,
        InvalidRoot,
        // depth
        DepthExceeded,
        // io
        StreamFailure,
        InvalidFile,
        // writer
        EncodeDepthExceeded,
        NonFiniteNumber,
        WriterOverflow,
    };

    enum class ErrorFormat : std::uint8_t {
        Pretty,
        Compact
    };

    [[nodiscard]] constexpr ErrorKind error_kind_of(const ErrorCode c) noexcept {
        switch (c) {
        case ErrorCode::None:
            return ErrorKind::None;
        case ErrorCode::InvalidByteSequence:
        case ErrorCode::TruncatedSequence:
        case ErrorCode::UnpairedSurrogate:
            return ErrorKind::Encoding;
        case ErrorCode::InvalidCharacter:
        case ErrorCode::UnterminatedString:
        case ErrorCode::ControlCharacter:
        case ErrorCode::InvalidEscape:
        case ErrorCode::InvalidUnicodeEscape:
        case ErrorCode::InvalidNumber:
        case ErrorCode::InvalidLiteral:
            return ErrorKind::Lexical;
        case ErrorCode::EmptyInput:
        case ErrorCode::UnexpectedToken:
        case ErrorCode::UnexpectedEnd:
        case ErrorCode::TrailingData:
        case ErrorCode::InvalidRoot:
            return ErrorKind::Syntax;
        case ErrorCode::DepthExceeded:
            return ErrorKind::DepthExceeded;
        case ErrorCode::StreamFailure:
        case ErrorCode::InvalidFile:
            return ErrorKind::Io;
        case ErrorCode::EncodeDepthExceeded:
        case ErrorCode::NonFiniteNumber:
        case ErrorCode::WriterOverflow:
            return ErrorKind::Writer;
        }
        return ErrorKind::None;
    }

    [[nodiscard]] constexpr const char* error_kind_name(const ErrorKind k) noexcept {
        switch (k) {
        case ErrorKind::None:
            return "None";
        case ErrorKind::Encoding:
            return "EncodingError";
        case ErrorKind::Lexical:
            return "LexicalError";
        case ErrorKind::Syntax:
            return "SyntaxError";
        case ErrorKind::DepthExceeded:
            return "DepthExceededError";
        case ErrorKind::Io:
            return "IoError";
        case ErrorKind::Writer:
            return "WriterError";
        }
        return "Unknown";
    }

    [[nodiscard]] constexpr const char* error_code_name(const ErrorCode c) noexcept {
        switch (c) {
        case ErrorCode::None:
            return "None";
        case ErrorCode::InvalidByteSequence:
            return "InvalidByteSequence";
        case ErrorCode::TruncatedSequence:
            return "TruncatedSequence";
        case ErrorCode::UnpairedSurrogate:
            return "UnpairedSurrogate";
        case ErrorCode::InvalidCharacter:
            return "InvalidCharacter";
        case ErrorCode::UnterminatedString:
            return "UnterminatedString";
        case ErrorCode::ControlCharacter:
            return "ControlCharacter";
        case ErrorCode::InvalidEscape:
            return "InvalidEscape";
        case ErrorCode::InvalidUnicodeEscape:
            return "InvalidUnicodeEscape";
        case ErrorCode::InvalidNumber:
            return "InvalidNumber";
        case ErrorCode::InvalidLiteral:
            return "InvalidLiteral";
        case ErrorCode::EmptyInput:
            return "EmptyInput";
        case ErrorCode::UnexpectedToken:
            return "UnexpectedToken";
        case ErrorCode::UnexpectedEnd:
            return "UnexpectedEnd";
        case ErrorCode::TrailingData:
            return "TrailingData";
        case ErrorCode::InvalidRoot:
            return "InvalidRoot";
        case ErrorCode::DepthExceeded:
            return "DepthExceeded";
        case ErrorCode::StreamFailure:
            return "StreamFailure";
        case ErrorCode::InvalidFile:
            return "InvalidFile";
        case ErrorCode::EncodeDepthExceeded:
            return "EncodeDepthExceeded";
        case ErrorCode::NonFiniteNumber:
            return "NonFiniteNumber";
        case ErrorCode::WriterOverflow:
            return "WriterOverflow";
        }
        return "Unknown";
    }

    struct ParseError {
        ErrorKind kind {ErrorKind::None};
        ErrorCode code {ErrorCode::None};
        std::size_t offset {};
        std::size_t line {1};
        std::size_t column {1};
        std::string context {};

        // first error wins
        void set(const ErrorCode c, const std::size_t at, const std::size_t ln, const std::size_t col, std::string ctx = {}) {
            if (code != ErrorCode::None)
                return;
            code = c;
            kind = error_kind_of(c);
            offset = at;
            line = ln;
            column = col;
            context = std::move(ctx);
        }

        void reset() noexcept {
            kind = ErrorKind::None;
            code = ErrorCode::None;
            offset = 0;
            line = 1;
            column = 1;
            context.clear();
        }

        [[nodiscard]] std::string to_string() const;

        template <ErrorFormat Fmt>
        [[nodiscard]] std::string format(std::string_view input) const;

        [[nodiscard]] CHISEL_FORCEINLINE constexpr bool ok() const noexcept {
            return code == ErrorCode::None;
        }

        [[nodiscard]] CHISEL_FORCEINLINE constexpr explicit operator bool() const noexcept {
            return ok();
        }
    };

    // byte range of the source line holding an offset; a leading UTF-8 BOM is not part of line one
    struct SourceLine {
        std::size_t begin {};
        std::size_t end {};
    };

    [[nodiscard]] inline SourceLine source_line(const std::string_view input, std::size_t offset) noexcept {
        offset = std::min(offset, input.size());

        SourceLine ln {};
        if (offset > 0) {
            const auto nl = input.rfind('\n', offset - 1);
            ln.begin = nl == std::string_view::npos ? 0 : nl + 1;
        }
        if (ln.begin == 0 && input.starts_with("\xEF\xBB\xBF") && offset >= 3)
            ln.begin = 3;

        const auto nl = input.find('\n', offset);
        ln.end = nl == std::string_view::npos ? input.size() : nl;
        return ln;
    }

    inline std::string ParseError::to_string() const {
        if (ok())
            return "chisel: ok";

        std::string out;
        out.reserve(96 + context.size());

        out.append("chisel: ");
        out.append(error_kind_name(kind));
        out.push_back('/');
        out.append(error_code_name(code));
        out.append(" at ");
        out.append(std::to_string(line));
        out.push_back(':');
        out.append(std::to_string(column));
        out.append(" (offset ");
        out.append(std::to_string(offset));
        out.push_back(')');

        if (!context.empty()) {
            out.append(": ");
            out.append(context);
        }
        return out;
    }

    [[nodiscard]] inline std::string format_error_compact(const std::string_view input, const ParseError& e) {
        if (e.ok())
            return {};

        std::string out = e.to_string();
        if (e.offset < input.size() && e.context.empty()) {
            out.append(" unexpected '");
            out.push_back(input[e.offset]);
            out.push_back('\'');
        }
        return out;
    }

    // The caret sits at the error's column, which counts code points, so the
    // window below is measured in code points too.
    [[nodiscard]] inline std::string format_error(const std::string_view input, const ParseError& e) {
        if (e.ok())
            return {};

        constexpr std::size_t kMaxWidth = 100;
        constexpr std::size_t kHalfWin = 40;

        const auto [begin, end] = source_line(input, e.offset);
        const std::string_view full = input.substr(begin, end - begin);

        // byte offset of every code point start, plus one past the end
        std::vector<std::size_t> starts;
        starts.reserve(full.size() + 1);
        for (std::size_t i = 0; i < full.size(); ++i) {
            if ((static_cast<unsigned char>(full[i]) & 0xC0) != 0x80)
                starts.push_back(i);
        }
        const std::size_t count = starts.size();
        starts.push_back(full.size());

        std::size_t caret = e.column ? std::min(e.column - 1, count) : 0;
        std::size_t win = 0;
        std::size_t shown = count;

        if (count > kMaxWidth) {
            win = caret > kHalfWin ? caret - kHalfWin : 0;
            if (win + kMaxWidth > count)
                win = count - kMaxWidth;
            shown = kMaxWidth;
            caret -= win;
        }

        std::string out;
        out.reserve(full.size() + 160);

        out.append("chisel: ");
        out.append(error_kind_name(e.kind));
        out.push_back('/');
        out.append(error_code_name(e.code));
        out.push_back('\n');

        out.append(" --> ");
        out.append(std::to_string(e.line));
        out.push_back(':');
        out.append(std::to_string(e.column));
        out.append(" (offset ");
        out.append(std::to_string(e.offset));
        out.append(")\n\n");

        const std::string prefix = " " + std::to_string(e.line) + " | ";
        out.append(prefix);
        if (win)
            out.append("...");
        out.append(full.substr(starts[win], starts[win + shown] - starts[win]));
        if (win + shown < count)
            out.append("...");
        out.push_back('\n');

        out.append(prefix.size() + (win ? 3 : 0) + caret, ' ');
        out.push_back('^');

        if (!e.context.empty()) {
            out.push_back(' ');
            out.append(e.context);
        }

        out.push_back('\n');

        return out;
    }

    template <ErrorFormat Fmt>
    std::string ParseError::format(const std::string_view input) const {
        if constexpr (Fmt == ErrorFormat::Compact)
            return format_error_compact(input, *this);
        else
            return format_error(input, *this);
    }

} // namespace chisel

#endif // CHISEL_ERROR_HPP
