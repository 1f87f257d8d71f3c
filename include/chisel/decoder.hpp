/*
 * chisel
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

#ifndef CHISEL_DECODER_HPP
#define CHISEL_DECODER_HPP

#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "config.hpp"
#include "error.hpp"
#include "source.hpp"

namespace chisel::detail {

    [[nodiscard]] CHISEL_FORCEINLINE constexpr bool is_cont(const std::uint8_t c) noexcept {
        return (c & 0xC0u) == 0x80u;
    }

    [[nodiscard]] CHISEL_FORCEINLINE constexpr bool is_surrogate(const std::uint32_t cp) noexcept {
        return cp >= 0xD800u && cp <= 0xDFFFu;
    }

    [[nodiscard]] CHISEL_FORCEINLINE std::size_t utf8_encode(char* out, const std::uint32_t cp) noexcept {
        if (cp > 0x10FFFFu)
            return 0;
        if (is_surrogate(cp))
            return 0;

        if (cp <= 0x7F) {
            out[0] = static_cast<char>(cp);
            return 1;
        }
        if (cp <= 0x7FF) {
            out[0] = static_cast<char>(0xC0 | cp >> 6);
            out[1] = static_cast<char>(0x80 | (cp & 0x3F));
            return 2;
        }
        if (cp <= 0xFFFF) {
            out[0] = static_cast<char>(0xE0 | cp >> 12);
            out[1] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out[2] = static_cast<char>(0x80 | (cp & 0x3F));
            return 3;
        }
        out[0] = static_cast<char>(0xF0 | cp >> 18);
        out[1] = static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out[2] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out[3] = static_cast<char>(0x80 | (cp & 0x3F));
        return 4;
    }

    CHISEL_FORCEINLINE bool append_utf8(std::string& out, const std::uint32_t cp) {
        char tmp[4];
        const std::size_t n = utf8_encode(tmp, cp);
        if (!n)
            return false;
        out.append(tmp, n);
        return true;
    }

    // printable rendering of a single code point for error contexts
    [[nodiscard]] inline std::string describe_code_point(const std::uint32_t cp) {
        constexpr char kHex[] = "0123456789ABCDEF";

        if (cp >= 0x20u && cp < 0x7Fu)
            return std::string {'\'', static_cast<char>(cp), '\''};

        std::string out = "U+";
        const int digits = cp > 0xFFFFu ? 6 : 4;
        for (int i = digits - 1; i >= 0; --i)
            out.push_back(kHex[(cp >> (i * 4)) & 0xFu]);
        return out;
    }

} // namespace chisel::detail

namespace chisel {

    struct CodePoint {
        char32_t value {};
        std::size_t offset {};
        std::size_t line {1};
        std::size_t column {1};
        std::uint8_t width {};

        [[nodiscard]] constexpr std::size_t end_offset() const noexcept {
            return offset + width;
        }
    };

    enum class DecodeStatus : std::uint8_t {
        Ok,
        End,
        Error
    };

    template <ByteSource Source>
    class Decoder {
    public:
        explicit Decoder(Source& src, const Encoding enc = Encoding::Utf8): src_(src), encoding_(enc) { }

        Decoder(const Decoder&) = delete;
        Decoder& operator=(const Decoder&) = delete;

        [[nodiscard]] DecodeStatus next(CodePoint& out) {
            if (status_ != DecodeStatus::Ok)
                return status_;

            if (!primed_)
                prime();

            const std::size_t start = consumed_;

            bool got = false;
            switch (encoding_) {
            case Encoding::Utf8:
            case Encoding::Auto:
                got = decode_utf8(out.value);
                break;
            case Encoding::Utf16LE:
                got = decode_utf16<false>(out.value);
                break;
            case Encoding::Utf16BE:
                got = decode_utf16<true>(out.value);
                break;
            case Encoding::Latin1:
                got = decode_latin1(out.value);
                break;
            }

            if (!got)
                return status_;

            out.offset = start;
            out.width = static_cast<std::uint8_t>(consumed_ - start);
            out.line = line_;
            out.column = column_;

            if (out.value == U'\n') {
                ++line_;
                column_ = 1;
            } else {
                ++column_;
            }
            return DecodeStatus::Ok;
        }

        [[nodiscard]] CHISEL_FORCEINLINE const ParseError& error() const noexcept {
            return err_;
        }

        // the encoding in effect once input has been sniffed
        [[nodiscard]] CHISEL_FORCEINLINE Encoding encoding() const noexcept {
            return encoding_;
        }

        [[nodiscard]] CHISEL_FORCEINLINE std::size_t position() const noexcept {
            return consumed_;
        }

        [[nodiscard]] CHISEL_FORCEINLINE std::size_t line() const noexcept {
            return line_;
        }

        [[nodiscard]] CHISEL_FORCEINLINE std::size_t column() const noexcept {
            return column_;
        }

    private:
        [[nodiscard]] bool raw_fetch(std::uint8_t& b) {
            while (pos_ >= chunk_.size()) {
                if (exhausted_)
                    return false;
                chunk_ = src_.next_chunk();
                pos_ = 0;
                if (chunk_.empty()) {
                    exhausted_ = true;
                    io_failed_ = src_.failed();
                    return false;
                }
            }
            b = static_cast<std::uint8_t>(chunk_[pos_++]);
            return true;
        }

        [[nodiscard]] CHISEL_FORCEINLINE bool fetch(std::uint8_t& b) {
            if (head_pos_ < head_len_) {
                b = head_[head_pos_++];
                ++consumed_;
                return true;
            }
            if (!raw_fetch(b))
                return false;
            ++consumed_;
            return true;
        }

        void prime() {
            primed_ = true;

            while (head_len_ < sizeof(head_) && raw_fetch(head_[head_len_]))
                ++head_len_;

            if (encoding_ == Encoding::Auto)
                encoding_ = sniff();

            std::size_t bom = 0;
            switch (encoding_) {
            case Encoding::Utf8:
            case Encoding::Auto:
                if (head_len_ >= 3 && head_[0] == 0xEF && head_[1] == 0xBB && head_[2] == 0xBF)
                    bom = 3;
                break;
            case Encoding::Utf16LE:
                if (head_len_ >= 2 && head_[0] == 0xFF && head_[1] == 0xFE)
                    bom = 2;
                break;
            case Encoding::Utf16BE:
                if (head_len_ >= 2 && head_[0] == 0xFE && head_[1] == 0xFF)
                    bom = 2;
                break;
            case Encoding::Latin1:
                break;
            }

            head_pos_ = bom;
            consumed_ = bom;
        }

        [[nodiscard]] Encoding sniff() const noexcept {
            if (head_len_ >= 3 && head_[0] == 0xEF && head_[1] == 0xBB && head_[2] == 0xBF)
                return Encoding::Utf8;
            if (head_len_ >= 2) {
                if (head_[0] == 0xFE && head_[1] == 0xFF)
                    return Encoding::Utf16BE;
                if (head_[0] == 0xFF && head_[1] == 0xFE)
                    return Encoding::Utf16LE;
                // a JSON text starts with an ASCII character, so one zero byte in the
                // first pair gives the UTF-16 byte order away
                if (head_[0] == 0x00 && head_[1] != 0x00)
                    return Encoding::Utf16BE;
                if (head_[0] != 0x00 && head_[1] == 0x00)
                    return Encoding::Utf16LE;
            }
            return Encoding::Utf8;
        }

        [[nodiscard]] bool finish_or_fail() {
            if (io_failed_) {
                fail(ErrorCode::StreamFailure, consumed_, "byte source reported a read failure");
                return false;
            }
            status_ = DecodeStatus::End;
            return false;
        }

        void fail(const ErrorCode c, const std::size_t at, std::string ctx) {
            err_.set(c, at, line_, column_, std::move(ctx));
            status_ = DecodeStatus::Error;
        }

        [[nodiscard]] bool decode_utf8(char32_t& out) {
            const std::size_t start = consumed_;

            std::uint8_t c {};
            if (!fetch(c))
                return finish_or_fail();

            if (c < 0x80u) {
                out = c;
                return true;
            }

            std::uint32_t cp {};
            std::uint32_t min {};
            int need {};

            if ((c & 0xE0u) == 0xC0u) {
                cp = c & 0x1Fu;
                min = 0x80u;
                need = 1;
            } else if ((c & 0xF0u) == 0xE0u) {
                cp = c & 0x0Fu;
                min = 0x800u;
                need = 2;
            } else if ((c & 0xF8u) == 0xF0u) {
                cp = c & 0x07u;
                min = 0x10000u;
                need = 3;
            } else {
                fail(ErrorCode::InvalidByteSequence, start, "invalid UTF-8 lead byte " + hex_byte(c));
                return false;
            }

            for (int i = 0; i < need; ++i) {
                std::uint8_t c1 {};
                if (!fetch(c1)) {
                    if (io_failed_)
                        return finish_or_fail();
                    fail(ErrorCode::TruncatedSequence, start, "UTF-8 sequence cut short by end of input");
                    return false;
                }
                if (!detail::is_cont(c1)) {
                    fail(ErrorCode::InvalidByteSequence, start, "invalid UTF-8 continuation byte " + hex_byte(c1));
                    return false;
                }
                cp = cp << 6 | (c1 & 0x3Fu);
            }

            if (cp < min) {
                fail(ErrorCode::InvalidByteSequence, start, "overlong UTF-8 sequence");
                return false;
            }
            if (detail::is_surrogate(cp) || cp > 0x10FFFFu) {
                fail(ErrorCode::InvalidByteSequence, start, "UTF-8 sequence encodes an invalid code point");
                return false;
            }

            out = static_cast<char32_t>(cp);
            return true;
        }

        template <bool BigEndian>
        [[nodiscard]] bool fetch_unit(std::uint16_t& unit, const std::size_t start, bool& at_end) {
            std::uint8_t b0 {};
            std::uint8_t b1 {};
            at_end = false;

            if (!fetch(b0)) {
                at_end = true;
                return false;
            }
            if (!fetch(b1)) {
                if (io_failed_)
                    return finish_or_fail();
                fail(ErrorCode::TruncatedSequence, start, "odd trailing byte in UTF-16 input");
                return false;
            }

            unit = BigEndian ? static_cast<std::uint16_t>(b0 << 8 | b1) : static_cast<std::uint16_t>(b1 << 8 | b0);
            return true;
        }

        template <bool BigEndian>
        [[nodiscard]] bool decode_utf16(char32_t& out) {
            const std::size_t start = consumed_;

            std::uint16_t u1 {};
            bool at_end {};
            if (!fetch_unit<BigEndian>(u1, start, at_end))
                return at_end ? finish_or_fail() : false;

            if (u1 >= 0xDC00u && u1 <= 0xDFFFu) {
                fail(ErrorCode::UnpairedSurrogate, start, "UTF-16 low surrogate without a high surrogate");
                return false;
            }

            if (u1 < 0xD800u || u1 > 0xDBFFu) {
                out = u1;
                return true;
            }

            std::uint16_t u2 {};
            if (!fetch_unit<BigEndian>(u2, start, at_end)) {
                if (at_end && !io_failed_)
                    fail(ErrorCode::UnpairedSurrogate, start, "UTF-16 high surrogate at end of input");
                else if (at_end)
                    return finish_or_fail();
                return false;
            }

            if (u2 < 0xDC00u || u2 > 0xDFFFu) {
                fail(ErrorCode::UnpairedSurrogate, start, "UTF-16 high surrogate not followed by a low surrogate");
                return false;
            }

            out = static_cast<char32_t>(0x10000u + ((static_cast<std::uint32_t>(u1) - 0xD800u) << 10 | (static_cast<std::uint32_t>(u2) - 0xDC00u)));
            return true;
        }

        [[nodiscard]] bool decode_latin1(char32_t& out) {
            std::uint8_t c {};
            if (!fetch(c))
                return finish_or_fail();
            out = c;
            return true;
        }

        [[nodiscard]] static std::string hex_byte(const std::uint8_t b) {
            constexpr char kHex[] = "0123456789ABCDEF";
            return std::string {'0', 'x', kHex[b >> 4], kHex[b & 0xF]};
        }

        Source& src_; // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
        Encoding encoding_ {Encoding::Utf8};

        std::string_view chunk_ {};
        std::size_t pos_ {};
        bool exhausted_ {};
        bool io_failed_ {};

        std::uint8_t head_[4] {};
        std::size_t head_len_ {};
        std::size_t head_pos_ {};
        bool primed_ {};

        std::size_t consumed_ {};
        std::size_t line_ {1};
        std::size_t column_ {1};

        DecodeStatus status_ {DecodeStatus::Ok};
        ParseError err_ {};
    };

} // namespace chisel

#endif // CHISEL_DECODER_HPP
