/*
 * chisel
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

#ifndef CHISEL_WRITER_HPP
#define CHISEL_WRITER_HPP

#pragma once
#include <charconv>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "config.hpp"
#include "error.hpp"
#include "number.hpp"
#include "value.hpp"

namespace chisel {

    template <class S>
    concept WriterSink = requires(S& s, char c, std::string_view sv) {
        { s.put(c) } -> std::same_as<bool>;
        { s.puts(sv) } -> std::same_as<bool>;
        s.finish();
    };

    struct FixedBufferSink {
        char* buf {};
        std::size_t cap {};
        std::size_t pos {};

        [[nodiscard]] CHISEL_FORCEINLINE bool put(const char c) {
            if (pos >= cap)
                return false;
            buf[pos++] = c;
            return true;
        }

        [[nodiscard]] CHISEL_FORCEINLINE bool puts(const std::string_view s) {
            if (pos + s.size() > cap)
                return false;
            std::memcpy(buf + pos, s.data(), s.size());
            pos += s.size();
            return true;
        }

        [[nodiscard]] CHISEL_FORCEINLINE std::string_view finish() const {
            return {buf, pos};
        }
    };

    struct StringSink {
        std::string out;

        [[nodiscard]] CHISEL_FORCEINLINE bool put(const char c) {
            out.push_back(c);
            return true;
        }

        [[nodiscard]] CHISEL_FORCEINLINE bool puts(const std::string_view s) {
            out.append(s);
            return true;
        }

        [[nodiscard]] CHISEL_FORCEINLINE std::string finish() {
            return std::move(out);
        }
    };

    static_assert(WriterSink<FixedBufferSink>);
    static_assert(WriterSink<StringSink>);

    template <WriterSink Sink>
    class JsonWriterCore {
    public:
        JsonWriterCore(Sink sink, const WriterConfig& cfg = {}, ParseError* err = nullptr): sink_(std::move(sink)), pretty_(cfg.pretty), max_depth_(cfg.max_depth), err_(err) {
            if (err_)
                err_->reset();
        }

        // Renders v without native recursion. Returns false and records the error
        // (when an error slot was given) on the first failure.
        [[nodiscard]] bool write(const Value& v) {
            if (!v.is_container())
                return write_primitive(v);

            std::vector<Frame> stack;

            if (!open_container(v))
                return false;
            stack.push_back(Frame {&v, 0, v.size()});

            while (!stack.empty()) {
                Frame& f = stack.back();

                if (f.idx == f.count) {
                    const bool is_array = f.container->is_array();
                    const std::size_t cnt = f.count;
                    stack.pop_back();

                    if (!close_container(is_array, cnt))
                        return false;
                    continue;
                }

                if (f.idx && !put(','))
                    return false;

                if (!newline())
                    return false;

                const Value* child {};
                if (const auto* a = f.container->get_array()) {
                    child = &(*a)[f.idx];
                } else {
                    const auto& m = f.container->get_object()->member(f.idx);
                    if (!write_string(m.key))
                        return false;
                    if (!put(':'))
                        return false;
                    if (pretty_ && !put(' '))
                        return false;
                    child = &m.value;
                }
                ++f.idx;

                if (!child->is_container()) {
                    if (!write_primitive(*child))
                        return false;
                    continue;
                }

                // f may dangle after the push
                if (!open_container(*child))
                    return false;
                stack.push_back(Frame {child, 0, child->size()});
            }

            return true;
        }

        [[nodiscard]] CHISEL_FORCEINLINE auto finish() {
            return sink_.finish();
        }

    private:
        struct Frame {
            const Value* container {};
            std::size_t idx {};
            std::size_t count {};
        };

        CHISEL_FORCEINLINE void set_err(const ErrorCode c, std::string ctx = {}) const {
            if (err_)
                err_->set(c, 0, 1, 1, std::move(ctx));
        }

        [[nodiscard]] CHISEL_FORCEINLINE bool fail_overflow() const {
            set_err(ErrorCode::WriterOverflow, "output sink is full");
            return false;
        }

        [[nodiscard]] CHISEL_FORCEINLINE bool put(const char c) {
            if (!sink_.put(c))
                return fail_overflow();
            return true;
        }

        [[nodiscard]] CHISEL_FORCEINLINE bool puts(const std::string_view s) {
            if (!sink_.puts(s))
                return fail_overflow();
            return true;
        }

        [[nodiscard]] bool newline() {
            if (!pretty_)
                return true;

            if (!put('\n'))
                return false;

            for (std::size_t i = 0; i < indent_; ++i) {
                if (!put(' '))
                    return false;
            }
            return true;
        }

        [[nodiscard]] bool write_string(const std::string_view s) {
            constexpr char kHex[] = "0123456789abcdef";

            if (!put('"'))
                return false;

            const char* p = s.data();
            const char* const e = p + s.size();
            const char* run = p;

            while (p < e) {
                const auto c = static_cast<unsigned char>(*p);
                if (c >= 0x20u && c != '"' && c != '\\') {
                    ++p;
                    continue;
                }

                if (p > run && !puts(std::string_view {run, static_cast<std::size_t>(p - run)}))
                    return false;
                ++p;
                run = p;

                switch (c) {
                case '"':
                    if (!puts("\\\""))
                        return false;
                    break;
                case '\\':
                    if (!puts("\\\\"))
                        return false;
                    break;
                case '\b':
                    if (!puts("\\b"))
                        return false;
                    break;
                case '\f':
                    if (!puts("\\f"))
                        return false;
                    break;
                case '\n':
                    if (!puts("\\n"))
                        return false;
                    break;
                case '\r':
                    if (!puts("\\r"))
                        return false;
                    break;
                case '\t':
                    if (!puts("\\t"))
                        return false;
                    break;
                default: {
                    const char tmp[6] = {'\\', 'u', '0', '0', kHex[(c >> 4) & 0xF], kHex[c & 0xF]};
                    if (!puts(std::string_view {tmp, 6}))
                        return false;
                    break;
                }
                }
            }

            if (p > run && !puts(std::string_view {run, static_cast<std::size_t>(p - run)}))
                return false;

            return put('"');
        }

        [[nodiscard]] bool write_i64(const std::int64_t v) {
            char tmp[32];
            auto [p, ec] = std::to_chars(tmp, tmp + sizeof(tmp), v);
            if (ec != std::errc {})
                return fail_overflow();
            return puts(std::string_view {tmp, static_cast<std::size_t>(p - tmp)});
        }

        [[nodiscard]] bool write_double(const double d) {
            if (std::isnan(d)) {
                set_err(ErrorCode::NonFiniteNumber, "JSON has no representation for NaN");
                return false;
            }

            // out of range literals saturate to infinity when parsed, so this reads back equal
            if (std::isinf(d))
                return puts(d < 0 ? "-1e999" : "1e999");

            char tmp[40];
            auto [p, ec] = std::to_chars(tmp, tmp + sizeof(tmp) - 2, d);
            if (ec != std::errc {})
                return fail_overflow();

            // keep floats floats when read back: 1.0, not 1
            if (std::memchr(tmp, '.', static_cast<std::size_t>(p - tmp)) == nullptr && std::memchr(tmp, 'e', static_cast<std::size_t>(p - tmp)) == nullptr) {
                *p++ = '.';
                *p++ = '0';
            }
            return puts(std::string_view {tmp, static_cast<std::size_t>(p - tmp)});
        }

        [[nodiscard]] bool write_primitive(const Value& v) {
            switch (v.type()) {
            case Type::Null:
                return puts("null");
            case Type::Bool:
                return puts(v.as_bool() ? "true" : "false");
            case Type::Number: {
                const auto n = v.as_number();
                return n.is_integer() ? write_i64(n.i) : write_double(n.d);
            }
            case Type::String:
                return write_string(v.as_string());
            case Type::Array:
            case Type::Object:
                break;
            }
            return true;
        }

        [[nodiscard]] bool open_container(const Value& v) {
            if (depth_ + 1 > max_depth_) {
                set_err(ErrorCode::EncodeDepthExceeded, "value nested deeper than " + std::to_string(max_depth_) + " levels");
                return false;
            }
            ++depth_;
            indent_ += 2;

            return put(v.is_array() ? '[' : '{');
        }

        [[nodiscard]] bool close_container(const bool is_array, const std::size_t count) {
            indent_ -= 2;
            --depth_;

            if (pretty_ && count && !newline())
                return false;

            return put(is_array ? ']' : '}');
        }

        Sink sink_;
        bool pretty_ {};
        std::size_t indent_ {};

        std::size_t max_depth_ {};
        std::size_t depth_ {};

        ParseError* err_ {};
    };

    // empty string on failure, with the reason in *err when given
    [[nodiscard]] inline std::string encode(const Value& v, const WriterConfig& cfg = {}, ParseError* err = nullptr) {
        JsonWriterCore core(StringSink {}, cfg, err);
        if (!core.write(v))
            return {};
        return core.finish();
    }

    // renders into a caller buffer, WriterOverflow when it is too small
    [[nodiscard]] inline std::string_view encode_into(char* buf, const std::size_t cap, const Value& v, const WriterConfig& cfg = {}, ParseError* err = nullptr) {
        JsonWriterCore core(FixedBufferSink {buf, cap, 0}, cfg, err);
        if (!core.write(v))
            return {};
        return core.finish();
    }

} // namespace chisel

#endif // CHISEL_WRITER_HPP
