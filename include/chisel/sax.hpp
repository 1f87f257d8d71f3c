/*
 * chisel
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

#ifndef CHISEL_SAX_HPP
#define CHISEL_SAX_HPP

#pragma once
#include <algorithm>
#include <cassert>
#include <concepts>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "config.hpp"
#include "error.hpp"
#include "events.hpp"
#include "lexer.hpp"
#include "number.hpp"
#include "source.hpp"

namespace chisel {

    enum class ParseStatus : std::uint8_t {
        Complete,
        Aborted,
        Failed
    };

    struct ParseResult {
        ParseStatus status {ParseStatus::Complete};
        ParseError error {};

        // an abort requested by the sink is not an error
        [[nodiscard]] constexpr bool ok() const noexcept {
            return status != ParseStatus::Failed;
        }

        [[nodiscard]] constexpr bool complete() const noexcept {
            return status == ParseStatus::Complete;
        }

        [[nodiscard]] constexpr bool aborted() const noexcept {
            return status == ParseStatus::Aborted;
        }

        [[nodiscard]] constexpr explicit operator bool() const noexcept {
            return ok();
        }
    };

    template <ByteSource Source, EventSink Sink>
    class CoreParser {
    public:
        CoreParser(Sink& sink, Source& src, const ParserConfig& cfg = {}): sink_(sink), lex_(src, cfg.encoding), cfg_(cfg), max_depth_(cfg.depth_limit()) {
            stack_.reserve(std::min<std::uint32_t>(max_depth_, 64u));
        }

        CoreParser(const CoreParser&) = delete;
        CoreParser& operator=(const CoreParser&) = delete;

        [[nodiscard]] ParseResult parse_root() {
            if (!advance())
                return finish();

            if (tok_.kind == TokenKind::EndOfInput) {
                (void)fail(ErrorCode::EmptyInput, "no JSON value in input");
                return finish();
            }

            if (cfg_.require_container_root && tok_.kind != TokenKind::LeftBrace && tok_.kind != TokenKind::LeftBracket) {
                (void)fail(ErrorCode::InvalidRoot, std::string("top-level value must be an object or array, found ") + token_kind_name(tok_.kind));
                return finish();
            }

            auto root_done = false;

            while (true) {
                if (stack_.empty()) {
                    if (root_done) {
                        if (tok_.kind != TokenKind::EndOfInput) {
                            (void)fail(ErrorCode::TrailingData, std::string("unexpected ") + token_kind_name(tok_.kind) + " after top-level value");
                            return finish();
                        }
                        return ParseResult {ParseStatus::Complete, {}};
                    }

                    if (!parse_value())
                        return finish();
                    if (stack_.empty())
                        root_done = true;
                } else if (!process_frame(root_done)) {
                    return finish();
                }

                if (!advance())
                    return finish();
            }
        }

    private:
        enum class Type : std::uint8_t {
            Array = 1,
            Object = 2
        };

        enum class State : std::uint8_t {
            ExpectValueOrEnd,
            ExpectValue,
            ExpectKeyOrEnd,
            ExpectKey,
            ExpectColon,
            ExpectCommaOrEnd
        };

        struct Frame {
            std::uint8_t value {};

            static constexpr std::uint8_t type_mask = 0b0000'0111;
            static constexpr std::uint8_t state_mask = 0b0011'1000;

            Frame() = default;

            constexpr Frame(const Type t, const State s) noexcept {
                type(t);
                state(s);
            }

            [[nodiscard]] constexpr Type type() const noexcept {
                return static_cast<Type>(value & type_mask);
            }

            [[nodiscard]] constexpr State state() const noexcept {
                return static_cast<State>((value & state_mask) >> 3);
            }

            constexpr void type(const Type t) noexcept {
                value = static_cast<std::uint8_t>((value & ~type_mask) | (static_cast<std::uint8_t>(t) & type_mask));
            }

            constexpr void state(const State s) noexcept {
                value = static_cast<std::uint8_t>((value & ~state_mask) | ((static_cast<std::uint8_t>(s) << 3) & state_mask));
            }
        };

        static_assert(sizeof(Frame) == 1);
        static_assert(std::is_trivially_copyable_v<Frame>);

        [[nodiscard]] bool advance() {
            if (lex_.next(tok_))
                return true;
            err_ = lex_.error();
            return false;
        }

        [[nodiscard]] bool fail(const ErrorCode c, std::string ctx) {
            err_.set(c, tok_.span.start_offset, tok_.span.line, tok_.span.column, std::move(ctx));
            return false;
        }

        [[nodiscard]] ParseResult finish() {
            if (aborted_)
                return ParseResult {ParseStatus::Aborted, {}};

            assert(!err_.ok() && "parser stopped without an error");

            Event ev {};
            ev.kind = EventKind::Failure;
            ev.span = Span {err_.offset, err_.offset, err_.line, err_.column};
            ev.error = &err_;
            (void)sink_.on_event(ev);

            return ParseResult {ParseStatus::Failed, err_};
        }

        [[nodiscard]] CHISEL_FORCEINLINE bool emit(const EventKind k) {
            Event ev {};
            ev.kind = k;
            ev.span = tok_.span;
            return deliver(ev);
        }

        [[nodiscard]] CHISEL_FORCEINLINE bool deliver(const Event& ev) {
            if (sink_.on_event(ev) == Flow::Abort) {
                aborted_ = true;
                return false;
            }
            return true;
        }

        [[nodiscard]] bool open_container(const Type t) {
            if (stack_.size() >= max_depth_)
                return fail(ErrorCode::DepthExceeded, "nesting deeper than " + std::to_string(max_depth_) + " levels");

            if (!emit(t == Type::Object ? EventKind::StartObject : EventKind::StartArray))
                return false;

            stack_.push_back(Frame {t, t == Type::Object ? State::ExpectKeyOrEnd : State::ExpectValueOrEnd});
            return true;
        }

        [[nodiscard]] bool parse_value() {
            Event ev {};
            ev.span = tok_.span;

            switch (tok_.kind) {
            case TokenKind::LeftBrace:
                return open_container(Type::Object);
            case TokenKind::LeftBracket:
                return open_container(Type::Array);
            case TokenKind::String:
                ev.kind = EventKind::String;
                ev.text = tok_.text;
                return deliver(ev);
            case TokenKind::Number:
                ev.kind = EventKind::Number;
                ev.text = tok_.text;
                ev.number = resolve_number(tok_.text, cfg_.numeric_mode);
                return deliver(ev);
            case TokenKind::True:
            case TokenKind::False:
                ev.kind = EventKind::Bool;
                ev.boolean = tok_.kind == TokenKind::True;
                return deliver(ev);
            case TokenKind::Null:
                ev.kind = EventKind::Null;
                return deliver(ev);
            case TokenKind::EndOfInput:
                return fail(ErrorCode::UnexpectedEnd, "input ended where a value was expected");
            default:
                return fail(ErrorCode::UnexpectedToken, std::string("unexpected ") + token_kind_name(tok_.kind) + ", expected a value");
            }
        }

        [[nodiscard]] bool close_container(bool& root_done, const Type type) {
            if (!emit(type == Type::Array ? EventKind::EndArray : EventKind::EndObject))
                return false;

            assert(!stack_.empty());
            stack_.pop_back();
            if (stack_.empty())
                root_done = true;
            return true;
        }

        [[nodiscard]] bool process_frame(bool& root_done) {
            auto& frame = stack_.back();
            const Type type = frame.type();
            const auto kind = tok_.kind;

            if (kind == TokenKind::EndOfInput)
                return fail(ErrorCode::UnexpectedEnd, type == Type::Object ? "input ended inside an object" : "input ended inside an array");

            switch (frame.state()) {
            case State::ExpectKeyOrEnd:
                if (kind == TokenKind::RightBrace)
                    return close_container(root_done, type);
                [[fallthrough]];
            case State::ExpectKey: {
                if (kind != TokenKind::String)
                    return fail(ErrorCode::UnexpectedToken, std::string("unexpected ") + token_kind_name(kind) + ", expected an object key");
                frame.state(State::ExpectColon);

                Event ev {};
                ev.kind = EventKind::ObjectKey;
                ev.span = tok_.span;
                ev.text = tok_.text;
                return deliver(ev);
            }
            case State::ExpectColon:
                if (kind != TokenKind::Colon)
                    return fail(ErrorCode::UnexpectedToken, std::string("unexpected ") + token_kind_name(kind) + ", expected ':'");
                frame.state(State::ExpectValue);
                return true;
            case State::ExpectValueOrEnd:
                if (kind == TokenKind::RightBracket)
                    return close_container(root_done, type);
                [[fallthrough]];
            case State::ExpectValue:
                // set before parse_value, which may grow the stack under the reference
                frame.state(State::ExpectCommaOrEnd);
                return parse_value();
            case State::ExpectCommaOrEnd:
                if (kind == TokenKind::Comma) {
                    frame.state(type == Type::Array ? State::ExpectValue : State::ExpectKey);
                    return true;
                }
                if (type == Type::Array && kind == TokenKind::RightBracket)
                    return close_container(root_done, type);
                if (type == Type::Object && kind == TokenKind::RightBrace)
                    return close_container(root_done, type);
                return fail(ErrorCode::UnexpectedToken, std::string("unexpected ") + token_kind_name(kind) + (type == Type::Array ? ", expected ',' or ']'" : ", expected ',' or '}'"));
            }

            return fail(ErrorCode::UnexpectedToken, std::string("unexpected ") + token_kind_name(kind));
        }

        Sink& sink_; // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
        Lexer<Source> lex_;
        ParserConfig cfg_ {};
        std::uint32_t max_depth_ {kDefaultMaxDepth};

        Token tok_ {};
        ParseError err_ {};
        bool aborted_ {};

        std::vector<Frame> stack_ {};
    };

    template <class H>
    concept ParserHandler = requires(H& h) {
        { h.on_null() } -> std::same_as<bool>;
        { h.on_bool(true) } -> std::same_as<bool>;
        { h.on_integer(std::int64_t {}) } -> std::same_as<bool>;
        { h.on_number(double {}) } -> std::same_as<bool>;
        { h.on_string(std::string_view {}) } -> std::same_as<bool>;
        { h.on_key(std::string_view {}) } -> std::same_as<bool>;
        { h.on_array_begin() } -> std::same_as<bool>;
        { h.on_array_end() } -> std::same_as<bool>;
        { h.on_object_begin() } -> std::same_as<bool>;
        { h.on_object_end() } -> std::same_as<bool>;
    };

    // Drives a per-kind callback handler. Returning false from a callback aborts the
    // parse; a handler may optionally observe failures through on_error.
    template <ParserHandler Handler>
    class HandlerSink {
    public:
        explicit HandlerSink(Handler& h) noexcept: h_(h) { }

        [[nodiscard]] Flow on_event(const Event& e) {
            return dispatch(e) ? Flow::Continue : Flow::Abort;
        }

    private:
        [[nodiscard]] bool dispatch(const Event& e) {
            switch (e.kind) {
            case EventKind::StartObject:
                return h_.on_object_begin();
            case EventKind::EndObject:
                return h_.on_object_end();
            case EventKind::StartArray:
                return h_.on_array_begin();
            case EventKind::EndArray:
                return h_.on_array_end();
            case EventKind::ObjectKey:
                return h_.on_key(e.text);
            case EventKind::String:
                return h_.on_string(e.text);
            case EventKind::Number:
                return e.number.is_integer() ? h_.on_integer(e.number.i) : h_.on_number(e.number.d);
            case EventKind::Bool:
                return h_.on_bool(e.boolean);
            case EventKind::Null:
                return h_.on_null();
            case EventKind::Failure:
                if constexpr (requires { h_.on_error(*e.error); })
                    h_.on_error(*e.error);
                return false;
            }
            return false;
        }

        Handler& h_; // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    };

    // Wraps a callable taking const Event&. A callable returning void never aborts.
    template <class Fn>
    class CallbackSink {
    public:
        explicit CallbackSink(Fn fn): fn_(std::move(fn)) { }

        [[nodiscard]] Flow on_event(const Event& e) {
            if constexpr (std::is_void_v<std::invoke_result_t<Fn&, const Event&>>) {
                fn_(e);
                return Flow::Continue;
            } else {
                return static_cast<Flow>(fn_(e));
            }
        }

    private:
        Fn fn_;
    };

    template <class Fn>
    CallbackSink(Fn) -> CallbackSink<Fn>;

    template <ByteSource Source, EventSink Sink>
    [[nodiscard]] ParseResult parse_sax(Source& src, Sink& sink, const ParserConfig& cfg = {}) {
        CoreParser<Source, Sink> p(sink, src, cfg);
        return p.parse_root();
    }

    template <EventSink Sink>
    [[nodiscard]] ParseResult parse_sax(const std::string_view input, Sink& sink, const ParserConfig& cfg = {}) {
        StringSource src {input};
        return parse_sax(src, sink, cfg);
    }

    template <EventSink Sink>
    [[nodiscard]] ParseResult parse_sax_file(const std::filesystem::path& path, Sink& sink, const ParserConfig& cfg = {}) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            ParseResult r {ParseStatus::Failed, {}};
            r.error.set(ErrorCode::InvalidFile, 0, 1, 1, "cannot open '" + path.string() + "'");

            Event ev {};
            ev.kind = EventKind::Failure;
            ev.error = &r.error;
            (void)sink.on_event(ev);
            return r;
        }

        StreamSource src {in};
        return parse_sax(src, sink, cfg);
    }

} // namespace chisel

#endif // CHISEL_SAX_HPP
