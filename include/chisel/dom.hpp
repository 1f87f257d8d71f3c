/*
 * chisel
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

#ifndef CHISEL_DOM_HPP
#define CHISEL_DOM_HPP

#pragma once
#include <cassert>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "config.hpp"
#include "error.hpp"
#include "events.hpp"
#include "sax.hpp"
#include "source.hpp"
#include "value.hpp"

namespace chisel {

    // Event sink assembling an owned Value tree. A Failure event throws away
    // everything built so far.
    class DomBuilder {
    public:
        DomBuilder() = default;

        [[nodiscard]] Flow on_event(const Event& e) {
            switch (e.kind) {
            case EventKind::StartObject:
                stack_.push_back(Frame {Value::object(), {}});
                break;
            case EventKind::StartArray:
                stack_.push_back(Frame {Value::array(), {}});
                break;
            case EventKind::EndObject:
            case EventKind::EndArray: {
                assert(!stack_.empty());
                Value done = std::move(stack_.back().container);
                stack_.pop_back();
                attach(std::move(done));
                break;
            }
            case EventKind::ObjectKey:
                assert(!stack_.empty());
                stack_.back().pending_key.assign(e.text);
                break;
            case EventKind::String:
                attach(Value {std::string(e.text)});
                break;
            case EventKind::Number:
                attach(Value {e.number});
                break;
            case EventKind::Bool:
                attach(Value {e.boolean});
                break;
            case EventKind::Null:
                attach(Value {});
                break;
            case EventKind::Failure:
                reset();
                break;
            }
            return Flow::Continue;
        }

        [[nodiscard]] bool has_result() const noexcept {
            return done_;
        }

        [[nodiscard]] Value take_result() {
            done_ = false;
            return std::move(result_);
        }

        void reset() {
            stack_.clear();
            result_ = Value {};
            done_ = false;
        }

    private:
        struct Frame {
            Value container;
            std::string pending_key;
        };

        void attach(Value v) {
            if (stack_.empty()) {
                result_ = std::move(v);
                done_ = true;
                return;
            }

            auto& top = stack_.back();
            if (auto* a = top.container.get_array()) {
                a->push_back(std::move(v));
                return;
            }

            top.container.get_object()->insert(std::move(top.pending_key), std::move(v));
            top.pending_key.clear();
        }

        std::vector<Frame> stack_ {};
        Value result_ {};
        bool done_ {};
    };

    static_assert(EventSink<DomBuilder>);

    // Result of a DOM parse: either a root value or the error that stopped the parse.
    class Document {
    public:
        Document() = default;

        explicit Document(Value root): root_(std::move(root)) { }

        explicit Document(ParseError err): err_(std::move(err)) { }

        [[nodiscard]] CHISEL_FORCEINLINE bool ok() const noexcept {
            return err_.ok();
        }

        [[nodiscard]] CHISEL_FORCEINLINE explicit operator bool() const noexcept {
            return ok();
        }

        [[nodiscard]] CHISEL_FORCEINLINE const ParseError& error() const noexcept {
            return err_;
        }

        [[nodiscard]] CHISEL_FORCEINLINE const Value& root() const noexcept {
            return root_;
        }

        [[nodiscard]] CHISEL_FORCEINLINE Value& root() noexcept {
            return root_;
        }

        [[nodiscard]] Value take_root() noexcept {
            return std::move(root_);
        }

    private:
        Value root_ {};
        ParseError err_ {};
    };

    namespace detail {

        [[nodiscard]] inline Document finish_document(const ParseResult& r, DomBuilder& builder) {
            if (r.status == ParseStatus::Failed)
                return Document {r.error};

            assert(builder.has_result() && "completed parse without a root value");
            return Document {builder.take_result()};
        }

    } // namespace detail

    template <ByteSource Source>
    [[nodiscard]] Document parse_dom(Source& src, const ParserConfig& cfg = {}) {
        DomBuilder builder;
        const auto r = parse_sax(src, builder, cfg);
        return detail::finish_document(r, builder);
    }

    [[nodiscard]] inline Document parse_dom(const std::string_view input, const ParserConfig& cfg = {}) {
        StringSource src {input};
        return parse_dom(src, cfg);
    }

    [[nodiscard]] inline Document parse_dom_file(const std::filesystem::path& path, const ParserConfig& cfg = {}) {
        DomBuilder builder;
        const auto r = parse_sax_file(path, builder, cfg);
        return detail::finish_document(r, builder);
    }

} // namespace chisel

#endif // CHISEL_DOM_HPP
