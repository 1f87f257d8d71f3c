/*
 * chisel
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

#ifndef CHISEL_POINTER_HPP
#define CHISEL_POINTER_HPP

#pragma once
#include <charconv>
#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

#include "config.hpp"
#include "events.hpp"
#include "value.hpp"

namespace chisel {

    // RFC 6901 JSON Pointer built from name and index components.
    class JsonPointer {
    public:
        struct Component {
            std::string name {};
            std::size_t index {};
            bool is_index {};

            [[nodiscard]] friend bool operator==(const Component&, const Component&) = default;
        };

        JsonPointer() = default;

        void push_name(const std::string_view name) {
            parts_.push_back(Component {std::string(name), 0, false});
        }

        void push_index(const std::size_t index) {
            parts_.push_back(Component {{}, index, true});
        }

        void pop() noexcept {
            if (!parts_.empty())
                parts_.pop_back();
        }

        void clear() noexcept {
            parts_.clear();
        }

        [[nodiscard]] CHISEL_FORCEINLINE std::size_t size() const noexcept {
            return parts_.size();
        }

        [[nodiscard]] CHISEL_FORCEINLINE bool empty() const noexcept {
            return parts_.empty();
        }

        [[nodiscard]] const std::vector<Component>& components() const noexcept {
            return parts_;
        }

        // "" for the whole document, otherwise "/a/b~1c/0"
        [[nodiscard]] std::string str() const {
            std::string out;
            for (const auto& c : parts_) {
                out.push_back('/');
                if (c.is_index) {
                    out.append(std::to_string(c.index));
                    continue;
                }
                for (const char ch : c.name) {
                    if (ch == '~')
                        out.append("~0");
                    else if (ch == '/')
                        out.append("~1");
                    else
                        out.push_back(ch);
                }
            }
            return out;
        }

        // nullptr when the pointer addresses nothing in root
        [[nodiscard]] const Value* resolve(const Value& root) const noexcept {
            const Value* cur = &root;
            for (const auto& c : parts_) {
                if (const auto* a = cur->get_array()) {
                    std::size_t i = c.index;
                    if (!c.is_index && !parse_index(c.name, i))
                        return nullptr;
                    if (i >= a->size())
                        return nullptr;
                    cur = &(*a)[i];
                } else if (const auto* o = cur->get_object()) {
                    const auto* next = c.is_index ? o->find(std::to_string(c.index)) : o->find(c.name);
                    if (!next)
                        return nullptr;
                    cur = next;
                } else {
                    return nullptr;
                }
            }
            return cur;
        }

        [[nodiscard]] friend bool operator==(const JsonPointer&, const JsonPointer&) = default;

    private:
        [[nodiscard]] static bool parse_index(const std::string_view s, std::size_t& out) noexcept {
            if (s.empty() || (s.size() > 1 && s[0] == '0'))
                return false;
            const auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
            return ec == std::errc {} && p == s.data() + s.size();
        }

        std::vector<Component> parts_ {};
    };

    // Event sink that tracks where in the document each event happens and hands
    // the event to fn together with the pointer of the value it belongs to.
    template <class Fn>
    class PointerSink {
    public:
        explicit PointerSink(Fn fn): fn_(std::move(fn)) { }

        [[nodiscard]] Flow on_event(const Event& e) {
            switch (e.kind) {
            case EventKind::ObjectKey: {
                ptr_.push_name(e.text);
                const auto f = call(e);
                ptr_.pop();
                key_pending_ = true;
                key_.assign(e.text);
                return f;
            }
            case EventKind::StartObject:
            case EventKind::StartArray: {
                enter_value();
                const auto f = call(e);
                frames_.push_back(Frame {e.kind == EventKind::StartArray, 0});
                return f;
            }
            case EventKind::EndObject:
            case EventKind::EndArray: {
                if (!frames_.empty())
                    frames_.pop_back();
                const auto f = call(e);
                leave_value();
                return f;
            }
            case EventKind::Failure:
                return call(e);
            default: {
                enter_value();
                const auto f = call(e);
                leave_value();
                return f;
            }
            }
        }

        [[nodiscard]] const JsonPointer& pointer() const noexcept {
            return ptr_;
        }

    private:
        struct Frame {
            bool is_array {};
            std::size_t next_index {};
        };

        void enter_value() {
            if (frames_.empty())
                return;
            auto& top = frames_.back();
            if (top.is_array) {
                ptr_.push_index(top.next_index++);
            } else if (key_pending_) {
                ptr_.push_name(key_);
                key_pending_ = false;
            }
        }

        void leave_value() noexcept {
            if (!frames_.empty())
                ptr_.pop();
        }

        [[nodiscard]] Flow call(const Event& e) {
            if constexpr (std::is_void_v<std::invoke_result_t<Fn&, const Event&, const JsonPointer&>>) {
                fn_(e, ptr_);
                return Flow::Continue;
            } else {
                return static_cast<Flow>(fn_(e, ptr_));
            }
        }

        Fn fn_;
        JsonPointer ptr_ {};
        std::vector<Frame> frames_ {};
        std::string key_ {};
        bool key_pending_ {};
    };

    template <class Fn>
    PointerSink(Fn) -> PointerSink<Fn>;

} // namespace chisel

#endif // CHISEL_POINTER_HPP
