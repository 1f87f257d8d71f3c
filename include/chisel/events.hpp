/*
 * chisel
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

#ifndef CHISEL_EVENTS_HPP
#define CHISEL_EVENTS_HPP

#pragma once
#include <concepts>
#include <cstdint>
#include <string_view>

#include "error.hpp"
#include "lexer.hpp"
#include "number.hpp"

namespace chisel {

    enum class EventKind : std::uint8_t {
        StartObject,
        EndObject,
        StartArray,
        EndArray,
        ObjectKey,
        String,
        Number,
        Bool,
        Null,
        Failure
    };

    [[nodiscard]] constexpr const char* event_kind_name(const EventKind k) noexcept {
        switch (k) {
        case EventKind::StartObject:
            return "StartObject";
        case EventKind::EndObject:
            return "EndObject";
        case EventKind::StartArray:
            return "StartArray";
        case EventKind::EndArray:
            return "EndArray";
        case EventKind::ObjectKey:
            return "ObjectKey";
        case EventKind::String:
            return "String";
        case EventKind::Number:
            return "Number";
        case EventKind::Bool:
            return "Bool";
        case EventKind::Null:
            return "Null";
        case EventKind::Failure:
            return "Failure";
        }
        return "Unknown";
    }

    // text is only valid for the duration of the sink call
    struct Event {
        EventKind kind {EventKind::Null};
        Span span {};
        std::string_view text {};
        Number number {};
        bool boolean {};
        const ParseError* error {};

        [[nodiscard]] constexpr bool is_value() const noexcept {
            return kind == EventKind::StartObject || kind == EventKind::StartArray || kind == EventKind::String || kind == EventKind::Number || kind == EventKind::Bool ||
                kind == EventKind::Null;
        }
    };

    enum class Flow : std::uint8_t {
        Continue,
        Abort
    };

    template <class S>
    concept EventSink = requires(S& s, const Event& e) {
        { s.on_event(e) } -> std::same_as<Flow>;
    };

} // namespace chisel

#endif // CHISEL_EVENTS_HPP
