/*
 * chisel
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

#ifndef CHISEL_SOURCE_HPP
#define CHISEL_SOURCE_HPP

#pragma once
#include <concepts>
#include <cstddef>
#include <istream>
#include <memory>
#include <string_view>

#include "config.hpp"

namespace chisel {

    // A pull-based byte producer. next_chunk() hands out the next run of bytes and
    // returns an empty view once the source is exhausted or failed. A returned
    // view stays valid until the following next_chunk() call.
    template <class S>
    concept ByteSource = requires(S& s, const S& cs) {
        { s.next_chunk() } -> std::same_as<std::string_view>;
        { cs.failed() } -> std::same_as<bool>;
    };

    class StringSource {
    public:
        StringSource() = default;
        explicit StringSource(const std::string_view bytes) noexcept: bytes_(bytes) { }

        [[nodiscard]] std::string_view next_chunk() noexcept {
            if (consumed_)
                return {};
            consumed_ = true;
            return bytes_;
        }

        [[nodiscard]] static constexpr bool failed() noexcept {
            return false;
        }

    private:
        std::string_view bytes_ {};
        bool consumed_ {};
    };

    class StreamSource {
    public:
        explicit StreamSource(std::istream& in, const std::size_t chunk_size = kDefaultChunkSize)
            : in_(in), cap_(chunk_size ? chunk_size : 1u), buf_(std::make_unique<char[]>(cap_)) { }

        StreamSource(const StreamSource&) = delete;
        StreamSource& operator=(const StreamSource&) = delete;

        [[nodiscard]] std::string_view next_chunk() {
            if (failed_ || !in_.good())
                return {};

            in_.read(buf_.get(), static_cast<std::streamsize>(cap_));
            const auto got = static_cast<std::size_t>(in_.gcount());

            if (in_.bad()) {
                failed_ = true;
                return {};
            }
            return {buf_.get(), got};
        }

        [[nodiscard]] bool failed() const noexcept {
            return failed_;
        }

    private:
        std::istream& in_; // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
        std::size_t cap_ {};
        std::unique_ptr<char[]> buf_;
        bool failed_ {};
    };

    static_assert(ByteSource<StringSource>);
    static_assert(ByteSource<StreamSource>);

} // namespace chisel

#endif // CHISEL_SOURCE_HPP
