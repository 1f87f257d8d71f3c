/*
 * chisel
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

#ifndef CHISEL_CONFIG_HPP
#define CHISEL_CONFIG_HPP

#pragma once
#include <cstddef>
#include <cstdint>

#ifdef _MSC_VER
    #define CHISEL_FORCEINLINE __forceinline
#else
    #define CHISEL_FORCEINLINE __attribute__((always_inline)) inline
#endif

namespace chisel {

    constexpr std::uint32_t kDefaultMaxDepth = 512;
    constexpr std::size_t kDefaultChunkSize = 64ull * 1024ull;

    enum class Encoding : std::uint8_t {
        Utf8,
        Utf16LE,
        Utf16BE,
        Latin1,
        Auto // BOM sniffing, then the RFC 4627 zero-byte pattern, else UTF-8
    };

    enum class NumericMode : std::uint8_t {
        Mixed,
        FloatOnly
    };

    struct ParserConfig {
        Encoding encoding {Encoding::Utf8};
        std::uint32_t max_depth {kDefaultMaxDepth};
        NumericMode numeric_mode {NumericMode::Mixed};
        bool require_container_root {false};

        [[nodiscard]] constexpr std::uint32_t depth_limit() const noexcept {
            return max_depth ? max_depth : 1u;
        }
    };

    struct WriterConfig {
        bool pretty {false};
        std::size_t max_depth {kDefaultMaxDepth};
    };

    [[nodiscard]] constexpr const char* encoding_name(const Encoding e) noexcept {
        switch (e) {
        case Encoding::Utf8:
            return "UTF-8";
        case Encoding::Utf16LE:
            return "UTF-16LE";
        case Encoding::Utf16BE:
            return "UTF-16BE";
        case Encoding::Latin1:
            return "ISO-8859-1";
        case Encoding::Auto:
            return "auto";
        }
        return "unknown";
    }

} // namespace chisel

#endif // CHISEL_CONFIG_HPP
