/// @file color.hpp
/// @brief Terminal colors for report and status lines.

#pragma once

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

namespace diffjson_cpp {

/// Foreground colors used by diffjson output.
enum class Color : std::uint8_t {
    none,
    red,
    green,
    yellow,
};

/// When to emit ANSI color codes.
enum class ColorMode : std::uint8_t {
    automatic,  ///< Only when writing to a terminal and NO_COLOR is unset.
    always,
    never,
};

/// Convert a ColorMode to its command-line spelling.
constexpr auto to_string_view(ColorMode mode) noexcept -> std::string_view {
    switch (mode) {
        case ColorMode::automatic: return "auto";
        case ColorMode::always:    return "always";
        case ColorMode::never:     return "never";
    }
    return "unknown";
}

/// Wrap @p text in the escape codes for @p color when @p enabled.
auto colorize(Color color, std::string_view text, bool enabled) -> std::string;

/// Decide whether output written to @p stream should be colored.
auto resolve_color(ColorMode mode, std::FILE* stream) -> bool;

}  // namespace diffjson_cpp
