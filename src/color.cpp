#include <diffjson-cpp/color.hpp>

#include <fmt/color.h>
#include <fmt/format.h>

#include <cstdlib>

#include <unistd.h>

namespace diffjson_cpp {

auto colorize(Color color, std::string_view text, bool enabled) -> std::string {
    if (!enabled) return std::string{text};
    switch (color) {
        case Color::red:
            return fmt::format(fmt::fg(fmt::terminal_color::red), "{}", text);
        case Color::green:
            return fmt::format(fmt::fg(fmt::terminal_color::green), "{}", text);
        case Color::yellow:
            return fmt::format(fmt::fg(fmt::terminal_color::yellow), "{}", text);
        case Color::none:
            break;
    }
    return std::string{text};
}

auto resolve_color(ColorMode mode, std::FILE* stream) -> bool {
    switch (mode) {
        case ColorMode::always: return true;
        case ColorMode::never:  return false;
        case ColorMode::automatic:
            if (std::getenv("NO_COLOR") != nullptr) return false;
            return stream != nullptr && ::isatty(::fileno(stream)) != 0;
    }
    return false;
}

}  // namespace diffjson_cpp
