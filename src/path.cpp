#include <diffjson-cpp/path.hpp>

#include <charconv>
#include <optional>
#include <system_error>

namespace diffjson_cpp {

namespace {

auto is_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

auto trim(std::string_view s) -> std::string_view {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

/// Try to read the whole of @p text as a base-10 integer.
auto try_parse_index(std::string_view text) -> std::optional<std::int64_t> {
    text = trim(text);
    if (!text.empty() && text.front() == '+') text.remove_prefix(1);
    if (text.empty()) return std::nullopt;

    auto value = std::int64_t{0};
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    return value;
}

auto is_quote(char c) -> bool { return c == '\'' || c == '"'; }

auto unquote(std::string_view text) -> std::string {
    if (text.size() >= 2 && is_quote(text.front()) && text.back() == text.front()) {
        text = text.substr(1, text.size() - 2);
    }
    return std::string{text};
}

}  // anonymous namespace

auto strip_root(std::string_view accessor) -> std::string_view {
    if (accessor.starts_with(root_marker)) {
        accessor.remove_prefix(root_marker.size());
    }
    return accessor;
}

auto parse_accessor(std::string_view accessor) -> AccessorPath {
    accessor = strip_root(accessor);

    auto path = AccessorPath{};
    auto pos = std::size_t{0};
    while (pos < accessor.size()) {
        auto open = accessor.find('[', pos);
        if (open == std::string_view::npos) break;
        auto close = accessor.find(']', open + 1);
        if (close == std::string_view::npos) break;
        if (close == open + 1) {
            // "[]" holds nothing; resume scanning right after the '['
            pos = open + 1;
            continue;
        }

        auto content = accessor.substr(open + 1, close - open - 1);
        if (auto index = try_parse_index(content)) {
            path.emplace_back(*index);
        } else {
            path.emplace_back(unquote(content));
        }
        pos = close + 1;
    }
    return path;
}

auto to_accessor(const PathSegment& segment) -> std::string {
    if (const auto* index = std::get_if<std::int64_t>(&segment)) {
        return "[" + std::to_string(*index) + "]";
    }
    const auto& key = std::get<std::string>(segment);
    const char quote = key.find('\'') == std::string::npos ? '\'' : '"';
    auto result = std::string{};
    result.reserve(key.size() + 4);
    result.push_back('[');
    result.push_back(quote);
    result.append(key);
    result.push_back(quote);
    result.push_back(']');
    return result;
}

auto to_accessor(const AccessorPath& path, bool with_root) -> std::string {
    auto result = with_root ? std::string{root_marker} : std::string{};
    for (const auto& segment : path) {
        result += to_accessor(segment);
    }
    return result;
}

auto segment_to_string(const PathSegment& segment) -> std::string {
    if (const auto* index = std::get_if<std::int64_t>(&segment)) {
        return std::to_string(*index);
    }
    return std::get<std::string>(segment);
}

auto child_path(const AccessorPath& path, PathSegment segment) -> AccessorPath {
    auto result = path;
    result.push_back(std::move(segment));
    return result;
}

}  // namespace diffjson_cpp
