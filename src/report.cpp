#include <diffjson-cpp/report.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <unordered_set>

namespace diffjson_cpp {

// -- Flatten ------------------------------------------------------------------

auto flatten(const ChangeSet& changes, std::size_t max_items) -> FlatReport {
    auto report = FlatReport{};
    auto& out = report.entries;
    out.reserve(changes.size() + changes.values_changed.size());

    auto add_all = [&](const std::vector<ItemChange>& bucket, ChangeTag tag) {
        for (const auto& item : bucket) {
            out.push_back(FlatEntry{item.path, tag, item.value});
        }
    };

    add_all(changes.dictionary_item_added, ChangeTag::added);
    add_all(changes.iterable_item_added, ChangeTag::added);
    add_all(changes.dictionary_item_removed, ChangeTag::removed);
    add_all(changes.iterable_item_removed, ChangeTag::removed);

    auto changed_paths = std::unordered_set<std::string>{};
    for (const auto& change : changes.values_changed) {
        out.push_back(FlatEntry{change.path, ChangeTag::removed, change.old_value});
        out.push_back(FlatEntry{change.path, ChangeTag::added, change.new_value});
        changed_paths.insert(change.accessor);
    }

    for (const auto& moved : changes.iterable_item_moved) {
        if (changed_paths.contains(moved.accessor)) continue;
        out.push_back(
            FlatEntry{moved.path, ChangeTag::moved, Document(std::string{moved_message})});
    }

    truncate(report, max_items);
    return report;
}

void truncate(FlatReport& report, std::size_t max_items) {
    if (max_items > 0 && report.entries.size() > max_items) {
        report.truncation_note =
            fmt::format("...({} more items)", report.entries.size() - max_items);
        report.entries.resize(max_items);
    } else {
        report.truncation_note.clear();
    }
}

// -- One-line previews --------------------------------------------------------

namespace {

auto dump_compact(const Document& value) -> std::string {
    return value.dump(-1, ' ', true, Document::error_handler_t::replace);
}

auto summarize_object(const Document& value) -> std::string {
    auto result = std::string{"{ "};
    auto first = true;
    for (const auto& [key, item] : value.items()) {
        if (!first) result += ", ";
        first = false;
        result += dump_compact(Document(key));
        result += ": ...";
    }
    result += " }";
    return result;
}

}  // anonymous namespace

auto preview(const Document& value, std::size_t length_limit) -> std::string {
    auto text = dump_compact(value);
    if (text.size() <= length_limit) return text;

    if (value.is_object()) {
        text = summarize_object(value);
    } else if (value.is_array()) {
        text = fmt::format("[ ({} items) ]", value.size());
    }
    if (text.size() <= length_limit) return text;

    auto dropped = text.size() - length_limit;
    text.resize(length_limit);
    text += fmt::format("...({} more chars)", dropped);
    return text;
}

// -- Nesting ------------------------------------------------------------------

auto ReportNode::find(std::string_view key) const -> const ReportNode* {
    auto it = std::find_if(children.begin(), children.end(),
                           [&](const auto& child) { return child.first == key; });
    return it == children.end() ? nullptr : &it->second;
}

auto ReportNode::ensure_child(std::string_view key) -> ReportNode& {
    auto it = std::find_if(children.begin(), children.end(),
                           [&](const auto& child) { return child.first == key; });
    if (it != children.end()) return it->second;
    children.emplace_back(std::string{key}, ReportNode{});
    return children.back().second;
}

auto nest(const std::vector<FlatEntry>& entries, std::size_t length_limit) -> ReportNode {
    auto root = ReportNode{};
    for (const auto& entry : entries) {
        auto* node = &root;
        if (entry.path.empty()) {
            node = &node->ensure_child(root_marker);
        }
        for (const auto& segment : entry.path) {
            node = &node->ensure_child(segment_to_string(segment));
        }
        node->entries.push_back(LeafEntry{entry.tag, preview(entry.value, length_limit)});
    }
    return root;
}

// -- Rendering ----------------------------------------------------------------

namespace {

constexpr std::string_view indent_unit = "    ";

auto indentation(std::size_t level) -> std::string {
    auto result = std::string{};
    result.reserve(level * indent_unit.size());
    for (std::size_t i = 0; i < level; ++i) result += indent_unit;
    return result;
}

void render_node(const ReportNode& node, std::size_t level, const RenderOptions& options,
                 std::vector<std::string>& lines) {
    for (const auto& entry : node.entries) {
        auto line = std::string{leader(entry.tag)} + indentation(level) + entry.text;
        lines.push_back(colorize(color_of(entry.tag), line, options.color));
    }

    for (const auto& [key, child] : node.children) {
        auto key_line = "  " + indentation(level) + "[" + key + "]";

        // Fold the chain of single-child locations onto this line.
        const auto* target = &child;
        while (target->entries.empty() && target->children.size() == 1) {
            const auto& [next_key, next] = target->children.front();
            key_line += "[" + next_key + "]";
            target = &next;
        }
        if (target->children.empty() && target->entries.size() == 1) {
            key_line = colorize(color_of(target->entries.front().tag), key_line, options.color);
        }

        lines.push_back(std::move(key_line));
        render_node(*target, level + 1, options, lines);
    }
}

auto join_lines(const std::vector<std::string>& lines, std::string_view note) -> std::string {
    auto result = std::string{};
    for (const auto& line : lines) {
        if (!result.empty()) result += '\n';
        result += line;
    }
    if (!note.empty()) {
        if (!result.empty()) result += '\n';
        result += note;
    }
    return result;
}

}  // anonymous namespace

auto render_nested(const ReportNode& root, const RenderOptions& options,
                   std::string_view truncation_note) -> std::string {
    auto lines = std::vector<std::string>{};
    render_node(root, 0, options, lines);
    return join_lines(lines, truncation_note);
}

auto render_flat(const std::vector<FlatEntry>& entries, const RenderOptions& options,
                 std::string_view truncation_note) -> std::string {
    auto lines = std::vector<std::string>{};
    lines.reserve(entries.size());
    for (const auto& entry : entries) {
        auto line = fmt::format("{}{}: {}", leader(entry.tag), to_accessor(entry.path),
                                preview(entry.value, options.length_limit));
        lines.push_back(colorize(color_of(entry.tag), line, options.color));
    }
    return join_lines(lines, truncation_note);
}

auto format_report(const ChangeSet& changes, std::size_t max_items,
                   const RenderOptions& options, ReportLayout layout) -> std::string {
    auto flat = flatten(changes, max_items);
    if (layout == ReportLayout::flat) {
        return render_flat(flat.entries, options, flat.truncation_note);
    }
    auto nested = nest(flat.entries, options.length_limit);
    return render_nested(nested, options, flat.truncation_note);
}

}  // namespace diffjson_cpp
