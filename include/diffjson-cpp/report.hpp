/// @file report.hpp
/// @brief Turning a ChangeSet into a readable report: flatten, truncate,
/// preview values on one line, nest by shared path prefix, and render.

#pragma once

#include <diffjson-cpp/color.hpp>
#include <diffjson-cpp/diff.hpp>
#include <diffjson-cpp/document.hpp>
#include <diffjson-cpp/path.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace diffjson_cpp {

/// How a flattened record is shown.
enum class ChangeTag : std::uint8_t {
    added,    ///< Present only in the new document ("+ ", green).
    removed,  ///< Present only in the old document ("- ", red).
    moved,    ///< Same value at another array position ("  ", yellow).
};

/// Convert a ChangeTag to its string representation.
constexpr auto to_string_view(ChangeTag tag) noexcept -> std::string_view {
    switch (tag) {
        case ChangeTag::added:   return "added";
        case ChangeTag::removed: return "removed";
        case ChangeTag::moved:   return "moved";
    }
    return "unknown";
}

/// The two-character line leader for a tag.
constexpr auto leader(ChangeTag tag) noexcept -> std::string_view {
    switch (tag) {
        case ChangeTag::added:   return "+ ";
        case ChangeTag::removed: return "- ";
        case ChangeTag::moved:   return "  ";
    }
    return "  ";
}

/// The color a tag is rendered in.
constexpr auto color_of(ChangeTag tag) noexcept -> Color {
    switch (tag) {
        case ChangeTag::added:   return Color::green;
        case ChangeTag::removed: return Color::red;
        case ChangeTag::moved:   return Color::yellow;
    }
    return Color::none;
}

/// Display text for a move record.
inline constexpr std::string_view moved_message = "Moved location in list.";

/// Default character budget of a one-line value preview.
inline constexpr std::size_t default_preview_limit = 100;

/// Default number of flattened records kept in a report.
inline constexpr std::size_t default_max_items = 100;

/// One change at one location.
struct FlatEntry {
    AccessorPath path;
    ChangeTag tag;
    Document value;  ///< The value shown for this record.

    auto operator==(const FlatEntry&) const -> bool = default;
};

/// Flattened records plus the note describing what truncation dropped.
struct FlatReport {
    std::vector<FlatEntry> entries;
    std::string truncation_note;  ///< "...(k more items)", or empty.
};

/// Flatten @p changes into one ordered list.
///
/// Buckets are visited in a fixed order: key additions, item additions,
/// key removals, item removals, value changes (each becomes a removed
/// record followed by an added record at the same path), then moves.
/// A move whose path also has a value change is left out.
/// @param max_items Keep at most this many records; 0 keeps all.
auto flatten(const ChangeSet& changes, std::size_t max_items = default_max_items)
    -> FlatReport;

/// Keep the first @p max_items entries of @p report (0 keeps all) and set
/// its truncation note.
void truncate(FlatReport& report, std::size_t max_items);

/// Serialize @p value on one line, summarizing it when it is too long.
///
/// Short values are returned verbatim. Longer objects become
/// `{ "k1": ..., "k2": ... }`, longer arrays `[ (n items) ]`; whatever is
/// still longer than @p length_limit is cut to exactly that many characters
/// followed by `...(m more chars)`.
auto preview(const Document& value, std::size_t length_limit = default_preview_limit)
    -> std::string;

/// A (tag, preview) pair stored at a report location.
struct LeafEntry {
    ChangeTag tag;
    std::string text;

    auto operator==(const LeafEntry&) const -> bool = default;
};

/// A node of the nested report.
///
/// A leaf holds the records made at exactly its location, in the order
/// they were flattened; a branch holds sub-locations keyed by segment
/// text, in first-seen order. A location that has records both at and
/// below it carries both.
struct ReportNode {
    std::vector<LeafEntry> entries;
    std::vector<std::pair<std::string, ReportNode>> children;

    auto is_leaf() const -> bool { return children.empty(); }
    auto is_branch() const -> bool { return !children.empty(); }

    /// The child at @p key, or nullptr.
    auto find(std::string_view key) const -> const ReportNode*;

    /// The child at @p key, appended if missing.
    auto ensure_child(std::string_view key) -> ReportNode&;
};

/// Group @p entries by shared path prefix.
///
/// Segments are keyed by their unquoted text. A record with an empty path
/// (a change of the whole document) is keyed `root`.
auto nest(const std::vector<FlatEntry>& entries,
          std::size_t length_limit = default_preview_limit) -> ReportNode;

/// Renderer configuration.
struct RenderOptions {
    bool color{false};                             ///< Emit ANSI colors.
    std::size_t length_limit{default_preview_limit};  ///< Preview budget.
};

/// Render a nested report.
///
/// Each location prints as `[key]`; chains of locations with a single
/// child collapse onto that line (`[a][b][c]`), which takes the color of
/// the record it leads to when that is the only one. Records print
/// beneath, one per line, indented one level deeper. The truncation note,
/// if any, is the last line.
auto render_nested(const ReportNode& root, const RenderOptions& options = {},
                   std::string_view truncation_note = {}) -> std::string;

/// Render one `leader + [path]: preview` line per entry, then the note.
auto render_flat(const std::vector<FlatEntry>& entries, const RenderOptions& options = {},
                 std::string_view truncation_note = {}) -> std::string;

/// Report layouts.
enum class ReportLayout : std::uint8_t {
    nested,
    flat,
};

/// flatten() then render in the chosen layout.
auto format_report(const ChangeSet& changes, std::size_t max_items,
                   const RenderOptions& options = {},
                   ReportLayout layout = ReportLayout::nested) -> std::string;

}  // namespace diffjson_cpp
