/// @file diff.hpp
/// @brief Structural diff of two documents into categorized change buckets.

#pragma once

#include <diffjson-cpp/document.hpp>
#include <diffjson-cpp/path.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace diffjson_cpp {

/// A value present on one side only.
struct ItemChange {
    std::string accessor;  ///< Rooted accessor string, e.g. `root['items'][2]`.
    AccessorPath path;     ///< The same location as segments.
    Document value;        ///< The value that was added, removed or moved.

    auto operator==(const ItemChange&) const -> bool = default;
};

/// A scalar (or kind) change at one location.
struct ValueChange {
    std::string accessor;
    AccessorPath path;
    Document old_value;  ///< The value in the old document.
    Document new_value;  ///< The value in the new document.

    auto operator==(const ValueChange&) const -> bool = default;
};

/// Categorized differences between two documents.
///
/// Every record carries its location both as an accessor string rooted at
/// `root` (see path.hpp) and as an AccessorPath, plus the values involved,
/// so nothing has to be looked up again in either document. Buckets list
/// their records in the order the comparison found them.
struct ChangeSet {
    std::vector<ItemChange> dictionary_item_added;    ///< Keys only in the new document.
    std::vector<ItemChange> dictionary_item_removed;  ///< Keys only in the old document.
    std::vector<ItemChange> iterable_item_added;
    std::vector<ItemChange> iterable_item_removed;
    std::vector<ValueChange> values_changed;
    std::vector<ItemChange> iterable_item_moved;      ///< Keyed by the new index.

    /// True when the compared documents are structurally equal.
    auto empty() const -> bool;

    /// Total number of records across all buckets.
    auto size() const -> std::size_t;

    auto operator==(const ChangeSet&) const -> bool = default;
};

/// Options for diff().
struct DiffOptions {
    /// Treat arrays as multisets: reordered elements are not changes.
    bool ignore_order{true};
    /// In ignore_order mode, report matched elements whose index changed
    /// in iterable_item_moved.
    bool report_moves{false};
};

/// Compare @p old_doc against @p new_doc.
///
/// Object key order never matters. Integers and floats with the same
/// numeric value are equal. In ignore_order mode each new array element is
/// matched with an equal old element; unmatched objects (or arrays) are
/// paired positionally and compared recursively at the old index, and the
/// remaining unmatched elements become additions and removals.
/// @return An empty ChangeSet when the documents are structurally equal.
auto diff(const Document& old_doc, const Document& new_doc,
          const DiffOptions& options = {}) -> ChangeSet;

/// Deep equality with the same rules as diff().
auto structurally_equal(const Document& a, const Document& b,
                        bool ignore_order = true) -> bool;

}  // namespace diffjson_cpp
