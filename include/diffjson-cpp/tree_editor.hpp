/// @file tree_editor.hpp
/// @brief Absent-tolerant lookup and deletion by accessor path.

#pragma once

#include <diffjson-cpp/document.hpp>
#include <diffjson-cpp/path.hpp>

#include <span>

namespace diffjson_cpp {

/// Get the value at @p path.
///
/// A string key steps into an object, an index into an array. A missing
/// key, an out-of-range (or negative) index, or a segment of the wrong
/// kind for the value it is applied to ends the walk.
/// @return A pointer into @p doc, or nullptr if the path doesn't exist.
auto get_path(const Document& doc, const AccessorPath& path) -> const Document*;

/// Mutable overload of get_path().
auto get_path(Document& doc, const AccessorPath& path) -> Document*;

/// Delete the value at @p path in place.
///
/// If the parent cannot be resolved or the last segment does not exist in
/// it, nothing happens. The root itself cannot be deleted.
/// @return true if exactly one element was removed.
auto delete_path(Document& doc, const AccessorPath& path) -> bool;

/// Delete every path in @p paths from @p doc.
/// @return The number of paths that were actually removed.
auto strip_paths(Document& doc, std::span<const AccessorPath> paths) -> std::size_t;

}  // namespace diffjson_cpp
