/// @file path.hpp
/// @brief Accessor paths: the bracketed mini-language addressing locations
/// inside nested documents, e.g. `root['config']['items'][0]`.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace diffjson_cpp {

/// A path element: either an object key or an array index.
///
/// A string key only ever addresses an object; an index only ever
/// addresses an array.
using PathSegment = std::variant<std::string, std::int64_t>;

/// A path into the document tree, root to leaf. Empty denotes the root.
using AccessorPath = std::vector<PathSegment>;

/// The sentinel word that may precede the first bracket of an accessor.
inline constexpr std::string_view root_marker = "root";

/// Remove a leading `root` sentinel from an accessor string, if present.
auto strip_root(std::string_view accessor) -> std::string_view;

/// Parse an accessor string such as `['key'][0]` into {"key", 0}.
///
/// Each `[...]` group is tried as a base-10 integer first, otherwise it is
/// a string key with surrounding quote characters removed. Text outside
/// brackets is ignored and malformed groups are skipped; parsing never
/// fails. A leading `root` sentinel is stripped.
auto parse_accessor(std::string_view accessor) -> AccessorPath;

/// Serialize a path back into bracketed form.
///
/// String keys are quoted with `'`, or with `"` when the key contains a
/// single quote; indices are bare.
/// @param with_root Prefix the result with the `root` sentinel.
auto to_accessor(const AccessorPath& path, bool with_root = false) -> std::string;

/// Render a single segment in bracketed form, e.g. `['key']` or `[3]`.
auto to_accessor(const PathSegment& segment) -> std::string;

/// The unquoted text of a segment: `key` or `3`.
auto segment_to_string(const PathSegment& segment) -> std::string;

/// Append a segment to a copy of @p path.
auto child_path(const AccessorPath& path, PathSegment segment) -> AccessorPath;

}  // namespace diffjson_cpp
