#include <diffjson-cpp/tree_editor.hpp>

#include <cstddef>
#include <iterator>
#include <string>

namespace diffjson_cpp {

namespace {

/// One step of a walk. Returns nullptr when the segment does not apply.
template <typename Json>
auto step(Json& current, const PathSegment& segment) -> Json* {
    if (const auto* key = std::get_if<std::string>(&segment)) {
        if (!current.is_object()) return nullptr;
        auto it = current.find(*key);
        if (it == current.end()) return nullptr;
        return &*it;
    }
    auto index = std::get<std::int64_t>(segment);
    if (!current.is_array()) return nullptr;
    if (index < 0 || static_cast<std::size_t>(index) >= current.size()) return nullptr;
    return &current[static_cast<std::size_t>(index)];
}

template <typename Json>
auto walk(Json& doc, AccessorPath::const_iterator first,
          AccessorPath::const_iterator last) -> Json* {
    auto* current = &doc;
    for (auto it = first; it != last && current != nullptr; ++it) {
        current = step(*current, *it);
    }
    return current;
}

}  // anonymous namespace

auto get_path(const Document& doc, const AccessorPath& path) -> const Document* {
    return walk(doc, path.begin(), path.end());
}

auto get_path(Document& doc, const AccessorPath& path) -> Document* {
    return walk(doc, path.begin(), path.end());
}

auto delete_path(Document& doc, const AccessorPath& path) -> bool {
    if (path.empty()) return false;

    auto* parent = walk(doc, path.begin(), std::prev(path.end()));
    if (parent == nullptr) return false;

    const auto& last = path.back();
    if (const auto* key = std::get_if<std::string>(&last)) {
        if (!parent->is_object()) return false;
        return parent->erase(*key) == 1;
    }

    auto index = std::get<std::int64_t>(last);
    if (!parent->is_array()) return false;
    if (index < 0 || static_cast<std::size_t>(index) >= parent->size()) return false;
    parent->erase(static_cast<std::size_t>(index));
    return true;
}

auto strip_paths(Document& doc, std::span<const AccessorPath> paths) -> std::size_t {
    auto removed = std::size_t{0};
    for (const auto& path : paths) {
        if (delete_path(doc, path)) ++removed;
    }
    return removed;
}

}  // namespace diffjson_cpp
