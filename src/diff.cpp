#include <diffjson-cpp/diff.hpp>
#include <diffjson-cpp/path.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace diffjson_cpp {

auto ChangeSet::empty() const -> bool {
    return size() == 0;
}

auto ChangeSet::size() const -> std::size_t {
    return dictionary_item_added.size() + dictionary_item_removed.size() +
           iterable_item_added.size() + iterable_item_removed.size() +
           values_changed.size() + iterable_item_moved.size();
}

namespace {

/// Value kinds as the comparison sees them: all numbers are one kind.
enum class Kind : std::uint8_t { null, boolean, number, string, array, object };

auto kind_of(const Document& v) -> Kind {
    switch (v.type()) {
        case Document::value_t::null:            return Kind::null;
        case Document::value_t::boolean:         return Kind::boolean;
        case Document::value_t::number_integer:
        case Document::value_t::number_unsigned:
        case Document::value_t::number_float:    return Kind::number;
        case Document::value_t::string:          return Kind::string;
        case Document::value_t::array:           return Kind::array;
        case Document::value_t::object:          return Kind::object;
        default:                                 return Kind::null;
    }
}

auto is_container(Kind k) -> bool {
    return k == Kind::array || k == Kind::object;
}

auto mix(std::size_t h) -> std::size_t {
    // splitmix64 finalizer
    auto x = static_cast<std::uint64_t>(h);
    x ^= x >> 30;
    x *= 0xbf58476d1ce4e5b9ULL;
    x ^= x >> 27;
    x *= 0x94d049bb133111ebULL;
    x ^= x >> 31;
    return static_cast<std::size_t>(x);
}

auto combine(std::size_t seed, std::size_t h) -> std::size_t {
    return seed ^ (h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

/// Hash consistent with structurally_equal(): object key order never
/// contributes, array order only when @p ignore_order is false.
auto structural_hash(const Document& v, bool ignore_order) -> std::size_t {
    auto kind = kind_of(v);
    auto seed = mix(static_cast<std::size_t>(kind) + 1);
    switch (kind) {
        case Kind::null:
            return seed;
        case Kind::boolean:
            return combine(seed, v.get<bool>() ? 1u : 2u);
        case Kind::number:
            return combine(seed, std::hash<double>{}(v.get<double>()));
        case Kind::string:
            return combine(seed, std::hash<std::string_view>{}(v.get_ref<const std::string&>()));
        case Kind::array: {
            auto acc = std::size_t{0};
            for (const auto& item : v) {
                auto h = structural_hash(item, ignore_order);
                acc = ignore_order ? acc + mix(h) : combine(acc, h);
            }
            return combine(seed, acc);
        }
        case Kind::object: {
            auto acc = std::size_t{0};
            for (const auto& [key, item] : v.items()) {
                auto h = combine(std::hash<std::string_view>{}(key),
                                 structural_hash(item, ignore_order));
                acc += mix(h);
            }
            return combine(seed, acc);
        }
    }
    return seed;
}

/// Match every element of @p b with an equal, unused element of @p a.
/// @return For each index of b, the matched index in a or -1.
auto match_elements(const Document& a, const Document& b, bool ignore_order)
    -> std::vector<std::ptrdiff_t> {
    auto buckets = std::unordered_map<std::size_t, std::vector<std::size_t>>{};
    for (std::size_t i = 0; i < a.size(); ++i) {
        buckets[structural_hash(a[i], ignore_order)].push_back(i);
    }

    auto matches = std::vector<std::ptrdiff_t>(b.size(), -1);
    for (std::size_t j = 0; j < b.size(); ++j) {
        auto it = buckets.find(structural_hash(b[j], ignore_order));
        if (it == buckets.end()) continue;
        auto& candidates = it->second;
        for (auto c = candidates.begin(); c != candidates.end(); ++c) {
            if (structurally_equal(a[*c], b[j], ignore_order)) {
                matches[j] = static_cast<std::ptrdiff_t>(*c);
                candidates.erase(c);
                break;
            }
        }
    }
    return matches;
}

/// A location under comparison, as an accessor string and as segments.
struct Location {
    std::string accessor;
    AccessorPath path;

    auto child(PathSegment segment) const -> Location {
        auto text = accessor + to_accessor(segment);
        return Location{std::move(text), child_path(path, std::move(segment))};
    }

    auto key(const std::string& k) const -> Location { return child(PathSegment{k}); }

    auto index(std::size_t i) const -> Location {
        return child(PathSegment{static_cast<std::int64_t>(i)});
    }
};

class DiffEngine {
public:
    explicit DiffEngine(const DiffOptions& options) : options_{options} {}

    void compare(const Document& a, const Document& b, const Location& at) {
        auto ka = kind_of(a);
        auto kb = kind_of(b);
        if (ka != kb) {
            changes_.values_changed.push_back(ValueChange{at.accessor, at.path, a, b});
            return;
        }
        switch (ka) {
            case Kind::object:
                compare_objects(a, b, at);
                break;
            case Kind::array:
                if (options_.ignore_order) {
                    compare_arrays_unordered(a, b, at);
                } else {
                    compare_arrays_ordered(a, b, at);
                }
                break;
            default:
                if (a != b) {
                    changes_.values_changed.push_back(ValueChange{at.accessor, at.path, a, b});
                }
                break;
        }
    }

    auto take() -> ChangeSet { return std::move(changes_); }

private:
    static void record(std::vector<ItemChange>& bucket, Location at, const Document& value) {
        bucket.push_back(ItemChange{std::move(at.accessor), std::move(at.path), value});
    }

    void compare_objects(const Document& a, const Document& b, const Location& at) {
        for (const auto& [key, value] : a.items()) {
            auto it = b.find(key);
            if (it == b.end()) {
                record(changes_.dictionary_item_removed, at.key(key), value);
            } else {
                compare(value, *it, at.key(key));
            }
        }
        for (const auto& [key, value] : b.items()) {
            if (!a.contains(key)) {
                record(changes_.dictionary_item_added, at.key(key), value);
            }
        }
    }

    void compare_arrays_ordered(const Document& a, const Document& b, const Location& at) {
        auto common = std::min(a.size(), b.size());
        for (std::size_t i = 0; i < common; ++i) {
            compare(a[i], b[i], at.index(i));
        }
        for (std::size_t i = common; i < a.size(); ++i) {
            record(changes_.iterable_item_removed, at.index(i), a[i]);
        }
        for (std::size_t i = common; i < b.size(); ++i) {
            record(changes_.iterable_item_added, at.index(i), b[i]);
        }
    }

    void compare_arrays_unordered(const Document& a, const Document& b, const Location& at) {
        auto matches = match_elements(a, b, true);

        auto used = std::vector<bool>(a.size(), false);
        auto unmatched_b = std::vector<std::size_t>{};
        for (std::size_t j = 0; j < b.size(); ++j) {
            if (matches[j] < 0) {
                unmatched_b.push_back(j);
                continue;
            }
            auto i = static_cast<std::size_t>(matches[j]);
            used[i] = true;
            if (options_.report_moves && i != j) {
                spdlog::trace("{}: item {} moved to {}", at.accessor, i, j);
                record(changes_.iterable_item_moved, at.index(j), b[j]);
            }
        }
        auto unmatched_a = std::vector<std::size_t>{};
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (!used[i]) unmatched_a.push_back(i);
        }

        // Pair leftovers positionally when both sides are containers of the
        // same kind; everything else is a plain removal or addition.
        auto paired_b = std::vector<bool>(unmatched_b.size(), false);
        auto next_b = std::size_t{0};
        for (auto i : unmatched_a) {
            auto ka = kind_of(a[i]);
            if (is_container(ka) && next_b < unmatched_b.size() &&
                kind_of(b[unmatched_b[next_b]]) == ka) {
                compare(a[i], b[unmatched_b[next_b]], at.index(i));
                paired_b[next_b] = true;
                ++next_b;
            } else {
                record(changes_.iterable_item_removed, at.index(i), a[i]);
            }
        }
        for (std::size_t k = 0; k < unmatched_b.size(); ++k) {
            if (paired_b[k]) continue;
            auto j = unmatched_b[k];
            record(changes_.iterable_item_added, at.index(j), b[j]);
        }
    }

    DiffOptions options_;
    ChangeSet changes_;
};

}  // anonymous namespace

auto structurally_equal(const Document& a, const Document& b, bool ignore_order) -> bool {
    auto ka = kind_of(a);
    if (ka != kind_of(b)) return false;

    switch (ka) {
        case Kind::object: {
            if (a.size() != b.size()) return false;
            for (const auto& [key, value] : a.items()) {
                auto it = b.find(key);
                if (it == b.end() || !structurally_equal(value, *it, ignore_order)) return false;
            }
            return true;
        }
        case Kind::array: {
            if (a.size() != b.size()) return false;
            if (!ignore_order) {
                for (std::size_t i = 0; i < a.size(); ++i) {
                    if (!structurally_equal(a[i], b[i], false)) return false;
                }
                return true;
            }
            auto matches = match_elements(a, b, true);
            for (auto m : matches) {
                if (m < 0) return false;
            }
            return true;
        }
        default:
            return a == b;
    }
}

auto diff(const Document& old_doc, const Document& new_doc,
          const DiffOptions& options) -> ChangeSet {
    auto engine = DiffEngine{options};
    engine.compare(old_doc, new_doc, Location{std::string{root_marker}, {}});
    return engine.take();
}

}  // namespace diffjson_cpp
