/// @file document.hpp
/// @brief The Document tree value and document loading.

#pragma once

#include <diffjson-cpp/error.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string_view>
#include <variant>

namespace diffjson_cpp {

/// A dynamically-typed tree value: object, array, string, number,
/// boolean or null.
///
/// Objects keep their keys in insertion order so that reports list
/// fields the way the source document does. Its operator== is therefore
/// key-order sensitive; use structurally_equal() (diff.hpp) to compare.
using Document = nlohmann::ordered_json;

/// Either a loaded document or the reason it could not be loaded.
using LoadResult = std::variant<Document, Error>;

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const Document& doc) { use(doc); },
///     [](const Error& e) { report(e.message); },
/// }, load_document(path));
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

/// Parse a JSON document from text.
/// @return The document, or an Error of kind parse_error.
auto parse_document(std::string_view text) -> LoadResult;

/// Read and parse the JSON document stored at @p path.
///
/// A missing path yields file_not_found, an unreadable file read_error,
/// and malformed content parse_error. Never throws.
auto load_document(const std::filesystem::path& path) -> LoadResult;

/// Check if a LoadResult holds a document.
inline auto is_loaded(const LoadResult& r) -> bool {
    return std::holds_alternative<Document>(r);
}

}  // namespace diffjson_cpp
