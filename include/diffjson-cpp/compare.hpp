/// @file compare.hpp
/// @brief Comparing document pairs: single files or two directories of
/// same-named documents, with pass/fail aggregation and console reporting.

#pragma once

#include <diffjson-cpp/color.hpp>
#include <diffjson-cpp/diff.hpp>
#include <diffjson-cpp/document.hpp>
#include <diffjson-cpp/error.hpp>
#include <diffjson-cpp/path.hpp>
#include <diffjson-cpp/report.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace diffjson_cpp {

/// File name suffix of the documents considered in directory mode.
inline constexpr std::string_view document_extension = ".json";

/// Environment variable holding whitespace-separated ignore paths.
inline constexpr const char* ignore_env_var = "DIFFJSON_IGNORE";

/// The result category of comparing one pair of documents.
enum class Outcome : std::uint8_t {
    ok,          ///< No differences once ignored fields are removed.
    bad,         ///< Differences found.
    file_error,  ///< One of the documents could not be loaded.
};

/// Convert an Outcome to its string representation.
constexpr auto to_string_view(Outcome outcome) noexcept -> std::string_view {
    switch (outcome) {
        case Outcome::ok:         return "OK";
        case Outcome::bad:        return "BAD";
        case Outcome::file_error: return "FILE_ERROR";
    }
    return "unknown";
}

/// Everything a comparison run needs to know.
struct CompareOptions {
    std::filesystem::path path1;                     ///< Old file or directory.
    std::filesystem::path path2;                     ///< New file or directory.
    std::vector<std::string> ignore_fields;          ///< Accessor strings removed before diffing.
    std::size_t truncate_items{default_max_items};   ///< 0 means no truncation.
    bool verbose{false};                             ///< Print the report of BAD pairs.
    bool recursive{false};                           ///< Descend into subdirectories.
    bool report_moves{false};                        ///< Report reordered array items.
    ReportLayout layout{ReportLayout::nested};
    ColorMode color{ColorMode::automatic};
};

/// The result of comparing one pair of documents.
struct PairResult {
    Outcome outcome{Outcome::ok};
    std::size_t change_count{0};   ///< Flattened records before truncation.
    std::string report;            ///< Rendered report; empty unless bad.
    std::optional<Error> error;    ///< Why loading failed, for file_error.
};

/// Compare two already-loaded documents.
///
/// Every path in @p ignore is deleted from both documents first, so a
/// field ignored on one side cannot show up as an addition or removal.
auto compare_documents(Document old_doc, Document new_doc,
                       std::span<const AccessorPath> ignore,
                       const CompareOptions& options,
                       const RenderOptions& render = {}) -> PairResult;

/// Load and compare the documents at @p old_path and @p new_path.
/// A document that fails to load makes the outcome file_error.
auto compare_pair(const std::filesystem::path& old_path,
                  const std::filesystem::path& new_path,
                  const CompareOptions& options,
                  const RenderOptions& render = {}) -> PairResult;

/// One pair of documents to compare.
struct DocumentPair {
    std::filesystem::path old_path;
    std::filesystem::path new_path;

    auto operator==(const DocumentPair&) const -> bool = default;
};

/// What to compare, and what cannot be compared.
struct PairListing {
    std::vector<std::string> missing;  ///< Only in the old directory.
    std::vector<std::string> extra;    ///< Only in the new directory.
    std::vector<DocumentPair> pairs;   ///< Present in both, sorted by name.
};

/// Decide which documents to compare.
///
/// Two directories pair their `*.json` files by name (relative path when
/// @p recursive). Two files form a single pair. Anything else, including a
/// path that does not exist, is an invalid_invocation Error.
auto list_pairs(const std::filesystem::path& path1, const std::filesystem::path& path2,
                bool recursive = false) -> std::variant<PairListing, Error>;

/// Union of the command-line ignore fields and the whitespace-separated
/// @p env_value, without duplicates, in sorted order.
auto merge_ignore_fields(std::span<const std::string> cli_fields,
                         std::string_view env_value) -> std::vector<std::string>;

/// Totals of a comparison run.
struct RunSummary {
    std::size_t identical{0};
    std::size_t different{0};
    std::size_t errors{0};
    std::size_t missing{0};
    std::size_t extra{0};
    bool invalid_invocation{false};

    /// 0 when everything compared identical and nothing was missing or
    /// extra, 1 otherwise.
    auto exit_status() const -> int;
};

/// Compare everything @p options names and report it.
///
/// Identical pairs are reported on @p out; differences, load errors,
/// missing and extra files and verbose reports on @p err.
auto run(const CompareOptions& options, std::ostream& out, std::ostream& err) -> RunSummary;

}  // namespace diffjson_cpp
