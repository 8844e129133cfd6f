#include <diffjson-cpp/compare.hpp>
#include <diffjson-cpp/tree_editor.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>
#include <iterator>
#include <set>
#include <sstream>
#include <system_error>

namespace diffjson_cpp {

// -- Single pair --------------------------------------------------------------

auto compare_documents(Document old_doc, Document new_doc,
                       std::span<const AccessorPath> ignore,
                       const CompareOptions& options,
                       const RenderOptions& render) -> PairResult {
    for (const auto& path : ignore) {
        auto removed_old = delete_path(old_doc, path);
        auto removed_new = delete_path(new_doc, path);
        spdlog::debug("ignore {}: old {}, new {}", to_accessor(path, true),
                      removed_old ? "removed" : "absent",
                      removed_new ? "removed" : "absent");
    }

    auto changes = diff(old_doc, new_doc,
                        DiffOptions{.ignore_order = true, .report_moves = options.report_moves});
    if (changes.empty()) {
        return PairResult{};
    }

    auto flat = flatten(changes, 0);
    auto result = PairResult{};
    result.outcome = Outcome::bad;
    result.change_count = flat.entries.size();
    truncate(flat, options.truncate_items);

    if (options.layout == ReportLayout::flat) {
        result.report = render_flat(flat.entries, render, flat.truncation_note);
    } else {
        result.report = render_nested(nest(flat.entries, render.length_limit), render,
                                      flat.truncation_note);
    }
    return result;
}

auto compare_pair(const std::filesystem::path& old_path,
                  const std::filesystem::path& new_path,
                  const CompareOptions& options,
                  const RenderOptions& render) -> PairResult {
    spdlog::debug("comparing {} <-> {}", old_path.string(), new_path.string());

    auto old_doc = load_document(old_path);
    auto new_doc = load_document(new_path);
    for (auto* loaded : {&old_doc, &new_doc}) {
        if (const auto* err = std::get_if<Error>(loaded)) {
            spdlog::warn("{}: {}", to_string_view(err->kind), err->message);
            auto result = PairResult{};
            result.outcome = Outcome::file_error;
            result.error = *err;
            return result;
        }
    }

    auto ignore = std::vector<AccessorPath>{};
    ignore.reserve(options.ignore_fields.size());
    for (const auto& field : options.ignore_fields) {
        ignore.push_back(parse_accessor(field));
    }

    auto result = compare_documents(std::get<Document>(std::move(old_doc)),
                                    std::get<Document>(std::move(new_doc)),
                                    ignore, options, render);
    if (result.outcome == Outcome::bad) {
        spdlog::info("{}: {} difference(s)", new_path.string(), result.change_count);
    }
    return result;
}

// -- Pair listing -------------------------------------------------------------

namespace {

auto is_document(const std::filesystem::directory_entry& entry) -> bool {
    auto ec = std::error_code{};
    if (!entry.is_regular_file(ec)) return false;
    auto name = entry.path().filename().string();
    return !name.starts_with('.') && name.size() > document_extension.size() &&
           name.ends_with(document_extension);
}

auto collect_documents(const std::filesystem::path& dir, bool recursive) -> std::set<std::string> {
    auto names = std::set<std::string>{};
    auto ec = std::error_code{};
    if (recursive) {
        auto it = std::filesystem::recursive_directory_iterator{
            dir, std::filesystem::directory_options::skip_permission_denied, ec};
        for (; !ec && it != std::filesystem::recursive_directory_iterator{}; it.increment(ec)) {
            if (is_document(*it)) {
                names.insert(it->path().lexically_relative(dir).generic_string());
            }
        }
    } else {
        auto it = std::filesystem::directory_iterator{dir, ec};
        for (; !ec && it != std::filesystem::directory_iterator{}; it.increment(ec)) {
            if (is_document(*it)) {
                names.insert(it->path().filename().string());
            }
        }
    }
    if (ec) {
        spdlog::warn("listing {}: {}", dir.string(), ec.message());
    }
    return names;
}

}  // anonymous namespace

auto list_pairs(const std::filesystem::path& path1, const std::filesystem::path& path2,
                bool recursive) -> std::variant<PairListing, Error> {
    auto ec = std::error_code{};
    for (const auto* p : {&path1, &path2}) {
        if (!std::filesystem::exists(*p, ec)) {
            return Error{ErrorKind::invalid_invocation,
                         fmt::format("Path does not exist: {}", p->string())};
        }
    }

    auto listing = PairListing{};
    if (std::filesystem::is_directory(path1, ec) && std::filesystem::is_directory(path2, ec)) {
        auto old_names = collect_documents(path1, recursive);
        auto new_names = collect_documents(path2, recursive);
        std::set_difference(old_names.begin(), old_names.end(), new_names.begin(),
                            new_names.end(), std::back_inserter(listing.missing));
        std::set_difference(new_names.begin(), new_names.end(), old_names.begin(),
                            old_names.end(), std::back_inserter(listing.extra));
        auto common = std::vector<std::string>{};
        std::set_intersection(old_names.begin(), old_names.end(), new_names.begin(),
                              new_names.end(), std::back_inserter(common));
        for (const auto& name : common) {
            listing.pairs.push_back(DocumentPair{path1 / name, path2 / name});
        }
        spdlog::debug("{} pair(s), {} missing, {} extra", listing.pairs.size(),
                      listing.missing.size(), listing.extra.size());
    } else if (std::filesystem::is_regular_file(path1, ec) &&
               std::filesystem::is_regular_file(path2, ec)) {
        listing.pairs.push_back(DocumentPair{path1, path2});
    } else {
        return Error{ErrorKind::invalid_invocation,
                     "Both arguments must be files or both must be directories."};
    }
    return listing;
}

auto merge_ignore_fields(std::span<const std::string> cli_fields,
                         std::string_view env_value) -> std::vector<std::string> {
    auto fields = std::set<std::string>(cli_fields.begin(), cli_fields.end());
    auto stream = std::istringstream{std::string{env_value}};
    auto field = std::string{};
    while (stream >> field) {
        fields.insert(field);
    }
    return std::vector<std::string>(fields.begin(), fields.end());
}

// -- Run ----------------------------------------------------------------------

auto RunSummary::exit_status() const -> int {
    if (invalid_invocation) return 1;
    return (different + errors + missing + extra) == 0 ? 0 : 1;
}

namespace {

constexpr std::string_view details_prefix = "[details]    ";

void print_details(std::ostream& err, const std::string& report) {
    err << '\n';
    auto lines = std::istringstream{report};
    auto line = std::string{};
    while (std::getline(lines, line)) {
        err << details_prefix << line << '\n';
    }
    err << details_prefix << '\n';
}

}  // anonymous namespace

auto run(const CompareOptions& options, std::ostream& out, std::ostream& err) -> RunSummary {
    const auto color_out = resolve_color(options.color, stdout);
    const auto color_err = resolve_color(options.color, stderr);
    const auto render = RenderOptions{.color = color_err, .length_limit = default_preview_limit};

    auto summary = RunSummary{};
    auto listed = list_pairs(options.path1, options.path2, options.recursive);
    if (const auto* e = std::get_if<Error>(&listed)) {
        err << colorize(Color::red, "Error: " + e->message, color_err) << '\n';
        summary.invalid_invocation = true;
        return summary;
    }
    const auto& listing = std::get<PairListing>(listed);

    for (const auto& name : listing.missing) {
        err << colorize(Color::red, fmt::format("❌ [MISS]  {}", name), color_err) << '\n';
    }
    for (const auto& name : listing.extra) {
        err << colorize(Color::red, fmt::format("❌ [NEW ]  {}", name), color_err) << '\n';
    }
    summary.missing = listing.missing.size();
    summary.extra = listing.extra.size();

    for (const auto& [old_path, new_path] : listing.pairs) {
        auto result = compare_pair(old_path, new_path, options, render);
        switch (result.outcome) {
            case Outcome::ok:
                ++summary.identical;
                out << colorize(Color::green,
                                fmt::format("✅ [IDENTICAL] {:<40} <-> {}",
                                            old_path.string(), new_path.string()),
                                color_out)
                    << '\n';
                break;
            case Outcome::bad:
                ++summary.different;
                err << colorize(Color::red,
                                fmt::format("❌ [DIFF] {:<40} <-> {}",
                                            old_path.string(), new_path.string()),
                                color_err)
                    << '\n';
                if (options.verbose) {
                    print_details(err, result.report);
                }
                break;
            case Outcome::file_error:
                ++summary.errors;
                err << colorize(Color::red,
                                fmt::format("❌ [ERROR] reading or parsing {} or {}.",
                                            old_path.string(), new_path.string()),
                                color_err)
                    << '\n';
                break;
        }
    }
    out.flush();
    err.flush();

    spdlog::info("{} identical, {} different, {} unreadable, {} missing, {} extra",
                 summary.identical, summary.different, summary.errors, summary.missing,
                 summary.extra);
    return summary;
}

}  // namespace diffjson_cpp
