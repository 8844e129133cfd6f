#include <diffjson-cpp/compare.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace diffjson_cpp;

namespace {

auto doc(const char* text) -> Document {
    return Document::parse(text);
}

auto plain_options() -> CompareOptions {
    auto options = CompareOptions{};
    options.color = ColorMode::never;
    return options;
}

class CompareDirs : public ::testing::Test {
protected:
    void SetUp() override {
        base_ = std::filesystem::temp_directory_path() /
                ("diffjson_compare_test_" +
                 std::string{::testing::UnitTest::GetInstance()->current_test_info()->name()});
        std::filesystem::remove_all(base_);
        std::filesystem::create_directories(base_ / "old");
        std::filesystem::create_directories(base_ / "new");
    }

    void TearDown() override { std::filesystem::remove_all(base_); }

    void write(const std::string& side, const std::string& name, const std::string& text) {
        auto path = base_ / side / name;
        std::filesystem::create_directories(path.parent_path());
        auto out = std::ofstream{path, std::ios::binary};
        out << text;
    }

    auto old_dir() const -> std::filesystem::path { return base_ / "old"; }
    auto new_dir() const -> std::filesystem::path { return base_ / "new"; }

    std::filesystem::path base_;
};

}  // namespace

// -- compare_documents --------------------------------------------------------

TEST(CompareDocuments, equal_documents_are_ok) {
    const auto result = compare_documents(doc(R"({"a": [1, 2]})"), doc(R"({"a": [2, 1]})"),
                                          {}, plain_options());
    EXPECT_EQ(result.outcome, Outcome::ok);
    EXPECT_EQ(result.change_count, 0u);
    EXPECT_TRUE(result.report.empty());
}

TEST(CompareDocuments, difference_is_bad_with_report) {
    const auto result = compare_documents(doc(R"({"a": 1, "ts": 100})"),
                                          doc(R"({"a": 1, "ts": 200})"), {}, plain_options());
    EXPECT_EQ(result.outcome, Outcome::bad);
    EXPECT_EQ(result.change_count, 2u);
    EXPECT_EQ(result.report, "  [ts]\n"
                             "-     100\n"
                             "+     200");
}

TEST(CompareDocuments, ignored_field_hides_the_difference) {
    const auto ignore = std::vector<AccessorPath>{parse_accessor("root['ts']")};
    const auto result = compare_documents(doc(R"({"a": 1, "ts": 100})"),
                                          doc(R"({"a": 1, "ts": 200})"), ignore, plain_options());
    EXPECT_EQ(result.outcome, Outcome::ok);
}

TEST(CompareDocuments, field_ignored_on_one_side_only_is_not_reported) {
    const auto ignore = std::vector<AccessorPath>{parse_accessor("['meta']['run_id']")};
    const auto result = compare_documents(doc(R"({"meta": {"run_id": 7}})"),
                                          doc(R"({"meta": {}})"), ignore, plain_options());
    EXPECT_EQ(result.outcome, Outcome::ok);
}

TEST(CompareDocuments, truncation_keeps_the_full_count) {
    auto options = plain_options();
    options.truncate_items = 1;
    const auto result = compare_documents(doc(R"({"a": 1, "b": 2})"), doc(R"({"a": 3, "b": 4})"),
                                          {}, options);
    EXPECT_EQ(result.change_count, 4u);
    EXPECT_EQ(result.report, "  [a]\n"
                             "-     1\n"
                             "...(3 more items)");
}

TEST(CompareDocuments, flat_layout) {
    auto options = plain_options();
    options.layout = ReportLayout::flat;
    const auto result = compare_documents(doc(R"({"x": {"y": 1}})"), doc(R"({"x": {"y": 2}})"),
                                          {}, options);
    EXPECT_EQ(result.report, "- ['x']['y']: 1\n"
                             "+ ['x']['y']: 2");
}

TEST(CompareDocuments, moves_only_when_requested) {
    auto options = plain_options();
    EXPECT_EQ(compare_documents(doc(R"(["a", "b"])"), doc(R"(["b", "a"])"), {}, options).outcome,
              Outcome::ok);

    options.report_moves = true;
    const auto result = compare_documents(doc(R"(["a", "b"])"), doc(R"(["b", "a"])"), {}, options);
    EXPECT_EQ(result.outcome, Outcome::bad);
    EXPECT_NE(result.report.find("\"Moved location in list.\""), std::string::npos);
}

// -- compare_pair -------------------------------------------------------------

TEST_F(CompareDirs, compare_pair_loads_and_ignores) {
    write("old", "a.json", R"({"id": 1, "ts": 100})");
    write("new", "a.json", R"({"ts": 200, "id": 1})");

    auto options = plain_options();
    EXPECT_EQ(compare_pair(old_dir() / "a.json", new_dir() / "a.json", options).outcome,
              Outcome::bad);

    options.ignore_fields = {"['ts']"};
    EXPECT_EQ(compare_pair(old_dir() / "a.json", new_dir() / "a.json", options).outcome,
              Outcome::ok);
}

TEST_F(CompareDirs, compare_pair_reports_unreadable_document) {
    write("old", "a.json", R"({"id": 1})");
    write("new", "a.json", R"({"id": )");

    const auto result = compare_pair(old_dir() / "a.json", new_dir() / "a.json", plain_options());
    EXPECT_EQ(result.outcome, Outcome::file_error);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ErrorKind::parse_error);
}

TEST_F(CompareDirs, overflowing_number_is_a_file_error) {
    write("old", "a.json", R"({"x": 1})");
    write("new", "a.json", R"({"x": 1e999})");

    const auto result = compare_pair(old_dir() / "a.json", new_dir() / "a.json", plain_options());
    EXPECT_EQ(result.outcome, Outcome::file_error);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ErrorKind::parse_error);
}

TEST_F(CompareDirs, run_continues_past_an_overflowing_number) {
    write("old", "a.json", R"({"x": 1e999})");
    write("old", "b.json", R"({"y": 1})");
    write("new", "a.json", R"({"x": 1})");
    write("new", "b.json", R"({"y": 1})");

    auto options = plain_options();
    options.path1 = old_dir();
    options.path2 = new_dir();

    auto out = std::ostringstream{};
    auto err = std::ostringstream{};
    const auto summary = run(options, out, err);
    EXPECT_EQ(summary.errors, 1u);
    EXPECT_EQ(summary.identical, 1u);
    EXPECT_EQ(summary.exit_status(), 1);
}

// -- list_pairs ---------------------------------------------------------------

TEST_F(CompareDirs, directories_pair_by_name) {
    write("old", "a.json", "{}");
    write("old", "b.json", "{}");
    write("old", "c.json", "{}");
    write("old", "notes.txt", "not json");
    write("old", ".hidden.json", "{}");
    write("new", "b.json", "{}");
    write("new", "c.json", "{}");
    write("new", "d.json", "{}");

    const auto listed = list_pairs(old_dir(), new_dir());
    ASSERT_TRUE(std::holds_alternative<PairListing>(listed));
    const auto& listing = std::get<PairListing>(listed);

    EXPECT_EQ(listing.missing, (std::vector<std::string>{"a.json"}));
    EXPECT_EQ(listing.extra, (std::vector<std::string>{"d.json"}));
    EXPECT_EQ(listing.pairs, (std::vector<DocumentPair>{
                                 {old_dir() / "b.json", new_dir() / "b.json"},
                                 {old_dir() / "c.json", new_dir() / "c.json"},
                             }));
}

TEST_F(CompareDirs, subdirectories_only_when_recursive) {
    write("old", "top.json", "{}");
    write("old", "sub/inner.json", "{}");
    write("new", "top.json", "{}");
    write("new", "sub/inner.json", "{}");

    const auto flat = std::get<PairListing>(list_pairs(old_dir(), new_dir()));
    EXPECT_EQ(flat.pairs.size(), 1u);

    const auto deep = std::get<PairListing>(list_pairs(old_dir(), new_dir(), true));
    ASSERT_EQ(deep.pairs.size(), 2u);
    EXPECT_EQ(deep.pairs[0].old_path, old_dir() / "sub/inner.json");
    EXPECT_EQ(deep.pairs[1].old_path, old_dir() / "top.json");
}

TEST_F(CompareDirs, two_files_form_one_pair) {
    write("old", "x.json", "{}");
    write("new", "y.json", "{}");

    const auto listed = list_pairs(old_dir() / "x.json", new_dir() / "y.json");
    ASSERT_TRUE(std::holds_alternative<PairListing>(listed));
    const auto& listing = std::get<PairListing>(listed);
    ASSERT_EQ(listing.pairs.size(), 1u);
    EXPECT_TRUE(listing.missing.empty());
    EXPECT_TRUE(listing.extra.empty());
}

TEST_F(CompareDirs, file_and_directory_is_invalid) {
    write("old", "x.json", "{}");

    const auto listed = list_pairs(old_dir() / "x.json", new_dir());
    ASSERT_TRUE(std::holds_alternative<Error>(listed));
    EXPECT_EQ(std::get<Error>(listed).kind, ErrorKind::invalid_invocation);
    EXPECT_EQ(std::get<Error>(listed).message,
              "Both arguments must be files or both must be directories.");
}

TEST_F(CompareDirs, missing_path_is_invalid) {
    const auto absent = base_ / "absent";
    const auto listed = list_pairs(absent, new_dir());
    ASSERT_TRUE(std::holds_alternative<Error>(listed));
    EXPECT_EQ(std::get<Error>(listed).message, "Path does not exist: " + absent.string());
}

// -- merge_ignore_fields ------------------------------------------------------

TEST(MergeIgnoreFields, union_without_duplicates_in_sorted_order) {
    const auto cli = std::vector<std::string>{"['b']", "['a']"};
    EXPECT_EQ(merge_ignore_fields(cli, "  ['a'] \n\t['c']  "),
              (std::vector<std::string>{"['a']", "['b']", "['c']"}));
}

TEST(MergeIgnoreFields, empty_inputs) {
    EXPECT_TRUE(merge_ignore_fields({}, "").empty());
    EXPECT_EQ(merge_ignore_fields({}, "['x']"), (std::vector<std::string>{"['x']"}));
}

// -- run ----------------------------------------------------------------------

TEST(RunSummary, exit_status) {
    EXPECT_EQ(RunSummary{}.exit_status(), 0);
    EXPECT_EQ((RunSummary{.identical = 3}).exit_status(), 0);
    EXPECT_EQ((RunSummary{.identical = 3, .different = 1}).exit_status(), 1);
    EXPECT_EQ((RunSummary{.errors = 1}).exit_status(), 1);
    EXPECT_EQ((RunSummary{.missing = 1}).exit_status(), 1);
    EXPECT_EQ((RunSummary{.extra = 1}).exit_status(), 1);
    EXPECT_EQ((RunSummary{.invalid_invocation = true}).exit_status(), 1);
}

TEST_F(CompareDirs, run_reports_every_pair) {
    write("old", "a.json", "{}");
    write("old", "same.json", R"({"k": [1, 2]})");
    write("old", "changed.json", R"({"ts": 100})");
    write("old", "broken.json", "{}");
    write("new", "same.json", R"({"k": [2, 1]})");
    write("new", "changed.json", R"({"ts": 200})");
    write("new", "broken.json", "{");
    write("new", "d.json", "{}");

    auto options = plain_options();
    options.path1 = old_dir();
    options.path2 = new_dir();

    auto out = std::ostringstream{};
    auto err = std::ostringstream{};
    const auto summary = run(options, out, err);

    EXPECT_EQ(summary.identical, 1u);
    EXPECT_EQ(summary.different, 1u);
    EXPECT_EQ(summary.errors, 1u);
    EXPECT_EQ(summary.missing, 1u);
    EXPECT_EQ(summary.extra, 1u);
    EXPECT_EQ(summary.exit_status(), 1);

    EXPECT_NE(out.str().find("✅ [IDENTICAL] " + (old_dir() / "same.json").string()),
              std::string::npos);
    EXPECT_NE(err.str().find("❌ [DIFF] " + (old_dir() / "changed.json").string()),
              std::string::npos);
    EXPECT_NE(err.str().find("❌ [ERROR] reading or parsing " +
                             (old_dir() / "broken.json").string()),
              std::string::npos);
    EXPECT_NE(err.str().find("❌ [MISS]  a.json\n"), std::string::npos);
    EXPECT_NE(err.str().find("❌ [NEW ]  d.json\n"), std::string::npos);
    EXPECT_EQ(err.str().find("[details]"), std::string::npos);
}

TEST_F(CompareDirs, run_verbose_prints_details) {
    write("old", "changed.json", R"({"ts": 100})");
    write("new", "changed.json", R"({"ts": 200})");

    auto options = plain_options();
    options.path1 = old_dir();
    options.path2 = new_dir();
    options.verbose = true;

    auto out = std::ostringstream{};
    auto err = std::ostringstream{};
    run(options, out, err);

    EXPECT_NE(err.str().find("\n\n[details]      [ts]\n"
                             "[details]    -     100\n"
                             "[details]    +     200\n"
                             "[details]    \n"),
              std::string::npos)
        << err.str();
}

TEST_F(CompareDirs, run_succeeds_when_everything_is_identical) {
    write("old", "a.json", R"({"x": 1, "y": 2})");
    write("new", "a.json", R"({"y": 2, "x": 1.0})");

    auto options = plain_options();
    options.path1 = old_dir();
    options.path2 = new_dir();

    auto out = std::ostringstream{};
    auto err = std::ostringstream{};
    const auto summary = run(options, out, err);
    EXPECT_EQ(summary.exit_status(), 0);
    EXPECT_TRUE(err.str().empty());
}

TEST_F(CompareDirs, run_ignore_turns_bad_into_ok) {
    write("old", "a.json", R"({"id": 1, "meta": {"ts": 1}})");
    write("new", "a.json", R"({"id": 1, "meta": {"ts": 2}})");

    auto options = plain_options();
    options.path1 = old_dir() / "a.json";
    options.path2 = new_dir() / "a.json";

    auto out = std::ostringstream{};
    auto err = std::ostringstream{};
    EXPECT_EQ(run(options, out, err).exit_status(), 1);

    options.ignore_fields = {"root['meta']['ts']"};
    EXPECT_EQ(run(options, out, err).exit_status(), 0);
}

TEST_F(CompareDirs, run_rejects_mismatched_arguments) {
    write("old", "a.json", "{}");

    auto options = plain_options();
    options.path1 = old_dir() / "a.json";
    options.path2 = new_dir();

    auto out = std::ostringstream{};
    auto err = std::ostringstream{};
    const auto summary = run(options, out, err);
    EXPECT_TRUE(summary.invalid_invocation);
    EXPECT_EQ(summary.exit_status(), 1);
    EXPECT_EQ(err.str(), "Error: Both arguments must be files or both must be directories.\n");
}
