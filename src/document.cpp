#include <diffjson-cpp/document.hpp>

#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <system_error>

namespace diffjson_cpp {

auto parse_document(std::string_view text) -> LoadResult {
    try {
        return Document::parse(text.begin(), text.end());
    } catch (const nlohmann::json::exception& e) {
        // parse_error for syntax, out_of_range for numbers that overflow a double
        return Error{ErrorKind::parse_error, e.what()};
    }
}

auto load_document(const std::filesystem::path& path) -> LoadResult {
    auto ec = std::error_code{};
    if (!std::filesystem::exists(path, ec)) {
        return Error{ErrorKind::file_not_found, "no such file: " + path.string()};
    }
    if (std::filesystem::is_directory(path, ec)) {
        return Error{ErrorKind::read_error, "is a directory: " + path.string()};
    }

    auto in = std::ifstream{path, std::ios::binary};
    if (!in) {
        return Error{ErrorKind::read_error, "cannot open: " + path.string()};
    }
    auto buffer = std::ostringstream{};
    buffer << in.rdbuf();
    if (in.bad()) {
        return Error{ErrorKind::read_error, "failed reading: " + path.string()};
    }

    auto result = parse_document(buffer.str());
    if (auto* err = std::get_if<Error>(&result)) {
        err->message = path.string() + ": " + err->message;
    }
    return result;
}

}  // namespace diffjson_cpp
