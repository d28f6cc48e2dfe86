#include <confbind/file_index.hpp>
#include <confbind/log.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace confbind {

Result<FileIndex> index_directory(const fs::path& root) {
    FileIndex index;
    if (root.empty()) {
        return Result<FileIndex>::ok(std::move(index));
    }

    std::error_code ec;
    if (!fs::exists(root, ec)) {
        log::debug("config directory %s does not exist", root.string().c_str());
        return Result<FileIndex>::ok(std::move(index));
    }
    if (!fs::is_directory(root, ec)) {
        return BindError{BindError::IO,
            "config path is not a directory: " + root.string(),
            "pass the directory that holds one file per setting"};
    }

    std::vector<fs::path> files;
    fs::recursive_directory_iterator it(root, ec);
    if (ec) {
        return BindError{BindError::IO,
            "cannot read config directory " + root.string() + ": " + ec.message()};
    }
    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return BindError{BindError::IO,
                "error traversing config directory " + root.string() + ": " + ec.message()};
        }
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) continue;
        files.push_back(it->path());
    }
    if (ec) {
        return BindError{BindError::IO,
            "error traversing config directory " + root.string() + ": " + ec.message()};
    }

    std::sort(files.begin(), files.end());
    for (auto& path : files) {
        std::string name = path.filename().string();
        auto [pos, inserted] = index.emplace(name, path);
        if (!inserted) {
            log::warn("config file %s shadowed by %s",
                      path.string().c_str(), pos->second.string().c_str());
        }
    }

    log::debug("indexed %zu config files under %s", index.size(), root.string().c_str());
    return Result<FileIndex>::ok(std::move(index));
}

Result<std::string> read_file(const fs::path& path) {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (status.type() == fs::file_type::not_found) {
        return BindError{BindError::NotFound, "config file not found: " + path.string()};
    }
    if (status.type() == fs::file_type::none) {
        return BindError{BindError::SourceRead,
            "cannot stat config file " + path.string() + ": " + ec.message()};
    }
    if (!fs::is_regular_file(status)) {
        return BindError{BindError::SourceRead, "config path is not a regular file: " + path.string()};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return BindError{BindError::SourceRead, "cannot open config file: " + path.string()};
    }

    // peek tells an empty file apart from one whose first read fails
    if (file.peek() == std::ifstream::traits_type::eof()) {
        if (file.bad()) {
            return BindError{BindError::SourceRead, "error reading config file: " + path.string()};
        }
        return Result<std::string>::ok(std::string());
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad() || ss.fail()) {
        return BindError{BindError::SourceRead, "error reading config file: " + path.string()};
    }
    return Result<std::string>::ok(ss.str());
}

} // namespace confbind
