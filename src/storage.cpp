#include "storage.hpp"
#include "errors.hpp"
#include "paths.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

std::unique_ptr<std::istream> LocalFileStore::open_read(const std::string& path) {
    auto in = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!*in)
        throw StorageError("cannot open for reading: " + path);
    return in;
}

std::unique_ptr<std::ostream> LocalFileStore::open_write(const std::string& path) {
    std::string parent = parent_path(path);
    if (!parent.empty())
        make_dirs(parent);
    auto out = std::make_unique<std::ofstream>(path, std::ios::binary | std::ios::trunc);
    if (!*out)
        throw StorageError("cannot open for writing: " + path);
    return out;
}

bool LocalFileStore::exists(const std::string& path) const {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool LocalFileStore::is_file(const std::string& path) const {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool LocalFileStore::is_directory(const std::string& path) const {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

void LocalFileStore::remove(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec)
        throw StorageError("cannot remove " + path + ": " + ec.message());
}

void LocalFileStore::make_dirs(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec)
        throw StorageError("cannot create directory " + path + ": " + ec.message());
}

std::vector<std::string> LocalFileStore::find(const std::string& directory) const {
    std::vector<std::string> files;
    std::error_code ec;
    if (!fs::is_directory(directory, ec))
        return files;

    std::string base = normalize_path(directory);
    // unreadable subdirectories are left out rather than failing the walk
    const auto options = fs::directory_options::skip_permission_denied;
    for (auto it = fs::recursive_directory_iterator(directory, options, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec)) continue;
        files.push_back(join_path(base, it->path().lexically_relative(directory).generic_string()));
    }
    if (ec)
        throw StorageError("cannot list " + directory + ": " + ec.message());
    std::sort(files.begin(), files.end());
    return files;
}

std::shared_ptr<FileStore> default_store() {
    static auto store = std::make_shared<LocalFileStore>();
    return store;
}
