#include "manifest.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "patch.hpp"
#include "paths.hpp"
#include "sync.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <iostream>
#include <iterator>

using json = nlohmann::json;

namespace {

bool is_blank(const std::string& s) {
    for (unsigned char c : s)
        if (!std::isspace(c)) return false;
    return true;
}

std::string hash_file(FileStore& store, const std::string& path, const Settings& settings) {
    auto in = store.open_read(path);
    return hash_stream(*in, settings.hash_algorithm, settings.chunk_size);
}

bool recordable(const std::string& relative_path) {
    if (is_valid_utf8(relative_path))
        return true;
    std::cerr << "Skipping " << relative_path << ": name is not valid UTF-8\n";
    return false;
}

} // namespace

Manifest::Manifest(const std::string& manifest_file,
                   std::optional<std::string> root,
                   Settings settings,
                   std::shared_ptr<FileStore> store)
    : manifest_file_(normalize_path(manifest_file))
    , settings_(std::move(settings))
    , store_(store ? std::move(store) : default_store())
{
    if (root)
        explicit_root_ = normalize_path(*root);
    load();
    ignore_ = IgnoreMatcher::load(*store_, default_ignore_file(root_, settings_), settings_);
    ignore_.add_pattern(base_name(manifest_file_));
}

Manifest::Manifest(const std::string& manifest_file,
                   ManifestEntries entries,
                   std::string root,
                   IgnoreMatcher ignore,
                   Settings settings,
                   std::shared_ptr<FileStore> store)
    : manifest_file_(normalize_path(manifest_file))
    , explicit_root_(normalize_path(root))
    , root_(normalize_path(root))
    , settings_(std::move(settings))
    , store_(store ? std::move(store) : default_store())
    , ignore_(std::move(ignore))
    , manifest_(std::move(entries))
{
}

std::string Manifest::default_manifest_file(const std::string& directory, const Settings& settings) {
    return join_path(directory, settings.manifest_name);
}

std::string Manifest::default_ignore_file(const std::string& directory, const Settings& settings) {
    return join_path(directory, settings.ignore_name);
}

std::string Manifest::resolve_root(const std::string& manifest_file,
                                   const std::optional<std::string>& root) {
    if (root)
        return normalize_path(*root);
    std::string parent = parent_path(manifest_file);
    return parent.empty() ? "." : parent;
}

LoadStatus Manifest::load() {
    if (store_->is_directory(manifest_file_)) {
        if (!explicit_root_)
            explicit_root_ = manifest_file_;
        manifest_file_ = default_manifest_file(manifest_file_, settings_);
        if (store_->is_directory(manifest_file_))
            throw StorageError("manifest location is a directory: " + manifest_file_);
    }
    root_ = resolve_root(manifest_file_, explicit_root_);
    manifest_.clear();

    if (!store_->exists(manifest_file_)) {
        save();
        return last_status_ = LoadStatus::Created;
    }

    std::string data;
    try {
        auto in = store_->open_read(manifest_file_);
        data.assign(std::istreambuf_iterator<char>(*in), std::istreambuf_iterator<char>());
    } catch (const StorageError& e) {
        std::cerr << "Cannot read manifest " << manifest_file_ << ": " << e.what() << "\n";
        return last_status_ = LoadStatus::Unreadable;
    }
    if (is_blank(data))
        return last_status_ = LoadStatus::Empty;

    json j = json::parse(data, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        std::cerr << "Malformed manifest " << manifest_file_ << ", treating as empty\n";
        return last_status_ = LoadStatus::Malformed;
    }
    for (auto& [name, value] : j.items()) {
        if (!value.is_string()) {
            std::cerr << "Malformed manifest " << manifest_file_ << ": digest for "
                      << name << " is not a string, treating as empty\n";
            manifest_.clear();
            return last_status_ = LoadStatus::Malformed;
        }
        manifest_[normalize_path(name)] = value.get<std::string>();
    }
    return last_status_ = LoadStatus::Loaded;
}

void Manifest::save() const {
    std::string parent = parent_path(manifest_file_);
    if (!parent.empty())
        store_->make_dirs(parent);
    json j = manifest_;
    auto out = store_->open_write(manifest_file_);
    *out << j.dump(2);
    out->flush();
    if (!*out)
        throw StorageError("failed to write manifest " + manifest_file_);
}

Manifest Manifest::generate(const std::string& directory,
                            GenerateOptions options,
                            const Settings& settings,
                            std::shared_ptr<FileStore> store) {
    if (!store)
        store = default_store();
    if (!is_supported_algorithm(settings.hash_algorithm))
        throw UnsupportedAlgorithm(settings.hash_algorithm);

    std::string dir  = normalize_path(directory);
    std::string root = options.root_path ? normalize_path(*options.root_path) : dir;

    IgnoreMatcher ignore = options.ignore
        ? *options.ignore
        : IgnoreMatcher::load(*store, default_ignore_file(dir, settings), settings);
    ignore.add_pattern(settings.manifest_name);
    ignore.add_pattern(settings.ignore_name);
    ignore.add_pattern(settings.diff_member);
    if (options.manifest_file)
        ignore.add_pattern(base_name(*options.manifest_file));

    ManifestEntries manifest;
    for (auto& file_path : store->find(dir)) {
        std::string relative_path = relative_to(file_path, root);
        if (ignore.should_ignore(relative_path) || !recordable(relative_path))
            continue;
        manifest[relative_path] = hash_file(*store, file_path, settings);
    }

    std::string manifest_file = options.manifest_file
        ? normalize_path(*options.manifest_file)
        : default_manifest_file(dir, settings);
    Manifest result(manifest_file, std::move(manifest), root, std::move(ignore), settings, store);
    if (options.manifest_file)
        result.save();
    return result;
}

void Manifest::refresh() {
    GenerateOptions options;
    options.manifest_file = manifest_file_;
    options.root_path = root_;
    options.ignore = ignore_;

    Manifest fresh = generate(root_, std::move(options), settings_, store_);
    manifest_ = std::move(fresh.manifest_);
    ignore_ = std::move(fresh.ignore_);
}

ManifestDiff Manifest::changed() {
    load();

    ManifestDiff result;
    for (auto& [file, hash] : manifest_) {
        std::string file_path = join_path(root_, file);
        if (!store_->is_file(file_path)) {
            result.removed[file] = hash;
            continue;
        }
        std::string current = hash_file(*store_, file_path, settings_);
        if (current != hash)
            result.changed[file] = current;
    }

    for (auto& file_path : store_->find(root_)) {
        std::string relative_path = relative_to(file_path, root_);
        if (ignore_.should_ignore(relative_path) || manifest_.count(relative_path)
            || !recordable(relative_path))
            continue;
        result.added[relative_path] = hash_file(*store_, file_path, settings_);
    }
    return result;
}

ManifestDiff Manifest::diff(const Manifest& target) const {
    return diff_manifests(*this, target);
}

SyncReport Manifest::sync(Manifest& target, bool dry_run) const {
    return sync_manifests(*this, target, dry_run);
}

ManifestDiff Manifest::patch(const Manifest& target, const std::string& output_patch_file) const {
    return write_patch(*this, target, output_patch_file);
}

ManifestDiff Manifest::pzip(const Manifest& target, const std::string& output_zip_file) const {
    return write_patch_zip(*this, target, output_zip_file);
}
