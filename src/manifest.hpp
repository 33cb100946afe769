#pragma once
#include "diff.hpp"
#include "ignore.hpp"
#include "settings.hpp"
#include "storage.hpp"
#include <memory>
#include <optional>
#include <string>

enum class LoadStatus {
    Loaded,     // parsed from the backing file
    Empty,      // backing file had no content
    Created,    // backing file was missing; an empty one was written
    Unreadable, // backing file could not be opened; treated as empty
    Malformed   // backing file could not be parsed; treated as empty
};

struct GenerateOptions {
    std::optional<std::string> manifest_file;  // written when set
    std::optional<std::string> root_path;      // keys are relative to this
    std::optional<IgnoreMatcher> ignore;
};

struct SyncReport;

// Mapping of relative path -> digest for the files under `root`, persisted
// as JSON at `manifest_file`. The two locations are independent.
class Manifest {
public:
    // Loads `manifest_file`. If it names a directory, the default manifest
    // inside it is used and, absent an explicit `root`, that directory
    // becomes the root.
    explicit Manifest(const std::string& manifest_file,
                      std::optional<std::string> root = std::nullopt,
                      Settings settings = Settings(),
                      std::shared_ptr<FileStore> store = nullptr);

    // Wraps already computed entries; nothing is read.
    Manifest(const std::string& manifest_file,
             ManifestEntries entries,
             std::string root,
             IgnoreMatcher ignore,
             Settings settings = Settings(),
             std::shared_ptr<FileStore> store = nullptr);

    static Manifest generate(const std::string& directory,
                             GenerateOptions options = GenerateOptions(),
                             const Settings& settings = Settings(),
                             std::shared_ptr<FileStore> store = nullptr);

    static std::string default_manifest_file(const std::string& directory, const Settings& settings);
    static std::string default_ignore_file(const std::string& directory, const Settings& settings);

    // Explicit root if given, otherwise the directory holding the manifest.
    static std::string resolve_root(const std::string& manifest_file,
                                    const std::optional<std::string>& root);

    LoadStatus load();
    void save() const;
    void refresh();

    // Live tree against the persisted manifest. Reloads from disk first.
    ManifestDiff changed();

    ManifestDiff diff(const Manifest& target) const;
    SyncReport sync(Manifest& target, bool dry_run = false) const;
    ManifestDiff patch(const Manifest& target, const std::string& output_patch_file) const;
    ManifestDiff pzip(const Manifest& target, const std::string& output_zip_file) const;

    const ManifestEntries& entries() const { return manifest_; }
    bool contains(const std::string& path) const { return manifest_.count(path) != 0; }
    std::size_t size() const { return manifest_.size(); }
    bool empty() const { return manifest_.empty(); }

    const std::string& manifest_file() const { return manifest_file_; }
    const std::string& root() const { return root_; }
    const IgnoreMatcher& ignore() const { return ignore_; }
    const Settings& settings() const { return settings_; }
    const std::shared_ptr<FileStore>& store() const { return store_; }
    LoadStatus last_load_status() const { return last_status_; }

    bool operator==(const Manifest& other) const { return manifest_ == other.manifest_; }
    bool operator!=(const Manifest& other) const { return !(*this == other); }

private:
    std::string manifest_file_;
    std::optional<std::string> explicit_root_;
    std::string root_;
    Settings settings_;
    std::shared_ptr<FileStore> store_;
    IgnoreMatcher ignore_;
    ManifestEntries manifest_;
    LoadStatus last_status_ = LoadStatus::Loaded;
};
