#pragma once
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

// Path-addressable byte store. Paths use '/' separators.
class FileStore {
public:
    virtual ~FileStore() = default;

    // Throws StorageError if the path cannot be opened.
    virtual std::unique_ptr<std::istream> open_read(const std::string& path) = 0;
    // Creates missing parent directories; truncates an existing file.
    virtual std::unique_ptr<std::ostream> open_write(const std::string& path) = 0;

    virtual bool exists(const std::string& path) const = 0;
    virtual bool is_file(const std::string& path) const = 0;
    virtual bool is_directory(const std::string& path) const = 0;

    virtual void remove(const std::string& path) = 0;
    virtual void make_dirs(const std::string& path) = 0;

    // Every file below `directory`, recursively, sorted. Each entry is
    // `directory` joined with the file's relative path.
    virtual std::vector<std::string> find(const std::string& directory) const = 0;
};

class LocalFileStore : public FileStore {
public:
    std::unique_ptr<std::istream> open_read(const std::string& path) override;
    std::unique_ptr<std::ostream> open_write(const std::string& path) override;

    bool exists(const std::string& path) const override;
    bool is_file(const std::string& path) const override;
    bool is_directory(const std::string& path) const override;

    void remove(const std::string& path) override;
    void make_dirs(const std::string& path) override;

    std::vector<std::string> find(const std::string& directory) const override;
};

std::shared_ptr<FileStore> default_store();
