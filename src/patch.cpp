#include "patch.hpp"
#include "errors.hpp"
#include "manifest.hpp"
#include "paths.hpp"
#include <nlohmann/json.hpp>
#include <zip.h>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <memory>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

// One store file handed to libzip, which opens and reads it only while the
// archive is being written at zip_close time.
struct StoreSource {
    StoreSource(FileStore& s, std::string p)
        : store(s)
        , path(std::move(p))
    {
        zip_error_init(&error);
    }
    ~StoreSource() { zip_error_fini(&error); }

    FileStore& store;
    std::string path;
    std::unique_ptr<std::istream> in;
    zip_error_t error;
};

zip_int64_t store_source_callback(void* userdata, void* data, zip_uint64_t len, zip_source_cmd_t cmd) {
    auto* src = static_cast<StoreSource*>(userdata);
    switch (cmd) {
    case ZIP_SOURCE_OPEN:
        try {
            src->in = src->store.open_read(src->path);
        } catch (const std::exception&) {
            zip_error_set(&src->error, ZIP_ER_OPEN, 0);
            return -1;
        }
        return 0;
    case ZIP_SOURCE_READ:
        src->in->read(static_cast<char*>(data), static_cast<std::streamsize>(len));
        if (src->in->bad()) {
            zip_error_set(&src->error, ZIP_ER_READ, 0);
            return -1;
        }
        return static_cast<zip_int64_t>(src->in->gcount());
    case ZIP_SOURCE_CLOSE:
        src->in.reset();
        return 0;
    case ZIP_SOURCE_STAT:
        zip_stat_init(static_cast<zip_stat_t*>(data));
        return sizeof(zip_stat_t);
    case ZIP_SOURCE_ERROR:
        return zip_error_to_data(&src->error, data, len);
    case ZIP_SOURCE_FREE:
        delete src;
        return 0;
    case ZIP_SOURCE_SUPPORTS:
        return zip_source_make_command_bitmap(ZIP_SOURCE_OPEN, ZIP_SOURCE_READ, ZIP_SOURCE_CLOSE,
                                              ZIP_SOURCE_STAT, ZIP_SOURCE_ERROR, ZIP_SOURCE_FREE, -1);
    default:
        zip_error_set(&src->error, ZIP_ER_OPNOTSUPP, 0);
        return -1;
    }
}

// Owns the archive until it is closed; an unclosed archive is discarded,
// which leaves the output path untouched.
class ZipWriter {
public:
    explicit ZipWriter(const std::string& path)
        : path_(path)
    {
        int err = 0;
        za_ = zip_open(path.c_str(), ZIP_CREATE | ZIP_TRUNCATE, &err);
        if (za_ == nullptr) {
            zip_error_t error;
            zip_error_init_with_code(&error, err);
            std::string msg = zip_error_strerror(&error);
            zip_error_fini(&error);
            throw ArchiveError("cannot create " + path + ": " + msg);
        }
    }

    ~ZipWriter() {
        if (za_ != nullptr)
            zip_discard(za_);
    }

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    // Member content is streamed from the store when the archive is closed.
    void add_file(const std::string& name, FileStore& store, const std::string& path) {
        auto state = std::make_unique<StoreSource>(store, path);
        zip_source_t* src = zip_source_function(za_, store_source_callback, state.get());
        if (src == nullptr)
            throw ArchiveError("cannot add " + name + ": " + zip_strerror(za_));
        state.release();
        add_source(name, src);
    }

    void add_buffer(const std::string& name, const std::string& data) {
        // libzip reads the buffer at close time and frees it afterwards
        void* copy = std::malloc(data.size() == 0 ? 1 : data.size());
        if (copy == nullptr)
            throw ArchiveError("out of memory adding " + name);
        std::memcpy(copy, data.data(), data.size());

        zip_source_t* src = zip_source_buffer(za_, copy, data.size(), 1);
        if (src == nullptr) {
            std::free(copy);
            throw ArchiveError("cannot add " + name + ": " + zip_strerror(za_));
        }
        add_source(name, src);
    }

    void close() {
        if (zip_close(za_) != 0) {
            std::string msg = zip_strerror(za_);
            zip_discard(za_);
            za_ = nullptr;
            std::error_code ec;
            fs::remove(path_, ec);
            throw ArchiveError("cannot write " + path_ + ": " + msg);
        }
        za_ = nullptr;
    }

private:
    // Fails on a duplicate name instead of replacing the earlier member.
    void add_source(const std::string& name, zip_source_t* src) {
        if (zip_file_add(za_, name.c_str(), src, ZIP_FL_ENC_UTF_8) < 0) {
            std::string msg = zip_strerror(za_);
            zip_source_free(src);
            throw ArchiveError("cannot add " + name + ": " + msg);
        }
    }

    std::string path_;
    zip_t* za_ = nullptr;
};

// Member must exist and open now; its bytes are only read at close time.
void check_readable(FileStore& store, const std::string& file, const std::string& path) {
    if (!store.is_file(path))
        throw ArchiveError("cannot archive " + file + ": " + path + " does not exist");
    try {
        store.open_read(path);
    } catch (const StorageError& e) {
        throw ArchiveError("cannot archive " + file + ": " + e.what());
    }
}

} // namespace

ManifestDiff write_patch(const Manifest& source, const Manifest& target,
                         const std::string& output_patch_file) {
    ManifestDiff diff = source.diff(target);
    json j = diff;
    auto out = source.store()->open_write(normalize_path(output_patch_file));
    *out << j.dump(2);
    out->flush();
    if (!*out)
        throw StorageError("failed to write patch " + output_patch_file);
    return diff;
}

ManifestDiff write_patch_zip(const Manifest& source, const Manifest& target,
                             const std::string& output_zip_file) {
    ManifestDiff diff = source.diff(target);
    FileStore& store = *source.store();

    std::string parent = parent_path(normalize_path(output_zip_file));
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec)
            throw ArchiveError("cannot create directory " + parent + ": " + ec.message());
    }

    const std::string& diff_member = source.settings().diff_member;
    ZipWriter zip(output_zip_file);
    for (auto* section : {&diff.added, &diff.changed}) {
        for (auto& [file, hash] : *section) {
            if (file == diff_member)
                throw ArchiveError("cannot archive " + file + ": name is reserved for the diff document");
            std::string path = join_path(source.root(), file);
            check_readable(store, file, path);
            zip.add_file(file, store, path);
        }
    }
    json j = diff;
    zip.add_buffer(diff_member, j.dump());
    zip.close();
    return diff;
}
