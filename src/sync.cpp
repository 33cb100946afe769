#include "sync.hpp"
#include "errors.hpp"
#include "manifest.hpp"
#include "paths.hpp"
#include <algorithm>
#include <iostream>
#include <memory>
#include <vector>

namespace {

void copy_stream(std::istream& in, std::ostream& out, std::size_t chunk_size) {
    std::vector<char> buffer(chunk_size == 0 ? 8192 : chunk_size);
    while (in.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || in.gcount() > 0) {
        out.write(buffer.data(), in.gcount());
        if (!out)
            return;
    }
}

} // namespace

std::size_t SyncReport::count(SyncAction::Kind kind) const {
    return static_cast<std::size_t>(std::count_if(actions.begin(), actions.end(),
        [kind](const SyncAction& a) { return a.kind == kind; }));
}

SyncReport sync_manifests(const Manifest& source, Manifest& target, bool dry_run) {
    ManifestDiff diff = source.diff(target);
    FileStore& source_store = *source.store();
    FileStore& target_store = *target.store();
    const std::size_t chunk_size = source.settings().chunk_size;
    const bool same_store = &source_store == &target_store;

    SyncReport report;
    report.dry_run = dry_run;

    std::vector<std::string> to_copy;
    for (auto& [file, hash] : diff.added)   to_copy.push_back(file);
    for (auto& [file, hash] : diff.changed) to_copy.push_back(file);

    for (auto& file : to_copy) {
        std::string source_file = join_path(source.root(), file);
        std::string target_file = join_path(target.root(), file);

        if (!source_store.is_file(source_file)) {
            std::cout << "File " << source_file << " does not exist\n";
            report.actions.push_back({SyncAction::Kind::SkipMissing, source_file, target_file,
                                      "source file does not exist"});
            continue;
        }
        if (same_store && source_file == target_file) {
            // opening the target for writing would truncate the source
            report.actions.push_back({SyncAction::Kind::SkipSamePath, source_file, target_file,
                                      "source and target are the same file"});
            continue;
        }
        if (dry_run) {
            std::cout << "Copy " << source_file << " to " << target_file << "\n";
            report.actions.push_back({SyncAction::Kind::Copy, source_file, target_file, ""});
            continue;
        }

        std::unique_ptr<std::istream> in;
        try {
            in = source_store.open_read(source_file);
        } catch (const StorageError& e) {
            std::cerr << "Skipping " << source_file << ": " << e.what() << "\n";
            report.actions.push_back({SyncAction::Kind::Failed, source_file, target_file, e.what()});
            continue;
        }

        std::string parent = parent_path(target_file);
        if (!parent.empty())
            target_store.make_dirs(parent);
        auto out = target_store.open_write(target_file);
        copy_stream(*in, *out, chunk_size);
        out->flush();
        if (!*out)
            throw StorageError("failed to write " + target_file);
        if (in->bad()) {
            std::cerr << "Read error on " << source_file << "\n";
            report.actions.push_back({SyncAction::Kind::Failed, source_file, target_file,
                                      "read error"});
            continue;
        }
        report.actions.push_back({SyncAction::Kind::Copy, source_file, target_file, ""});
    }

    for (auto& [file, hash] : diff.removed) {
        std::string target_file = join_path(target.root(), file);
        if (!target_store.exists(target_file))
            continue;
        if (dry_run) {
            std::cout << "Remove " << target_file << "\n";
            report.actions.push_back({SyncAction::Kind::Remove, "", target_file, ""});
            continue;
        }
        try {
            target_store.remove(target_file);
            report.actions.push_back({SyncAction::Kind::Remove, "", target_file, ""});
        } catch (const StorageError& e) {
            std::cerr << "Cannot remove " << target_file << ": " << e.what() << "\n";
            report.actions.push_back({SyncAction::Kind::Failed, "", target_file, e.what()});
        }
    }

    if (!dry_run)
        target.refresh();
    return report;
}
