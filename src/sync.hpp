#pragma once
#include <cstddef>
#include <string>
#include <vector>

class Manifest;

struct SyncAction {
    enum class Kind {
        Copy,         // source file copied over the target (or planned, in a dry run)
        Remove,       // target file deleted (or planned)
        SkipMissing,  // source file vanished after the diff was computed
        SkipSamePath, // source and target resolve to the same file in one store
        Failed        // copy or delete failed; the sync carried on
    };

    Kind kind;
    std::string source;   // empty for removals
    std::string target;
    std::string message;
};

struct SyncReport {
    bool dry_run = false;
    std::vector<SyncAction> actions;

    std::size_t count(SyncAction::Kind kind) const;
};

// Makes target's tree match source's manifest: copies added and changed
// files, deletes removed ones, then regenerates the target manifest. With
// `dry_run` every action is reported and nothing is touched.
SyncReport sync_manifests(const Manifest& source, Manifest& target, bool dry_run = false);
