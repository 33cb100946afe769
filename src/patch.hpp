#pragma once
#include "diff.hpp"
#include <string>

class Manifest;

// Writes diff(source, target) as a JSON document to `output_patch_file`
// through the source manifest's store.
ManifestDiff write_patch(const Manifest& source, const Manifest& target,
                         const std::string& output_patch_file);

// Zip holding every added and changed file of diff(source, target) under its
// relative path, plus the diff document as an extra member. Members are
// streamed from the source store while the archive is written. Any unreadable
// source file, or a source entry named like the diff member, throws
// ArchiveError and leaves nothing at `output_zip_file`.
ManifestDiff write_patch_zip(const Manifest& source, const Manifest& target,
                             const std::string& output_zip_file);
