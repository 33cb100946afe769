#pragma once
#include <nlohmann/json.hpp>
#include <map>
#include <string>

class Manifest;

// relative path -> hex digest, kept sorted so serialisation is reproducible
using ManifestEntries = std::map<std::string, std::string>;

struct ManifestDiff {
    ManifestEntries added;    // in source only (source digest)
    ManifestEntries removed;  // in target only (target digest)
    ManifestEntries changed;  // in both with different digests (source digest)

    bool empty() const { return added.empty() && removed.empty() && changed.empty(); }

    bool operator==(const ManifestDiff& other) const {
        return added == other.added && removed == other.removed && changed == other.changed;
    }
    bool operator!=(const ManifestDiff& other) const { return !(*this == other); }
};

void to_json(nlohmann::json& j, const ManifestDiff& d);
void from_json(const nlohmann::json& j, ManifestDiff& d);

ManifestDiff diff_entries(const ManifestEntries& source, const ManifestEntries& target);

// Pure comparison of the two mappings; roots and backing files play no part.
ManifestDiff diff_manifests(const Manifest& source, const Manifest& target);
