#include "diff.hpp"
#include "manifest.hpp"

using json = nlohmann::json;

void to_json(json& j, const ManifestDiff& d) {
    j = json{
        {"added", d.added},
        {"removed", d.removed},
        {"changed", d.changed}
    };
}

void from_json(const json& j, ManifestDiff& d) {
    d.added   = j.value("added", ManifestEntries{});
    d.removed = j.value("removed", ManifestEntries{});
    d.changed = j.value("changed", ManifestEntries{});
}

ManifestDiff diff_entries(const ManifestEntries& source, const ManifestEntries& target) {
    ManifestDiff diff;
    for (auto& [path, hash] : source) {
        auto it = target.find(path);
        if (it == target.end())
            diff.added[path] = hash;
        else if (it->second != hash)
            diff.changed[path] = hash;
    }
    for (auto& [path, hash] : target) {
        if (!source.count(path))
            diff.removed[path] = hash;
    }
    return diff;
}

ManifestDiff diff_manifests(const Manifest& source, const Manifest& target) {
    return diff_entries(source.entries(), target.entries());
}
