#include <catch2/catch.hpp>
#include "errors.hpp"
#include "manifest.hpp"
#include "patch.hpp"
#include "storage.hpp"
#include "test_helpers.hpp"
#include <nlohmann/json.hpp>
#include <zip.h>
#include <map>

using json = nlohmann::json;

namespace {

std::map<std::string, std::string> read_zip(const std::string& path) {
    std::map<std::string, std::string> members;
    int err = 0;
    zip_t* za = zip_open(path.c_str(), ZIP_RDONLY, &err);
    REQUIRE(za != nullptr);
    zip_int64_t n = zip_get_num_entries(za, 0);
    for (zip_int64_t i = 0; i < n; ++i) {
        zip_stat_t st;
        REQUIRE(zip_stat_index(za, i, 0, &st) == 0);
        zip_file_t* zf = zip_fopen_index(za, i, 0);
        REQUIRE(zf != nullptr);
        std::string data(static_cast<std::size_t>(st.size), '\0');
        if (st.size > 0)
            REQUIRE(zip_fread(zf, &data[0], st.size) == static_cast<zip_int64_t>(st.size));
        zip_fclose(zf);
        members[st.name] = data;
    }
    zip_close(za);
    return members;
}

struct Trees {
    TempDir src, dst, out;
    Manifest source;
    Manifest target;

    Trees()
        : source(build_source())
        , target(build_target())
    {}

    Manifest build_source() {
        write_file(src / "a.txt", "hi");
        write_file(src / "docs" / "b.txt", "bye");
        write_file(src / "same.txt", "hello");
        GenerateOptions o;
        o.manifest_file = (out / "source.json").generic_string();
        return Manifest::generate(src.str(), o);
    }

    Manifest build_target() {
        write_file(dst / "same.txt", "hello");
        write_file(dst / "docs" / "b.txt", "old");
        write_file(dst / "removed.txt", "x");
        GenerateOptions o;
        o.manifest_file = (out / "target.json").generic_string();
        return Manifest::generate(dst.str(), o);
    }
};

// Local store that lets a chosen file open once, then refuses it.
class FlakyStore : public LocalFileStore {
public:
    std::string flaky;
    int opens = 0;

    std::unique_ptr<std::istream> open_read(const std::string& path) override {
        if (path == flaky && ++opens > 1)
            throw StorageError("connection reset: " + path);
        return LocalFileStore::open_read(path);
    }
};

} // namespace

TEST_CASE("patch: diff written as JSON", "[patch]") {
    Trees t;
    auto output = (t.out / "patches" / "p.json").generic_string();

    ManifestDiff diff = t.source.patch(t.target, output);
    REQUIRE(diff.added == ManifestEntries{{"a.txt", SHA256_HI}});
    REQUIRE(diff.changed == ManifestEntries{{"docs/b.txt", SHA256_BYE}});
    REQUIRE(diff.removed.count("removed.txt") == 1);

    json j = json::parse(read_file(output));
    REQUIRE(j.get<ManifestDiff>() == diff);
    REQUIRE(read_file(output) == json(diff).dump(2));
}

TEST_CASE("patch: identical manifests give an empty document", "[patch]") {
    Trees t;
    auto output = (t.out / "p.json").generic_string();
    ManifestDiff diff = write_patch(t.source, t.source, output);
    REQUIRE(diff.empty());
    REQUIRE(json::parse(read_file(output)) ==
            json{{"added", json::object()}, {"removed", json::object()}, {"changed", json::object()}});
}

TEST_CASE("pzip: archive holds changed content and the diff", "[patch]") {
    Trees t;
    auto output = (t.out / "p.zip").generic_string();

    ManifestDiff diff = t.source.pzip(t.target, output);
    auto members = read_zip(output);

    REQUIRE(members.size() == 3);
    REQUIRE(members.at("a.txt") == "hi");
    REQUIRE(members.at("docs/b.txt") == "bye");
    REQUIRE(members.count("same.txt") == 0);
    REQUIRE(json::parse(members.at(".manifestly.diff")).get<ManifestDiff>() == diff);
    REQUIRE(diff.removed == ManifestEntries{{"removed.txt", t.target.entries().at("removed.txt")}});
}

TEST_CASE("pzip: a missing source file aborts the archive", "[patch]") {
    Trees t;
    fs::remove(t.src / "a.txt");
    auto output = (t.out / "broken.zip").generic_string();

    REQUIRE_THROWS_AS(write_patch_zip(t.source, t.target, output), ArchiveError);
    REQUIRE_FALSE(fs::exists(output));
}

TEST_CASE("pzip: large members are archived intact", "[patch]") {
    Trees t;
    std::string big;
    for (int i = 0; big.size() < 200000; ++i)
        big += std::to_string(i) + "\n";
    write_file(t.src / "big.bin", big);
    t.source.refresh();

    auto output = (t.out / "big.zip").generic_string();
    t.source.pzip(t.target, output);
    auto members = read_zip(output);
    REQUIRE(members.at("big.bin") == big);
    REQUIRE(members.at("a.txt") == "hi");
}

TEST_CASE("pzip: a read failure while writing discards the archive", "[patch]") {
    TempDir src, dst, out;
    write_file(src / "a.txt", "hi");
    write_file(src / "b.txt", "bye");

    auto store = std::make_shared<FlakyStore>();
    GenerateOptions o;
    o.manifest_file = (out / "source.json").generic_string();
    Manifest source = Manifest::generate(src.str(), o, Settings(), store);
    Manifest target((out / "target.json").generic_string(), dst.str());
    store->flaky = (src / "b.txt").generic_string();

    auto output = (out / "flaky.zip").generic_string();
    REQUIRE_THROWS_AS(write_patch_zip(source, target, output), ArchiveError);
    REQUIRE(store->opens == 2);
    REQUIRE_FALSE(fs::exists(output));
}

TEST_CASE("pzip: a tracked file cannot shadow the diff member", "[patch]") {
    TempDir src, dst, out;
    write_file(src / "a.txt", "hi");
    write_file(src / ".manifestly.diff", "left over from an earlier export");

    GenerateOptions o;
    o.manifest_file = (out / "source.json").generic_string();
    Manifest source = Manifest::generate(src.str(), o);
    REQUIRE_FALSE(source.contains(".manifestly.diff"));

    Manifest target((out / "target.json").generic_string(), dst.str());
    auto output = (out / "p.zip").generic_string();
    ManifestDiff diff = source.pzip(target, output);
    auto members = read_zip(output);
    REQUIRE(members.size() == 2);
    REQUIRE(json::parse(members.at(".manifestly.diff")).get<ManifestDiff>() == diff);

    ManifestEntries entries{{"a.txt", SHA256_HI}, {".manifestly.diff", SHA256_BYE}};
    Manifest crafted((out / "crafted.json").generic_string(), entries, src.str(),
                     IgnoreMatcher());
    auto rejected = (out / "rejected.zip").generic_string();
    REQUIRE_THROWS_AS(crafted.pzip(target, rejected), ArchiveError);
    REQUIRE_FALSE(fs::exists(rejected));
}
