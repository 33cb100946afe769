#include <catch2/catch.hpp>
#include "ignore.hpp"
#include "storage.hpp"
#include "test_helpers.hpp"

TEST_CASE("IgnoreMatcher: pattern matches whole segments anywhere", "[ignore]") {
    IgnoreMatcher ignore({"build"});
    REQUIRE(ignore.should_ignore("build/output.txt"));
    REQUIRE(ignore.should_ignore("src/build/x.txt"));
    REQUIRE(ignore.should_ignore("build"));
    REQUIRE_FALSE(ignore.should_ignore("buildings/x.txt"));
    REQUIRE_FALSE(ignore.should_ignore("src/rebuild.txt"));
}

TEST_CASE("IgnoreMatcher: globs and surrounding slashes", "[ignore]") {
    IgnoreMatcher ignore({"*.tmp", "/cache/", "log?.txt"});
    REQUIRE(ignore.should_ignore("a/b/c.tmp"));
    REQUIRE(ignore.should_ignore("cache/data.bin"));
    REQUIRE(ignore.should_ignore("x/cache"));
    REQUIRE(ignore.should_ignore("log1.txt"));
    REQUIRE_FALSE(ignore.should_ignore("log10.txt"));
    REQUIRE_FALSE(ignore.should_ignore("a.tmpx"));
}

TEST_CASE("IgnoreMatcher: backslash paths are normalised", "[ignore]") {
    IgnoreMatcher ignore({"node_modules"});
    REQUIRE(ignore.should_ignore("web\\node_modules\\lib.js"));
    REQUIRE_FALSE(ignore.should_ignore("web\\src\\lib.js"));
}

TEST_CASE("IgnoreMatcher: add_pattern is idempotent", "[ignore]") {
    IgnoreMatcher ignore;
    ignore.add_pattern("out.json");
    ignore.add_pattern("out.json");
    ignore.add_pattern("");
    REQUIRE(ignore.patterns() == std::vector<std::string>{"out.json"});
}

TEST_CASE("IgnoreMatcher: load from ignore file", "[ignore]") {
    TempDir dir;
    LocalFileStore store;
    Settings settings;

    SECTION("missing file yields the implicit patterns") {
        auto ignore = IgnoreMatcher::load(store, (dir / ".manifestlyignore").generic_string(), settings);
        REQUIRE(ignore.patterns() ==
                std::vector<std::string>{".manifestly.json", ".manifestlyignore", ".manifestly.diff"});
        REQUIRE(ignore.should_ignore("sub/.manifestly.json"));
        REQUIRE_FALSE(ignore.should_ignore("a.txt"));
    }

    SECTION("lines become patterns; blanks and comments are skipped") {
        write_file(dir / ".manifestlyignore", "*.tmp\r\n\n# comment\nbuild/  \n*.tmp\n");
        auto ignore = IgnoreMatcher::load(store, (dir / ".manifestlyignore").generic_string(), settings);
        REQUIRE(ignore.patterns() ==
                std::vector<std::string>{".manifestly.json", ".manifestlyignore", ".manifestly.diff",
                                         "*.tmp", "build"});
        REQUIRE(ignore.should_ignore("x.tmp"));
        REQUIRE(ignore.should_ignore("build/a"));
        REQUIRE_FALSE(ignore.should_ignore("# comment"));
    }

    SECTION("configured names replace the defaults") {
        settings.manifest_name = "files.json";
        settings.ignore_name = ".skip";
        auto ignore = IgnoreMatcher::load(store, (dir / ".skip").generic_string(), settings);
        REQUIRE(ignore.should_ignore("files.json"));
        REQUIRE(ignore.should_ignore(".skip"));
        REQUIRE_FALSE(ignore.should_ignore(".manifestly.json"));
    }
}
