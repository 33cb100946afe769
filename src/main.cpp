#include "errors.hpp"
#include "manifest.hpp"
#include "settings.hpp"
#include "sync.hpp"
#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace po = boost::program_options;
using json = nlohmann::json;

namespace {

const char* usage =
    "Usage:\n"
    "  manifestly generate <directory> [--hash-algorithm=NAME] [--output-file=PATH]\n"
    "  manifestly changed <manifest> [--root=DIR]\n"
    "  manifestly refresh <manifest> [--root=DIR]\n"
    "  manifestly sync <source_manifest> <target_manifest> [--refresh] [--dry-run]\n"
    "                  [--source_directory=DIR] [--target_directory=DIR]\n"
    "  manifestly compare <manifest1> <manifest2>\n"
    "  manifestly patch <source_manifest> <target_manifest> <output_patch_file>\n"
    "  manifestly pzip <source_manifest> <target_manifest> <output_zip_file>\n"
    "  manifestly --version\n";

po::variables_map parse(const std::vector<std::string>& args,
                        const po::options_description& options,
                        const std::vector<std::string>& positionals) {
    po::options_description all;
    all.add(options);
    po::positional_options_description pos;
    for (auto& name : positionals) {
        all.add_options()(name.c_str(), po::value<std::string>()->required(), "");
        pos.add(name.c_str(), 1);
    }
    po::variables_map vm;
    po::store(po::command_line_parser(args).options(all).positional(pos).run(), vm);
    po::notify(vm);
    return vm;
}

std::optional<std::string> optional_arg(const po::variables_map& vm, const char* name) {
    if (vm.count(name))
        return vm[name].as<std::string>();
    return std::nullopt;
}

int generate_cmd(const std::vector<std::string>& args, Settings settings) {
    po::options_description opts("generate");
    opts.add_options()
        ("hash-algorithm", po::value<std::string>(), "digest name")
        ("output-file", po::value<std::string>(), "manifest path");
    auto vm = parse(args, opts, {"directory"});

    std::string directory = vm["directory"].as<std::string>();
    if (auto algorithm = optional_arg(vm, "hash-algorithm"))
        settings.hash_algorithm = *algorithm;

    GenerateOptions options;
    options.manifest_file = optional_arg(vm, "output-file")
        .value_or(Manifest::default_manifest_file(directory, settings));
    Manifest m = Manifest::generate(directory, options, settings);
    std::cout << "Manifest saved to " << m.manifest_file() << "\n";
    return 0;
}

int changed_cmd(const std::vector<std::string>& args, const Settings& settings) {
    po::options_description opts("changed");
    opts.add_options()("root", po::value<std::string>(), "tracked directory");
    auto vm = parse(args, opts, {"manifest"});

    Manifest m(vm["manifest"].as<std::string>(), optional_arg(vm, "root"), settings);
    ManifestDiff changed = m.changed();
    if (changed.empty()) {
        std::cout << "No files have changed\n";
        return 0;
    }
    std::cout << "Changed files:\n";
    const std::pair<const char*, const ManifestEntries*> categories[] = {
        {"added", &changed.added}, {"removed", &changed.removed}, {"changed", &changed.changed}
    };
    for (auto& [category, files] : categories) {
        if (files->empty()) continue;
        std::cout << category << ":\n";
        for (auto& [file, hash] : *files)
            std::cout << "  " << file << "\n";
    }
    return 0;
}

int refresh_cmd(const std::vector<std::string>& args, const Settings& settings) {
    po::options_description opts("refresh");
    opts.add_options()("root", po::value<std::string>(), "tracked directory");
    auto vm = parse(args, opts, {"manifest"});

    Manifest m(vm["manifest"].as<std::string>(), optional_arg(vm, "root"), settings);
    m.refresh();
    std::cout << "Manifest refreshed\n";
    return 0;
}

int sync_cmd(const std::vector<std::string>& args, const Settings& settings) {
    po::options_description opts("sync");
    opts.add_options()
        ("refresh", po::bool_switch(), "refresh the source manifest first")
        ("dry-run", po::bool_switch(), "report actions without performing them")
        ("source_directory", po::value<std::string>(), "source directory")
        ("target_directory", po::value<std::string>(), "target directory");
    auto vm = parse(args, opts, {"source_manifest", "target_manifest"});

    Manifest source(vm["source_manifest"].as<std::string>(), optional_arg(vm, "source_directory"), settings);
    if (vm["refresh"].as<bool>())
        source.refresh();
    Manifest target(vm["target_manifest"].as<std::string>(), optional_arg(vm, "target_directory"), settings);

    bool dry_run = vm["dry-run"].as<bool>();
    SyncReport report = source.sync(target, dry_run);
    if (dry_run)
        std::cout << "Dry run completed for " << source.root() << " to " << target.root() << "\n";
    else
        std::cout << "Synced " << source.root() << " with " << target.root() << "\n";
    if (auto failed = report.count(SyncAction::Kind::Failed))
        std::cerr << failed << " file(s) could not be synced\n";
    return 0;
}

int compare_cmd(const std::vector<std::string>& args, const Settings& settings) {
    auto vm = parse(args, po::options_description("compare"), {"source_manifest", "target_manifest"});
    Manifest source(vm["source_manifest"].as<std::string>(), std::nullopt, settings);
    Manifest target(vm["target_manifest"].as<std::string>(), std::nullopt, settings);
    json j = source.diff(target);
    std::cout << j.dump(2) << "\n";
    return 0;
}

int patch_cmd(const std::vector<std::string>& args, const Settings& settings) {
    auto vm = parse(args, po::options_description("patch"),
                    {"source_manifest", "target_manifest", "output_patch_file"});
    Manifest source(vm["source_manifest"].as<std::string>(), std::nullopt, settings);
    Manifest target(vm["target_manifest"].as<std::string>(), std::nullopt, settings);
    std::string output = vm["output_patch_file"].as<std::string>();
    source.patch(target, output);
    std::cout << "Patch saved to " << output << "\n";
    return 0;
}

int pzip_cmd(const std::vector<std::string>& args, const Settings& settings) {
    auto vm = parse(args, po::options_description("pzip"),
                    {"source_manifest", "target_manifest", "output_zip_file"});
    Manifest source(vm["source_manifest"].as<std::string>(), std::nullopt, settings);
    Manifest target(vm["target_manifest"].as<std::string>(), std::nullopt, settings);
    std::string output = vm["output_zip_file"].as<std::string>();
    source.pzip(target, output);
    std::cout << "Zip file saved to " << output << "\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << usage;
        return 1;
    }
    std::string command = argv[1];
    std::vector<std::string> args(argv + 2, argv + argc);

    if (command == "--version") {
        std::cout << "manifestly " << manifestly_version() << "\n";
        return 0;
    }
    if (command == "--help" || command == "help") {
        std::cout << usage;
        return 0;
    }

    try {
        Settings settings = Settings::from_env();
        if (command == "generate") return generate_cmd(args, settings);
        if (command == "changed")  return changed_cmd(args, settings);
        if (command == "refresh")  return refresh_cmd(args, settings);
        if (command == "sync")     return sync_cmd(args, settings);
        if (command == "compare")  return compare_cmd(args, settings);
        if (command == "patch")    return patch_cmd(args, settings);
        if (command == "pzip")     return pzip_cmd(args, settings);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n" << usage;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Unknown command: " << command << "\n" << usage;
    return 1;
}
