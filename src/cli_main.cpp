#include <cxxopts.hpp>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include "sharetree/DotPath.hpp"
#include "sharetree/Loader.hpp"
#include "sharetree/Merge.hpp"

using namespace sharetree;

namespace {

std::vector<std::string> split_list(const std::string& s) {
    std::vector<std::string> out;
    std::string current;
    for (char c : s) {
        if (c == ',') {
            if (!current.empty()) out.push_back(current);
            current.clear();
        } else if (c != ' ') {
            current += c;
        }
    }
    if (!current.empty()) out.push_back(current);
    return out;
}

} // namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("sharetree-cli", "Merge a revised JSON/TOML document into a source document, sharing unchanged subtrees");
        options.positional_help("SOURCE REVISION");

        options.add_options()
            ("f,freeze", "Comma-separated dot-paths kept from SOURCE", cxxopts::value<std::string>()->default_value(""))
            ("to", "Output format: json or toml", cxxopts::value<std::string>()->default_value("json"))
            ("o,out", "Write the merged document to FILE", cxxopts::value<std::string>())
            ("i,indent", "JSON indent", cxxopts::value<int>()->default_value("2"))
            ("v,verbose", "Report sharing decisions on stderr")
            ("h,help", "Show help");

        options.add_options()
            ("documents", "SOURCE and REVISION files", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"documents"});

        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }

        std::vector<std::string> docs;
        if (result.count("documents")) {
            docs = result["documents"].as<std::vector<std::string>>();
        }
        if (docs.size() != 2) {
            std::cerr << "Error: expected SOURCE and REVISION\n";
            std::cerr << options.help() << "\n";
            return 1;
        }

        const std::string to = result["to"].as<std::string>();
        if (to != "json" && to != "toml") {
            std::cerr << "Error: unknown output format '" << to << "' (expected json or toml)\n";
            return 1;
        }

        const bool verbose = result.count("verbose") > 0;
        const auto frozen = split_list(result["freeze"].as<std::string>());

        Value source = load_tree_file(docs[0]);
        Value revision = load_tree_file(docs[1]);

        MergeOptions merge_options;
        if (!frozen.empty()) {
            Prefilter keep = frozen_paths(frozen);
            merge_options.prefilter = [keep, verbose](const Path& path, const Value& s, const Value& r) {
                bool kept = keep(path, s, r);
                if (kept && verbose) {
                    std::cerr << "frozen: " << join_dot_path(path) << "\n";
                }
                return kept;
            };
        }

        Value merged = merge(source, revision, merge_options);

        if (verbose) {
            std::cerr << "root: " << (same(merged, source) ? "shared with source" : "rebuilt") << "\n";
        }

        std::string text = (to == "toml")
            ? to_toml_string(merged)
            : to_json_string(merged, result["indent"].as<int>());

        if (result.count("out")) {
            const std::string out = result["out"].as<std::string>();
            std::ofstream ofs(out);
            if (!ofs) {
                std::cerr << "Error: cannot write to " << out << "\n";
                return 1;
            }
            ofs << text << "\n";
            if (verbose) {
                std::cerr << "Wrote " << (to == "toml" ? "TOML" : "JSON") << " to " << out << "\n";
            }
        } else {
            std::cout << text << "\n";
        }
        return 0;

    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
