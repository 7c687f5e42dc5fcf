#include <cxxopts.hpp>
#include <iostream>
#include <string>
#include <vector>
#include "treepatch/Builtins.hpp"
#include "treepatch/Engine.hpp"
#include "treepatch/Errors.hpp"
#include "treepatch/Loader.hpp"

using namespace treepatch;

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("treepatch", "Apply path-addressed patches to JSON/TOML documents");

        options.add_options()
            ("d,document", "Path to JSON/TOML document (default: empty object)", cxxopts::value<std::string>())
            ("p,patches", "Path to JSON/TOML patch list", cxxopts::value<std::string>())
            ("e,patch", "Inline JSON patch object (repeatable)", cxxopts::value<std::vector<std::string>>())
            ("r,rules", "Path to JSON/TOML rules file", cxxopts::value<std::string>())
            ("o,out", "Write the patched document to FILE on success", cxxopts::value<std::string>())
            ("atomic", "Keep the original document if any patch fails")
            ("result", "Print the result envelope instead of the document")
            ("v,verbose", "Trace each applied patch to stderr")
            ("h,help", "Show help");

        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << "\n";
            std::cout << "Builtin validators: type, pattern, range, max_length, enum, not_null\n";
            std::cout << "Builtin hooks: set, remove, increment\n";
            return 0;
        }

        if (!result.count("patches") && !result.count("patch")) {
            std::cerr << "Error: supply --patches FILE or at least one --patch JSON\n";
            return 1;
        }

        Value document = Value::object();
        if (result.count("document")) {
            document = load_document_file(result["document"].as<std::string>());
        }

        Value patches = Value::array();
        if (result.count("patches")) {
            patches = load_patches_file(result["patches"].as<std::string>());
        }
        if (result.count("patch")) {
            if (!patches.is_array()) {
                std::cerr << "Error: --patch cannot be combined with a malformed patch list\n";
                return 1;
            }
            for (const auto& raw : result["patch"].as<std::vector<std::string>>()) {
                patches.push_back(parse_json_text(raw, "--patch"));
            }
        }

        EngineOptions engine_options;
        engine_options.atomic = result.count("atomic") > 0;
        if (result.count("verbose")) engine_options.trace = &std::cerr;

        Engine engine(std::move(document), std::move(patches), engine_options);
        engine.set_registry(make_builtin_registry());
        if (result.count("rules")) {
            load_rules_file(result["rules"].as<std::string>(), engine);
        }

        Result outcome = engine.process();
        if (outcome.failed()) {
            std::cerr << "Error " << outcome.code() << " (" << status_name(outcome.code())
                      << "): " << outcome.message() << "\n";
        }

        if (result.count("out")) {
            const std::string out = result["out"].as<std::string>();
            if (outcome.ok()) {
                write_json_file(out, engine.document());
                if (result.count("verbose")) {
                    std::cerr << "Wrote JSON to " << out << "\n";
                }
            }
        }

        if (result.count("result")) {
            std::cout << to_json(outcome).dump(2) << "\n";
        } else if (!result.count("out")) {
            std::cout << engine.document().dump(2) << "\n";
        }

        return outcome.ok() ? 0 : 1;

    } catch (const PatchError& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
