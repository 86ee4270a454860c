#include "batchtyper/config/configuration.hpp"
#include "batchtyper/core/errors.hpp"
#include "batchtyper/core/types.hpp"
#include "batchtyper/io/fileset.hpp"
#include "batchtyper/runner/manifest.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

static batchtyper::config::Config load_config_or_defaults(const std::string& path) {
    if (path.empty()) {
        return batchtyper::config::Config::defaults();
    }
    return batchtyper::config::Config::load(path);
}

// ============================================================================
// get-schema
// ============================================================================
int cmd_get_schema() {
    std::cout << batchtyper::config::get_schema_json() << std::endl;
    return 0;
}

// ============================================================================
// default-config
// ============================================================================
int cmd_default_config() {
    YAML::Emitter out;
    out << batchtyper::config::Config::defaults().to_yaml();
    std::cout << out.c_str() << std::endl;
    return 0;
}

// ============================================================================
// validate-config --path <path>
// ============================================================================
int cmd_validate_config(const std::string& path) {
    json result;
    result["valid"] = false;
    result["errors"] = json::array();
    result["path"] = path;

    try {
        batchtyper::config::Config cfg = batchtyper::config::Config::load(path);
        cfg.validate();
        result["valid"] = true;
        result["tools"] = cfg.tools.size();
    } catch (const std::exception& e) {
        result["errors"].push_back(e.what());
    }

    print_json(result);
    return result["valid"].get<bool>() ? 0 : 2;
}

// ============================================================================
// scan <input> [--config P] [--checksums]
// ============================================================================
int cmd_scan(const std::string& specifier, const std::string& config_path, bool checksums) {
    json result;
    result["specifier"] = specifier;

    try {
        auto cfg = load_config_or_defaults(config_path);
        batchtyper::InputSet inputs = batchtyper::io::resolve_inputs(specifier, cfg.input.extensions);

        result["ok"] = !inputs.empty();
        result["count"] = inputs.size();
        result["pattern"] = batchtyper::io::derive_file_pattern(inputs);
        result["extensions"] = batchtyper::io::detected_extensions(inputs);
        result["inputs"] = batchtyper::runner::input_set_to_json(inputs, checksums);
        if (inputs.empty()) {
            result["error"] = batchtyper::NoInputFiles(specifier).what();
        }
    } catch (const std::exception& e) {
        result["ok"] = false;
        result["error"] = e.what();
    }

    print_json(result);
    return result["ok"].get<bool>() ? 0 : 1;
}

// ============================================================================
// list-tools [--config P] [--tools-root R]
// ============================================================================
int cmd_list_tools(const std::string& config_path, const std::string& tools_root_arg) {
    batchtyper::config::Config cfg;
    try {
        cfg = load_config_or_defaults(config_path);
        cfg.validate();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }

    std::optional<fs::path> cfg_path;
    if (!config_path.empty()) cfg_path = fs::path(config_path);
    const fs::path tools_root = tools_root_arg.empty()
                                    ? batchtyper::config::default_tools_root(cfg_path)
                                    : fs::absolute(tools_root_arg);

    std::vector<batchtyper::TaskSpec> tasks;
    try {
        tasks = cfg.resolve_tasks(tools_root);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }

    json tools = json::array();
    for (const auto& t : tasks) {
        json j;
        j["name"] = t.name;
        j["label"] = t.display_name();
        j["description"] = t.description;
        j["batch"] = batchtyper::task_batch_to_string(t.batch);
        j["enabled"] = t.enabled;
        j["workspace"] = t.workspace.string();
        j["workspace_exists"] = fs::is_directory(t.workspace);
        j["executable"] = t.executable;
        j["result_path"] = t.result_path;
        tools.push_back(j);
    }

    json result;
    result["tools_root"] = tools_root.string();
    result["tools"] = tools;
    print_json(result);
    return 0;
}

void print_usage() {
    std::cout << "Usage: batchtyper_cli <command> [options]\n"
              << "\nCommands:\n"
              << "  get-schema                      Print JSON schema for config\n"
              << "  default-config                  Print the built-in config as YAML\n"
              << "  validate-config --path P        Validate config\n"
              << "  scan <input> [--config P] [--checksums]  Resolve input files\n"
              << "  list-tools [--config P] [--tools-root R]  List configured analyses\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 2;
    }

    std::string command = argv[1];

    auto get_arg = [&](const char* name) -> std::string {
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0) {
                return argv[i + 1];
            }
        }
        return "";
    };

    auto has_flag = [&](const char* name) -> bool {
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], name) == 0) return true;
        }
        return false;
    };

    auto get_positional = [&](int pos) -> std::string {
        int count = 0;
        for (int i = 2; i < argc; ++i) {
            if (argv[i][0] != '-') {
                if (count == pos) return argv[i];
                ++count;
            } else if (std::strcmp(argv[i], "--checksums") != 0 && i + 1 < argc) {
                ++i; // Skip option value
            }
        }
        return "";
    };

    if (command == "get-schema") {
        return cmd_get_schema();
    }

    if (command == "default-config") {
        return cmd_default_config();
    }

    if (command == "validate-config") {
        std::string path = get_arg("--path");
        if (path.empty()) {
            std::cerr << "validate-config requires --path <path>\n";
            return 2;
        }
        return cmd_validate_config(path);
    }

    if (command == "scan") {
        std::string input = get_positional(0);
        if (input.empty()) {
            std::cerr << "scan requires an input specifier\n";
            return 2;
        }
        return cmd_scan(input, get_arg("--config"), has_flag("--checksums"));
    }

    if (command == "list-tools") {
        return cmd_list_tools(get_arg("--config"), get_arg("--tools-root"));
    }

    print_usage();
    return 2;
}
