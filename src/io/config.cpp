#include "batchtyper/config/configuration.hpp"
#include "batchtyper/core/errors.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <set>

namespace batchtyper::config {

static void read_string_list(const YAML::Node& n, std::vector<std::string>& out) {
    if (n && n.IsSequence()) {
        out.clear();
        for (const auto& item : n) {
            out.push_back(item.as<std::string>());
        }
    }
}

static YAML::Node string_list_node(const std::vector<std::string>& values) {
    YAML::Node n(YAML::NodeType::Sequence);
    for (const auto& v : values) {
        n.push_back(v);
    }
    return n;
}

static TaskSpec make_tool(const std::string& name, const std::string& label,
                          const std::string& description, const std::string& module_dir,
                          const std::string& script, std::vector<std::string> args,
                          const std::string& result_path) {
    TaskSpec t;
    t.name = name;
    t.label = label;
    t.description = description;
    t.workspace = fs::path("modules") / module_dir;
    t.executable = "python3";
    t.args.push_back(script);
    t.args.insert(t.args.end(), args.begin(), args.end());
    t.required_files = {script};
    t.result_path = result_path;
    return t;
}

std::vector<TaskSpec> Config::builtin_tools() {
    std::vector<TaskSpec> tools;

    TaskSpec mlst = make_tool(
        "mlst", "MLST Typing", "Multi-locus sequence typing (Achtman scheme)",
        "mlst_module", "ecolimlst_module.py",
        {"-i", "{input}", "-o", "results", "-db", "db", "-sc", "bin", "--batch"},
        "results");
    mlst.accepts_pattern = false;
    mlst.require_nonempty_result = true;
    mlst.purge_dirs = {"mlst_results"};
    mlst.warning_file = "mlst_summary.tsv";
    mlst.warning_markers = {"UNKNOWN", "ND"};
    tools.push_back(mlst);

    TaskSpec sero = make_tool(
        "serotyping", "Serotyping", "O and H antigen prediction",
        "serotypefinder_module", "enhanced_serotypefinder.py",
        {"-i", "{input}", "-o", "Serotype"},
        "Serotype/SerotypeFinder_results");
    sero.purge_dirs = {"Serotype"};
    tools.push_back(sero);

    TaskSpec ch = make_tool(
        "chtyper", "CH Typing", "fumC/fimH allele typing",
        "CHTyper_module", "enhanced_chtyper.py",
        {"-i", "{input}", "-o", "CH_results"},
        "CH_results/chtyper_results");
    ch.purge_dirs = {"CH_results"};
    tools.push_back(ch);

    TaskSpec phylo = make_tool(
        "phylogrouping", "Phylogrouping", "Clermont phylogroup assignment",
        "phylogrouping_module", "enhanced_ezclermont.py",
        {"-i", "{input}", "-o", "Phylo"},
        "Phylo/phylogrouping_results");
    phylo.purge_dirs = {"Phylo"};
    tools.push_back(phylo);

    tools.push_back(make_tool(
        "abricate", "ABRicate", "Resistance and virulence gene screening",
        "Abricate_module", "ecoli_abricate.py", {"{input}"},
        "ecoli_abricate_results"));

    TaskSpec amr = make_tool(
        "amrfinder", "AMRfinderPlus", "AMR gene detection (memory heavy)",
        "Amrfinder_module", "ecoli_amrfinder.py", {"{input}"},
        "ecoli_amrfinder_results");
    amr.batch = TaskBatch::Exclusive;
    tools.push_back(amr);

    TaskSpec lineage = make_tool(
        "lineage", "Lineage Reference", "Static lineage reference report",
        "Ecoli_lineage", "ecoli_html_reference.py", {},
        "ecoli_comprehensive_reference.html");
    lineage.batch = TaskBatch::Post;
    lineage.stage_inputs = false;
    lineage.purge_temp_files = false;
    tools.push_back(lineage);

    return tools;
}

Config Config::defaults() {
    Config cfg;
    cfg.tools = builtin_tools();
    return cfg;
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    try {
        YAML::Node node = YAML::LoadFile(path.string());
        return from_yaml(node);
    } catch (const YAML::Exception& e) {
        throw ConfigError(path.string() + ": " + e.what());
    }
}

static TaskSpec tool_from_yaml(const YAML::Node& t) {
    if (!t["name"]) {
        throw ConfigError("tools entry without a name");
    }
    const std::string name = t["name"].as<std::string>();

    // Entries naming a built-in tool override it field by field.
    TaskSpec spec;
    spec.name = name;
    for (const auto& builtin : Config::builtin_tools()) {
        if (builtin.name == name) {
            spec = builtin;
            break;
        }
    }

    if (t["label"]) spec.label = t["label"].as<std::string>();
    if (t["description"]) spec.description = t["description"].as<std::string>();
    if (t["workspace"]) spec.workspace = t["workspace"].as<std::string>();
    if (t["executable"]) spec.executable = t["executable"].as<std::string>();
    read_string_list(t["args"], spec.args);
    read_string_list(t["required_files"], spec.required_files);
    if (t["accepts_pattern"]) spec.accepts_pattern = t["accepts_pattern"].as<bool>();
    if (t["batch"]) {
        const std::string b = t["batch"].as<std::string>();
        auto batch = string_to_task_batch(b);
        if (!batch) {
            throw ConfigError("tools." + name + ".batch: unknown value '" + b + "'");
        }
        spec.batch = *batch;
    }
    if (t["result_path"]) spec.result_path = t["result_path"].as<std::string>();
    if (t["require_nonempty_result"]) {
        spec.require_nonempty_result = t["require_nonempty_result"].as<bool>();
    }
    read_string_list(t["purge_dirs"], spec.purge_dirs);
    if (t["purge_temp_files"]) spec.purge_temp_files = t["purge_temp_files"].as<bool>();
    if (t["warning_file"]) spec.warning_file = t["warning_file"].as<std::string>();
    read_string_list(t["warning_markers"], spec.warning_markers);
    if (t["stage_inputs"]) spec.stage_inputs = t["stage_inputs"].as<bool>();
    if (t["enabled"]) spec.enabled = t["enabled"].as<bool>();

    return spec;
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg = defaults();

    if (node["run"]) {
        auto r = node["run"];
        if (r["threads"]) cfg.run.threads = r["threads"].as<int>();
        if (r["thread_policy"]) cfg.run.thread_policy = r["thread_policy"].as<std::string>();
    }

    if (node["input"]) {
        read_string_list(node["input"]["extensions"], cfg.input.extensions);
    }

    if (node["cleanup"]) {
        auto c = node["cleanup"];
        read_string_list(c["output_dirs"], cfg.cleanup.output_dirs);
        read_string_list(c["temp_patterns"], cfg.cleanup.temp_patterns);
    }

    if (node["tools"]) {
        auto t = node["tools"];
        if (!t.IsSequence()) {
            throw ConfigError("tools must be a list");
        }
        cfg.tools.clear();
        for (const auto& entry : t) {
            cfg.tools.push_back(tool_from_yaml(entry));
        }
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["run"]["threads"] = run.threads;
    node["run"]["thread_policy"] = run.thread_policy;

    node["input"]["extensions"] = string_list_node(input.extensions);

    node["cleanup"]["output_dirs"] = string_list_node(cleanup.output_dirs);
    node["cleanup"]["temp_patterns"] = string_list_node(cleanup.temp_patterns);

    YAML::Node tools_node(YAML::NodeType::Sequence);
    for (const auto& t : tools) {
        YAML::Node n;
        n["name"] = t.name;
        n["label"] = t.label;
        n["description"] = t.description;
        n["workspace"] = t.workspace.string();
        n["executable"] = t.executable;
        n["args"] = string_list_node(t.args);
        n["required_files"] = string_list_node(t.required_files);
        n["accepts_pattern"] = t.accepts_pattern;
        n["batch"] = task_batch_to_string(t.batch);
        n["result_path"] = t.result_path;
        n["require_nonempty_result"] = t.require_nonempty_result;
        n["purge_dirs"] = string_list_node(t.purge_dirs);
        n["purge_temp_files"] = t.purge_temp_files;
        n["warning_file"] = t.warning_file;
        n["warning_markers"] = string_list_node(t.warning_markers);
        n["stage_inputs"] = t.stage_inputs;
        n["enabled"] = t.enabled;
        tools_node.push_back(n);
    }
    node["tools"] = tools_node;

    return node;
}

// Non-empty relative path that cannot climb out of the directory it is joined to.
static bool is_contained_name(const std::string& p) {
    if (p.empty() || fs::path(p).is_absolute()) return false;
    for (const auto& part : fs::path(p)) {
        if (part == "..") return false;
    }
    return fs::path(p).lexically_normal() != ".";
}

static fs::path normalized(const fs::path& p) {
    fs::path n = p.lexically_normal();
    if (n.has_relative_path() && n.filename().empty()) n = n.parent_path();
    return n;
}

static bool path_contains(const fs::path& outer, const fs::path& inner) {
    auto i = inner.begin();
    for (auto o = outer.begin(); o != outer.end(); ++o, ++i) {
        if (i == inner.end() || *o != *i) return false;
    }
    return true;
}

// Enabled tools must not share a workspace or nest one inside another.
static void check_disjoint_workspaces(const std::vector<TaskSpec>& tools) {
    for (size_t i = 0; i < tools.size(); ++i) {
        if (!tools[i].enabled) continue;
        const fs::path a = normalized(tools[i].workspace);
        for (size_t j = i + 1; j < tools.size(); ++j) {
            if (!tools[j].enabled) continue;
            const fs::path b = normalized(tools[j].workspace);
            if (a.is_absolute() != b.is_absolute()) continue;
            if (path_contains(a, b) || path_contains(b, a)) {
                throw ValidationError("tools." + tools[i].name + " and tools." + tools[j].name +
                                      " must use separate workspaces (" + a.string() + ", " +
                                      b.string() + ")");
            }
        }
    }
}

void Config::validate() const {
    if (run.threads < 1) {
        throw ValidationError("run.threads must be >= 1");
    }
    if (run.thread_policy != "fixed" && run.thread_policy != "hardware") {
        throw ValidationError("run.thread_policy must be 'fixed' or 'hardware'");
    }

    if (input.extensions.empty()) {
        throw ValidationError("input.extensions must not be empty");
    }
    for (const auto& ext : input.extensions) {
        if (ext.size() < 2 || ext[0] != '.') {
            throw ValidationError("input.extensions entries must start with '.' (got '" + ext + "')");
        }
    }

    for (const auto& dir : cleanup.output_dirs) {
        if (!is_contained_name(dir)) {
            throw ValidationError("cleanup.output_dirs entries must be relative names (got '" + dir + "')");
        }
    }

    std::set<std::string> names;
    int exclusive_count = 0;
    for (const auto& t : tools) {
        if (t.name.empty()) {
            throw ValidationError("tools entries must have a name");
        }
        if (!names.insert(t.name).second) {
            throw ValidationError("tools." + t.name + " is defined more than once");
        }
        if (t.workspace.empty()) {
            throw ValidationError("tools." + t.name + ".workspace must not be empty");
        }
        if (t.executable.empty()) {
            throw ValidationError("tools." + t.name + ".executable must not be empty");
        }
        if (t.result_path.empty()) {
            throw ValidationError("tools." + t.name + ".result_path must not be empty");
        }
        if (fs::path(t.result_path).is_absolute() || t.result_path.find("..") != std::string::npos ||
            *fs::path(t.result_path).begin() == ".") {
            throw ValidationError("tools." + t.name + ".result_path must be relative to the workspace");
        }
        for (const auto& dir : t.purge_dirs) {
            if (!is_contained_name(dir)) {
                throw ValidationError("tools." + t.name + ".purge_dirs entries must be relative names (got '" +
                                      dir + "')");
            }
        }
        if (!t.warning_file.empty() && !is_contained_name(t.warning_file)) {
            throw ValidationError("tools." + t.name + ".warning_file must be a relative path");
        }
        if (t.enabled && t.batch == TaskBatch::Exclusive) {
            ++exclusive_count;
        }
    }
    if (exclusive_count > 1) {
        throw ValidationError("at most one enabled tool may use batch 'exclusive'");
    }
    check_disjoint_workspaces(tools);
}

std::vector<TaskSpec> Config::resolve_tasks(const fs::path& tools_root) const {
    std::vector<TaskSpec> resolved;
    resolved.reserve(tools.size());

    for (TaskSpec t : tools) {
        if (t.workspace.is_relative()) {
            t.workspace = tools_root / t.workspace;
        }
        t.workspace = fs::absolute(t.workspace).lexically_normal();

        for (const auto& dir : cleanup.output_dirs) {
            if (std::find(t.purge_dirs.begin(), t.purge_dirs.end(), dir) == t.purge_dirs.end()) {
                t.purge_dirs.push_back(dir);
            }
        }
        resolved.push_back(std::move(t));
    }

    check_disjoint_workspaces(resolved);
    return resolved;
}

std::optional<TaskSpec> Config::find_tool(const std::string& name) const {
    for (const auto& t : tools) {
        if (t.name == name) return t;
    }
    return std::nullopt;
}

fs::path default_tools_root(const std::optional<fs::path>& config_path) {
    if (const char* env = std::getenv("BATCHTYPER_TOOLS_ROOT")) {
        if (*env) return fs::absolute(env);
    }
    if (config_path && config_path->has_parent_path()) {
        return fs::absolute(config_path->parent_path());
    }
    return fs::current_path();
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "run": {
      "type": "object",
      "properties": {
        "threads": {"type": "integer", "minimum": 1},
        "thread_policy": {"type": "string", "enum": ["fixed", "hardware"]}
      }
    },
    "input": {
      "type": "object",
      "properties": {
        "extensions": {"type": "array", "items": {"type": "string", "pattern": "^\\..+"}}
      }
    },
    "cleanup": {
      "type": "object",
      "properties": {
        "output_dirs": {"type": "array", "items": {"type": "string"}},
        "temp_patterns": {"type": "array", "items": {"type": "string"}}
      }
    },
    "tools": {
      "type": "array",
      "items": {
        "type": "object",
        "required": ["name"],
        "properties": {
          "name": {"type": "string"},
          "label": {"type": "string"},
          "description": {"type": "string"},
          "workspace": {"type": "string"},
          "executable": {"type": "string"},
          "args": {"type": "array", "items": {"type": "string"}},
          "required_files": {"type": "array", "items": {"type": "string"}},
          "accepts_pattern": {"type": "boolean"},
          "batch": {"type": "string", "enum": ["parallel", "exclusive", "post"]},
          "result_path": {"type": "string"},
          "require_nonempty_result": {"type": "boolean"},
          "purge_dirs": {"type": "array", "items": {"type": "string"}},
          "purge_temp_files": {"type": "boolean"},
          "warning_file": {"type": "string"},
          "warning_markers": {"type": "array", "items": {"type": "string"}},
          "stage_inputs": {"type": "boolean"},
          "enabled": {"type": "boolean"}
        }
      }
    }
  }
})";
}

} // namespace batchtyper::config
