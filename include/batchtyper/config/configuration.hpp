#pragma once

#include "batchtyper/core/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace batchtyper::config {

namespace fs = std::filesystem;

struct RunConfig {
  int threads = 2;
  std::string thread_policy = "fixed"; // fixed | hardware
};

struct InputConfig {
  std::vector<std::string> extensions{".fna", ".fasta", ".fa", ".fsa"};
};

struct CleanupConfig {
  // Tool-generated directory names removed from every workspace.
  std::vector<std::string> output_dirs{
      "mlst_results",          "results",
      "SerotypeFinder_results", "chtyper_results",
      "phylogrouping_results", "ecoli_abricate_results",
      "ecoli_amrfinder_results"};
  std::vector<std::string> temp_patterns{"*.txt",   "*.log",  "*.tmp",
                                         "temp_*",  "*.html", "*.tsv"};
};

struct Config {
  RunConfig run;
  InputConfig input;
  CleanupConfig cleanup;
  std::vector<TaskSpec> tools;

  // Built-in tool catalogue with workspaces relative to the tools root.
  static Config defaults();
  static std::vector<TaskSpec> builtin_tools();

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;

  // Tool specs ready to run: workspaces absolute, global purge list merged.
  // Throws ValidationError when two enabled tools resolve to overlapping
  // workspaces.
  std::vector<TaskSpec> resolve_tasks(const fs::path &tools_root) const;

  std::optional<TaskSpec> find_tool(const std::string &name) const;
};

// BATCHTYPER_TOOLS_ROOT, else the config file's directory, else cwd.
fs::path default_tools_root(const std::optional<fs::path> &config_path);

std::string get_schema_json();

} // namespace batchtyper::config
