#pragma once

#include "batchtyper/core/types.hpp"
#include "batchtyper/runner/aggregator.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace batchtyper::runner {

struct RunInfo {
    std::string run_id;
    std::string input_specifier;
    fs::path output_root;
    std::string pattern;
    int threads = 1;
    std::string started_at;
    std::string finished_at;
};

nlohmann::json input_set_to_json(const InputSet& inputs, bool with_checksums);
nlohmann::json task_result_to_json(const TaskResult& result);

nlohmann::json build_manifest(const RunInfo& info, const InputSet& inputs,
                              const ResultSet& results, const RunSummary& summary,
                              bool with_checksums = true);

// Writes <output_root>/run_manifest.json.
fs::path write_manifest(const fs::path& output_root, const nlohmann::json& manifest);

} // namespace batchtyper::runner
