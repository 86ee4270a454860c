#include "batchtyper/runner/manifest.hpp"
#include "batchtyper/core/errors.hpp"
#include "batchtyper/core/utils.hpp"

#include <chrono>
#include <fstream>

namespace batchtyper::runner {

nlohmann::json input_set_to_json(const InputSet& inputs, bool with_checksums) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& f : inputs) {
        nlohmann::json j;
        j["path"] = f.path.string();
        j["name"] = f.name();
        j["extension"] = f.extension;
        std::error_code ec;
        auto size = fs::file_size(f.path, ec);
        j["size_bytes"] = ec ? nlohmann::json(nullptr) : nlohmann::json(size);
        if (with_checksums) {
            j["sha256"] = core::sha256_file(f.path);
        }
        arr.push_back(j);
    }
    return arr;
}

nlohmann::json task_result_to_json(const TaskResult& r) {
    nlohmann::json j;
    j["status"] = task_status_to_string(r.status);
    j["exit_code"] = r.exit_code;
    j["threads"] = r.threads;
    j["error"] = r.error;
    j["stderr_excerpt"] = r.stderr_excerpt;
    j["warnings"] = r.warnings;
    j["output_dir"] = r.output_dir ? nlohmann::json(r.output_dir->string()) : nlohmann::json(nullptr);
    if (r.started != Clock::time_point{}) {
        j["started_at"] = core::format_iso_timestamp(r.started);
        j["finished_at"] = core::format_iso_timestamp(r.finished);
        j["duration_s"] = std::chrono::duration<double>(r.finished - r.started).count();
    }
    return j;
}

nlohmann::json build_manifest(const RunInfo& info, const InputSet& inputs,
                              const ResultSet& results, const RunSummary& summary,
                              bool with_checksums) {
    nlohmann::json m;
    m["run_id"] = info.run_id;
    m["started_at"] = info.started_at;
    m["finished_at"] = info.finished_at;
    m["input_specifier"] = info.input_specifier;
    m["output_root"] = info.output_root.string();
    m["pattern"] = info.pattern;
    m["threads"] = info.threads;
    m["inputs"] = input_set_to_json(inputs, with_checksums);

    nlohmann::json tasks = nlohmann::json::object();
    for (const auto& [name, r] : results) {
        tasks[name] = task_result_to_json(r);
    }
    m["tasks"] = tasks;
    m["summary"] = summary_to_json(summary);
    return m;
}

fs::path write_manifest(const fs::path& output_root, const nlohmann::json& manifest) {
    const fs::path path = output_root / "run_manifest.json";
    std::ofstream out(path);
    if (!out) {
        throw IOError("Cannot write manifest: " + path.string());
    }
    out << manifest.dump(2) << "\n";
    return path;
}

} // namespace batchtyper::runner
