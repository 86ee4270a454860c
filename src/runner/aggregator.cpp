#include "batchtyper/runner/aggregator.hpp"

namespace batchtyper::runner {

RunSummary summarize(const ResultSet& results) {
    RunSummary s;
    for (const auto& [name, r] : results) {
        switch (r.status) {
            case TaskStatus::Success:
                ++s.succeeded;
                break;
            case TaskStatus::SuccessWithWarnings:
                ++s.succeeded;
                ++s.with_warnings;
                break;
            case TaskStatus::Failed:
                ++s.failed;
                break;
            case TaskStatus::Skipped:
                ++s.skipped;
                break;
        }
    }
    s.total = s.succeeded + s.failed;
    s.all_succeeded = s.succeeded == s.total;
    return s;
}

std::string summary_line(const RunSummary& summary) {
    if (summary.all_succeeded) {
        return "All " + std::to_string(summary.total) + " analyses completed successfully";
    }
    return std::to_string(summary.succeeded) + "/" + std::to_string(summary.total) +
           " analyses completed successfully";
}

nlohmann::json summary_to_json(const RunSummary& summary) {
    nlohmann::json j;
    j["succeeded"] = summary.succeeded;
    j["total"] = summary.total;
    j["with_warnings"] = summary.with_warnings;
    j["failed"] = summary.failed;
    j["skipped"] = summary.skipped;
    j["all_succeeded"] = summary.all_succeeded;
    return j;
}

} // namespace batchtyper::runner
