#pragma once

#include "batchtyper/core/types.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace batchtyper::runner {

struct RunSummary {
    int succeeded = 0;       // Success + SuccessWithWarnings
    int total = 0;           // everything that was not skipped
    int with_warnings = 0;
    int failed = 0;
    int skipped = 0;
    bool all_succeeded = true;
};

RunSummary summarize(const ResultSet& results);

// "All N analyses completed successfully" or "K/N analyses completed successfully".
std::string summary_line(const RunSummary& summary);

nlohmann::json summary_to_json(const RunSummary& summary);

} // namespace batchtyper::runner
