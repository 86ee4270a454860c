#pragma once

#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

namespace batchtyper::runner {

/**
 * JSONL event emission for one run.
 * Each event is written as a single line to the log file and, when
 * echo_stdout is set, to stdout. Safe to call from worker threads.
 */
class EventEmitter {
public:
    explicit EventEmitter(std::ofstream* log_file = nullptr, bool echo_stdout = false);

    void emit(const nlohmann::json& event);

    void run_start(const std::string& run_id, const nlohmann::json& data);
    void run_end(const std::string& run_id, bool success,
                 const nlohmann::json& data = nlohmann::json::object());
    void run_error(const std::string& run_id, const std::string& error);
    void run_interrupted(const std::string& run_id, int signal_number);

    void task_start(const std::string& run_id, const std::string& task, int threads,
                    const nlohmann::json& extra = nlohmann::json::object());
    void task_end(const std::string& run_id, const std::string& task,
                  const std::string& status, const nlohmann::json& extra = nlohmann::json::object());
    void task_skipped(const std::string& run_id, const std::string& task,
                      const std::string& reason);

    void cleanup_warning(const std::string& run_id, const std::string& workspace,
                         const std::string& message);
    void warning(const std::string& run_id, const std::string& message,
                 const nlohmann::json& extra = nlohmann::json::object());

private:
    std::ofstream* log_file_;
    bool echo_stdout_;
    std::mutex mutex_;

    nlohmann::json make_event(const std::string& type, const std::string& run_id) const;
};

} // namespace batchtyper::runner
