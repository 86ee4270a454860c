#include "batchtyper/runner/events.hpp"
#include "batchtyper/core/utils.hpp"

#include <iostream>

namespace batchtyper::runner {

namespace {

void merge_into(nlohmann::json& event, const nlohmann::json& extra) {
    if (!extra.empty() && extra.is_object()) {
        for (auto& [key, value] : extra.items()) {
            event[key] = value;
        }
    }
}

} // namespace

EventEmitter::EventEmitter(std::ofstream* log_file, bool echo_stdout)
    : log_file_(log_file), echo_stdout_(echo_stdout) {}

nlohmann::json EventEmitter::make_event(const std::string& type,
                                        const std::string& run_id) const {
    nlohmann::json event;
    event["type"] = type;
    event["run_id"] = run_id;
    event["ts"] = core::get_iso_timestamp();
    return event;
}

void EventEmitter::emit(const nlohmann::json& event) {
    std::string line = event.dump();

    std::lock_guard<std::mutex> lock(mutex_);
    if (echo_stdout_) {
        std::cout << line << std::endl;
    }

    if (log_file_ && log_file_->is_open()) {
        (*log_file_) << line << std::endl;
        log_file_->flush();
    }
}

void EventEmitter::run_start(const std::string& run_id, const nlohmann::json& data) {
    nlohmann::json event = make_event("run_start", run_id);
    merge_into(event, data);
    emit(event);
}

void EventEmitter::run_end(const std::string& run_id, bool success, const nlohmann::json& data) {
    nlohmann::json event = make_event("run_end", run_id);
    event["success"] = success;
    event["status"] = success ? "ok" : "partial";
    merge_into(event, data);
    emit(event);
}

void EventEmitter::run_error(const std::string& run_id, const std::string& error) {
    nlohmann::json event = make_event("run_error", run_id);
    event["error"] = error;
    emit(event);
}

void EventEmitter::run_interrupted(const std::string& run_id, int signal_number) {
    nlohmann::json event = make_event("run_interrupted", run_id);
    event["signal"] = signal_number;
    event["exit_code"] = 128 + signal_number;
    emit(event);
}

void EventEmitter::task_start(const std::string& run_id, const std::string& task,
                              int threads, const nlohmann::json& extra) {
    nlohmann::json event = make_event("task_start", run_id);
    event["task"] = task;
    event["threads"] = threads;
    merge_into(event, extra);
    emit(event);
}

void EventEmitter::task_end(const std::string& run_id, const std::string& task,
                            const std::string& status, const nlohmann::json& extra) {
    nlohmann::json event = make_event("task_end", run_id);
    event["task"] = task;
    event["status"] = status;
    merge_into(event, extra);
    emit(event);
}

void EventEmitter::task_skipped(const std::string& run_id, const std::string& task,
                                const std::string& reason) {
    nlohmann::json event = make_event("task_skipped", run_id);
    event["task"] = task;
    event["reason"] = reason;
    emit(event);
}

void EventEmitter::cleanup_warning(const std::string& run_id, const std::string& workspace,
                                   const std::string& message) {
    nlohmann::json event = make_event("cleanup_warning", run_id);
    event["workspace"] = workspace;
    event["message"] = message;
    emit(event);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message,
                           const nlohmann::json& extra) {
    nlohmann::json event = make_event("warning", run_id);
    event["message"] = message;
    merge_into(event, extra);
    emit(event);
}

} // namespace batchtyper::runner
