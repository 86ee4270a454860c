#include "batchtyper/core/console.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace batchtyper::core {

namespace {

std::mutex g_console_mutex;
std::atomic<bool> g_quiet{false};

void write_tagged(const std::string& tag, const std::string& prefix,
                  const std::string& message) {
    std::lock_guard<std::mutex> lock(g_console_mutex);
    std::cerr << "[" << tag << "] " << prefix << message << std::endl;
}

} // namespace

void Console::info(const std::string& tag, const std::string& message) {
    if (g_quiet.load()) return;
    write_tagged(tag, "", message);
}

void Console::success(const std::string& tag, const std::string& message) {
    if (g_quiet.load()) return;
    write_tagged(tag, "OK: ", message);
}

void Console::warning(const std::string& tag, const std::string& message) {
    write_tagged(tag, "Warning: ", message);
}

void Console::error(const std::string& tag, const std::string& message) {
    write_tagged(tag, "Error: ", message);
}

void Console::line(const std::string& text) {
    std::lock_guard<std::mutex> lock(g_console_mutex);
    std::cout << text << std::endl;
}

void Console::set_quiet(bool quiet) {
    g_quiet.store(quiet);
}

bool Console::quiet() {
    return g_quiet.load();
}

void Console::init_from_env() {
    const char* env = std::getenv("BATCHTYPER_QUIET");
    set_quiet(env != nullptr && std::string(env) == "1");
}

} // namespace batchtyper::core
