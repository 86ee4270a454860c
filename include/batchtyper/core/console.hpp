#pragma once

#include <string>

namespace batchtyper::core {

/**
 * Serialized console output.
 * Diagnostic lines go to stderr as "[TAG] message"; plan and summary lines
 * go to stdout. One process-wide mutex guards both streams.
 */
class Console {
public:
    static void info(const std::string& tag, const std::string& message);
    static void success(const std::string& tag, const std::string& message);
    static void warning(const std::string& tag, const std::string& message);
    static void error(const std::string& tag, const std::string& message);

    // Unprefixed stdout line.
    static void line(const std::string& text);

    static void set_quiet(bool quiet);
    static bool quiet();

    // Reads BATCHTYPER_QUIET from the environment.
    static void init_from_env();
};

} // namespace batchtyper::core
