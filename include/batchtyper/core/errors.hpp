#pragma once

#include <stdexcept>
#include <string>

namespace batchtyper {

class BatchTyperError : public std::runtime_error {
public:
    explicit BatchTyperError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public BatchTyperError {
public:
    explicit ConfigError(const std::string& message)
        : BatchTyperError("Config error: " + message) {}
};

class ValidationError : public BatchTyperError {
public:
    explicit ValidationError(const std::string& message)
        : BatchTyperError("Validation error: " + message) {}
};

class IOError : public BatchTyperError {
public:
    explicit IOError(const std::string& message)
        : BatchTyperError("I/O error: " + message) {}
};

// Input specifier names no file, directory or pattern.
class InputNotFound : public BatchTyperError {
public:
    explicit InputNotFound(const std::string& specifier)
        : BatchTyperError("Input not found: " + specifier) {}
};

class NoInputFiles : public BatchTyperError {
public:
    explicit NoInputFiles(const std::string& specifier)
        : BatchTyperError("No input files matched: " + specifier) {}
};

// Copy-in failure. Fatal for one task only.
class StageError : public IOError {
public:
    explicit StageError(const std::string& message)
        : IOError("Stage error: " + message) {}
};

// Tool missing or subprocess could not be launched. Fatal for one task only.
class ToolExecutionError : public BatchTyperError {
public:
    explicit ToolExecutionError(const std::string& message)
        : BatchTyperError("Tool execution error: " + message) {}
};

} // namespace batchtyper
