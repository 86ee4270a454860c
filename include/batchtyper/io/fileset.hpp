#pragma once

#include "batchtyper/core/types.hpp"

#include <string>
#include <vector>

namespace batchtyper::io {

// Expands a file, directory or wildcard specifier into a sorted, duplicate-free
// InputSet. Throws InputNotFound when the specifier names nothing.
InputSet resolve_inputs(const std::string& specifier,
                        const std::vector<std::string>& extensions);

// "*<ext>" when every input shares one extension, otherwise "*".
std::string derive_file_pattern(const InputSet& inputs,
                                const std::string& fallback_extension = ".fna");

bool has_recognized_extension(const fs::path& path,
                              const std::vector<std::string>& extensions);

// Distinct extensions in input order, for display.
std::vector<std::string> detected_extensions(const InputSet& inputs);

} // namespace batchtyper::io
