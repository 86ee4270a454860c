#include "batchtyper/io/fileset.hpp"
#include "batchtyper/core/errors.hpp"
#include "batchtyper/core/utils.hpp"

#include <algorithm>
#include <iterator>
#include <set>

namespace batchtyper::io {

namespace {

bool is_hidden(const fs::path& p) {
    const std::string name = p.filename().string();
    return !name.empty() && name[0] == '.';
}

InputFile make_input(const fs::path& p) {
    InputFile f;
    f.path = fs::absolute(p).lexically_normal();
    f.extension = core::to_lower(p.extension().string());
    return f;
}

void finalize(InputSet& inputs) {
    std::sort(inputs.begin(), inputs.end());
    inputs.erase(std::unique(inputs.begin(), inputs.end()), inputs.end());
}

// Expands each wildcard component in turn; literal components are appended.
void expand_components(const fs::path& base,
                       std::vector<std::string>::const_iterator it,
                       std::vector<std::string>::const_iterator end,
                       std::vector<fs::path>& out) {
    if (it == end) {
        out.push_back(base);
        return;
    }

    const std::string& component = *it;
    if (!core::has_wildcard(component)) {
        fs::path next = base / component;
        std::error_code ec;
        if (std::next(it) == end ? fs::exists(next, ec) : fs::is_directory(next, ec)) {
            expand_components(next, std::next(it), end, out);
        }
        return;
    }

    for (const auto& match : core::glob(base, component)) {
        std::error_code ec;
        if (std::next(it) != end && !fs::is_directory(match, ec)) {
            continue;
        }
        expand_components(match, std::next(it), end, out);
    }
}

std::vector<fs::path> expand_wildcard(const std::string& specifier) {
    fs::path spec(specifier);
    fs::path base = spec.is_absolute() ? spec.root_path() : fs::path(".");

    std::vector<std::string> components;
    for (const auto& part : spec.relative_path()) {
        const std::string s = part.string();
        if (!s.empty()) components.push_back(s);
    }

    std::vector<fs::path> out;
    expand_components(base, components.cbegin(), components.cend(), out);
    return out;
}

} // namespace

bool has_recognized_extension(const fs::path& path,
                              const std::vector<std::string>& extensions) {
    const std::string ext = core::to_lower(path.extension().string());
    for (const auto& e : extensions) {
        if (core::to_lower(e) == ext) return true;
    }
    return false;
}

InputSet resolve_inputs(const std::string& specifier,
                        const std::vector<std::string>& extensions) {
    InputSet inputs;

    if (specifier.find_first_of("*?") != std::string::npos) {
        for (const auto& p : expand_wildcard(specifier)) {
            std::error_code ec;
            if (!fs::is_regular_file(p, ec)) continue;
            if (is_hidden(p)) continue;
            if (!has_recognized_extension(p, extensions)) continue;
            inputs.push_back(make_input(p));
        }
        finalize(inputs);
        return inputs;
    }

    const fs::path p(specifier);
    std::error_code ec;

    if (fs::is_regular_file(p, ec)) {
        if (!has_recognized_extension(p, extensions)) {
            throw InputNotFound(specifier + " (unrecognized extension)");
        }
        inputs.push_back(make_input(p));
        return inputs;
    }

    if (fs::is_directory(p, ec)) {
        for (const auto& ext : extensions) {
            for (const auto& match : core::glob(p, "*" + ext)) {
                if (!fs::is_regular_file(match, ec)) continue;
                inputs.push_back(make_input(match));
            }
        }
        finalize(inputs);
        return inputs;
    }

    throw InputNotFound(specifier);
}

std::string derive_file_pattern(const InputSet& inputs,
                                const std::string& fallback_extension) {
    if (inputs.empty()) {
        return "*" + fallback_extension;
    }

    std::set<std::string> exts;
    for (const auto& f : inputs) {
        exts.insert(f.extension);
    }
    if (exts.size() == 1) {
        return "*" + *exts.begin();
    }
    return "*";
}

std::vector<std::string> detected_extensions(const InputSet& inputs) {
    std::vector<std::string> exts;
    for (const auto& f : inputs) {
        if (std::find(exts.begin(), exts.end(), f.extension) == exts.end()) {
            exts.push_back(f.extension);
        }
    }
    return exts;
}

} // namespace batchtyper::io
