// diagnostics_json.hpp - JSON serialization for LoadResult diagnostics
#pragma once
#include "fieldmeta/loader.hpp"
#include <string>

namespace fieldmeta {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize diagnostics to a compact JSON string.
std::string diagnostics_to_json(const LoadResult& r);

// If env.diagJson is set, print diagnostics JSON to stderr.
void maybe_print_json(const LoadResult& r, const LoaderEnv& env);

} // namespace fieldmeta
