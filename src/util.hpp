#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace glmextract {

// ISO 8601 timestamp
std::string timestamp_now();

// Trim whitespace
std::string trim(const std::string& s);

// Generate a simple unique ID (hex)
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename so readers never see a partial file.
// Creates missing parent directories. Returns false on failure.
bool atomic_write_file(const std::string& path, const std::string& content);

// Strip a surrounding Markdown code fence (```json ... ```), if any.
std::string strip_code_fence(const std::string& text);

} // namespace glmextract
