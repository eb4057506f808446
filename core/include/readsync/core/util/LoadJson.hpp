// LoadJson.hpp - JSON loading and safe access utilities
#pragma once

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>

namespace readsync::json {

nlohmann::json load_json_file(const std::filesystem::path& path);

// Write `value` to `path` through a sibling ".tmp" file and a rename, so a
// reader never sees a half-written document.
void save_json_file(const std::filesystem::path& path, const nlohmann::json& value);

// Parse `text`; returns nullopt and logs a warning naming `context` on
// malformed input.
std::optional<nlohmann::json> parse_or_none(const std::string& text, const std::string& context);

/**
 * Ensure all required fields exist in a JSON object.
 * @param json The JSON object to validate
 * @param fields List of required field names
 * @param context Description for error messages (e.g., file path)
 * @throws std::runtime_error listing the first missing field
 */
void require_fields(
    const nlohmann::json& json,
    std::initializer_list<const char*> fields,
    const std::string& context);

// ============ SAFE ACCESS HELPERS ============

// Returns a number if present (float/int or string convertible), else def.
double number_or(const nlohmann::json* m, const char* key, double def);

// Integer variant of number_or; floats are truncated.
int64_t integer_or(const nlohmann::json* m, const char* key, int64_t def);

// Returns a string if present and of string type, else def.
std::string string_or(const nlohmann::json* m, const char* key, const std::string& def);

} // namespace readsync::json
