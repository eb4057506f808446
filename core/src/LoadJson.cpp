#include "readsync/core/util/LoadJson.hpp"

#include "readsync/core/util/Logging.hpp"

#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace readsync::json {

nlohmann::json load_json_file(const std::filesystem::path& path)
{
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("JSON file not found: " + path.string());
    }
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open JSON file: " + path.string());
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path.string() + ": " + e.what());
    }
}

void save_json_file(const std::filesystem::path& path, const nlohmann::json& value)
{
    std::filesystem::path tmp_path = path;
    tmp_path += ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot write JSON file: " + tmp_path.string());
        }
        out << value.dump(2);
        out.flush();
        if (!out) {
            throw std::runtime_error("Short write to JSON file: " + tmp_path.string());
        }
    }
    std::filesystem::rename(tmp_path, path);
}

std::optional<nlohmann::json> parse_or_none(const std::string& text, const std::string& context)
{
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        Logger()->warn("Ignoring malformed JSON in {}: {}", context, e.what());
        return std::nullopt;
    }
}

void require_fields(
    const nlohmann::json& json,
    std::initializer_list<const char*> fields,
    const std::string& context)
{
    if (!json.is_object()) {
        throw std::runtime_error(context + " is not a JSON object");
    }
    for (const char* field : fields) {
        if (!json.contains(field)) {
            throw std::runtime_error(context + " missing required field: " + field);
        }
    }
}

double number_or(const nlohmann::json* m, const char* key, double def) {
    if (!m || !m->is_object()) return def;
    auto it = m->find(key);
    if (it == m->end()) return def;
    if (it->is_number_float())   return it->get<double>();
    if (it->is_number_integer()) return static_cast<double>(it->get<int64_t>());
    if (it->is_string()) {
        try { return std::stod(it->get<std::string>()); } catch (const std::logic_error&) { return def; }
    }
    return def;
}

int64_t integer_or(const nlohmann::json* m, const char* key, int64_t def) {
    if (!m || !m->is_object()) return def;
    auto it = m->find(key);
    if (it == m->end()) return def;
    if (it->is_number_integer()) return it->get<int64_t>();
    if (it->is_number_float()) {
        double v = it->get<double>();
        return std::isfinite(v) ? static_cast<int64_t>(v) : def;
    }
    if (it->is_string()) {
        try { return std::stoll(it->get<std::string>()); } catch (const std::logic_error&) { return def; }
    }
    return def;
}

std::string string_or(const nlohmann::json* m, const char* key, const std::string& def) {
    if (!m || !m->is_object()) return def;
    auto it = m->find(key);
    if (it != m->end() && it->is_string()) return it->get<std::string>();
    return def;
}

} // namespace readsync::json
