#include "readsync/core/types/JsonFileStore.hpp"

#include "readsync/core/util/LoadJson.hpp"
#include "readsync/core/util/Logging.hpp"

namespace readsync {

JsonFileStore::JsonFileStore(std::filesystem::path path)
    : _path(std::move(path))
    , _json(nlohmann::json::object())
{
    if (!std::filesystem::exists(_path)) return;

    try {
        auto loaded = json::load_json_file(_path);
        if (loaded.is_object()) {
            _json = std::move(loaded);
        } else {
            Logger()->warn("{} does not hold a JSON object, starting empty", _path.string());
        }
    } catch (const std::runtime_error& e) {
        Logger()->warn("Starting with an empty store: {}", e.what());
    }
}

std::optional<nlohmann::json> JsonFileStore::get(const std::string& key) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _json.find(key);
    if (it == _json.end()) return std::nullopt;
    return *it;
}

void JsonFileStore::set(const std::string& key, const nlohmann::json& value)
{
    std::lock_guard<std::mutex> lock(_mutex);
    _json[key] = value;
    save();
}

void JsonFileStore::remove(const std::string& key)
{
    std::lock_guard<std::mutex> lock(_mutex);
    if (_json.erase(key) == 0) return;
    save();
}

void JsonFileStore::save() const
{
    if (_path.has_parent_path()) {
        std::filesystem::create_directories(_path.parent_path());
    }
    json::save_json_file(_path, _json);
}

} // namespace readsync
