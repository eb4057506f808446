#pragma once

#include <filesystem>
#include <mutex>

#include <nlohmann/json.hpp>

#include "readsync/core/types/IKeyValueStore.hpp"

namespace readsync {

/**
 * @brief IKeyValueStore persisted as a single JSON object file
 *
 * The file is read once on construction (a missing file is an empty store)
 * and rewritten through a temporary file on every mutation. Write failures
 * throw std::runtime_error; they are treated as fatal by callers.
 */
class JsonFileStore final : public IKeyValueStore
{
public:
    explicit JsonFileStore(std::filesystem::path path);

    std::optional<nlohmann::json> get(const std::string& key) const override;
    void set(const std::string& key, const nlohmann::json& value) override;
    void remove(const std::string& key) override;

    [[nodiscard]] std::filesystem::path path() const { return _path; }

private:
    std::filesystem::path _path;
    mutable std::mutex _mutex;
    nlohmann::json _json;

    void save() const;
};

} // namespace readsync
