#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace readsync {

// Synchronous local key/value storage of JSON values.
class IKeyValueStore {
public:
    virtual ~IKeyValueStore() = default;

    virtual std::optional<nlohmann::json> get(const std::string& key) const = 0;
    virtual void set(const std::string& key, const nlohmann::json& value) = 0;
    virtual void remove(const std::string& key) = 0;
};

} // namespace readsync
