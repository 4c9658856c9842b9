#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace sde {

/// Key -> JSON document store. Keys look like "stock-data/daily/AAPL.json".
///
/// Reads throw StorageError when the backend fails; a missing key is not
/// an error. Writes and deletes report failure through their return value.
class BlobStore {
public:
    virtual ~BlobStore() = default;

    virtual std::optional<nlohmann::json> get_json(const std::string& key) = 0;
    virtual bool put_json(const std::string& key, const nlohmann::json& value) = 0;
    virtual bool exists(const std::string& key) = 0;
    virtual bool remove(const std::string& key) = 0;

    /// Keys starting with `prefix`, sorted.
    virtual std::vector<std::string> list(const std::string& prefix) = 0;
};

} // namespace sde
