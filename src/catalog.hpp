#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

struct DependencyRef {
    std::string name;
    bool optional = false;
};

struct PluginRecord {
    std::string name;
    std::string version;
    std::vector<DependencyRef> dependencies;
};

// Plugin metadata from the update center. Empty until populated, then
// read-only for the rest of the process.
class Catalog {
public:
    using PluginMap = std::unordered_map<std::string, PluginRecord>;

    // Throws HpiError when the catalog has already been populated.
    void populate(PluginMap plugins);

    bool loaded() const { return loaded_; }
    size_t size() const { return plugins_.size(); }
    bool contains(const std::string& name) const;

    // nullptr for unknown plugins
    const PluginRecord* find(const std::string& name) const;

    // Throws NotFoundError for unknown plugins.
    const PluginRecord& at(const std::string& name) const;

    // Empty for unknown plugins.
    const std::vector<DependencyRef>& dependencies_of(const std::string& name) const;

private:
    PluginMap plugins_;
    bool loaded_ = false;
};

// Extracts the JSON document from an update-center.json payload
// ("updateCenter.post(\n{...}\n);"). Unwrapped JSON is returned unchanged.
std::string_view unwrap_update_center(std::string_view payload);

// Throws CatalogFetchError when the payload is not a valid update center.
Catalog::PluginMap parse_update_center(std::string_view payload);
