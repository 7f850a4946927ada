#include "catalog.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace {

constexpr std::string_view UPDATE_CENTER_PREFIX = "updateCenter.post(";

PluginRecord parse_plugin(const std::string& key, const json& entry) {
    if (!entry.is_object()) {
        throw CatalogFetchError(string_format("error.catalog_bad_entry", key));
    }
    auto version = entry.find("version");
    if (version == entry.end() || !version->is_string()) {
        throw CatalogFetchError(string_format("error.catalog_bad_entry", key));
    }

    PluginRecord record;
    record.name = key;
    record.version = version->get<std::string>();

    auto deps = entry.find("dependencies");
    if (deps == entry.end() || deps->is_null()) {
        return record;
    }
    if (!deps->is_array()) {
        throw CatalogFetchError(string_format("error.catalog_bad_entry", key));
    }
    for (const auto& dep : *deps) {
        auto name = dep.find("name");
        if (!dep.is_object() || name == dep.end() || !name->is_string()) {
            throw CatalogFetchError(string_format("error.catalog_bad_entry", key));
        }
        DependencyRef ref;
        ref.name = name->get<std::string>();
        ref.optional = dep.value("optional", false);
        record.dependencies.push_back(std::move(ref));
    }
    return record;
}

} // anonymous namespace

void Catalog::populate(PluginMap plugins) {
    if (loaded_) {
        throw HpiError(get_string("error.catalog_already_loaded"));
    }
    plugins_ = std::move(plugins);
    loaded_ = true;
}

bool Catalog::contains(const std::string& name) const {
    return plugins_.find(name) != plugins_.end();
}

const PluginRecord* Catalog::find(const std::string& name) const {
    auto it = plugins_.find(name);
    return it == plugins_.end() ? nullptr : &it->second;
}

const PluginRecord& Catalog::at(const std::string& name) const {
    const PluginRecord* record = find(name);
    if (!record) {
        throw NotFoundError(string_format("error.plugin_not_found", name));
    }
    return *record;
}

const std::vector<DependencyRef>& Catalog::dependencies_of(const std::string& name) const {
    static const std::vector<DependencyRef> none;
    const PluginRecord* record = find(name);
    return record ? record->dependencies : none;
}

std::string_view unwrap_update_center(std::string_view payload) {
    size_t start = payload.find(UPDATE_CENTER_PREFIX);
    if (start == std::string_view::npos) {
        return payload;
    }
    payload.remove_prefix(start + UPDATE_CENTER_PREFIX.size());
    size_t end = payload.find_last_of(')');
    if (end == std::string_view::npos) {
        throw CatalogFetchError(get_string("error.catalog_bad_wrapper"));
    }
    return payload.substr(0, end);
}

Catalog::PluginMap parse_update_center(std::string_view payload) {
    std::string_view body = unwrap_update_center(payload);

    json document = json::parse(body.begin(), body.end(), nullptr, false);
    if (document.is_discarded()) {
        throw CatalogFetchError(get_string("error.catalog_bad_json"));
    }
    auto plugins = document.find("plugins");
    if (plugins == document.end() || !plugins->is_object()) {
        throw CatalogFetchError(get_string("error.catalog_no_plugins"));
    }

    Catalog::PluginMap result;
    result.reserve(plugins->size());
    try {
        for (auto it = plugins->begin(); it != plugins->end(); ++it) {
            result.emplace(it.key(), parse_plugin(it.key(), it.value()));
        }
    } catch (const json::exception& e) {
        throw CatalogFetchError(string_format("error.catalog_bad_json_detail", e.what()));
    }
    return result;
}
