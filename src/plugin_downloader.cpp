#include "plugin_downloader.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "resolver.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

PluginDownloader::PluginDownloader(HttpClient& client, MirrorSelector& mirrors, fs::path output_dir,
                                   std::string catalog_url, DownloadPolicy policy)
    : client_(client),
      output_dir_(std::move(output_dir)),
      catalog_url_(std::move(catalog_url)),
      engine_(client, mirrors, std::move(policy)) {}

void PluginDownloader::load_catalog() {
    if (catalog_.loaded()) {
        return;
    }

    log_info(string_format("info.fetching_catalog", catalog_url_));
    std::string payload;
    try {
        payload = client_.fetch_text(catalog_url_);
    } catch (const HpiError& e) {
        throw CatalogFetchError(e.what());
    }
    catalog_.populate(parse_update_center(payload));
    log_info(string_format("info.catalog_loaded", catalog_.size()));
}

fs::path PluginDownloader::artifact_file(const std::string& plugin) const {
    return output_dir_ / (plugin + ".hpi");
}

std::vector<PlannedDownload> PluginDownloader::plan(const std::string& plugin, const std::optional<std::string>& version) {
    load_catalog();

    const PluginRecord& record = catalog_.at(plugin);
    const std::string root_version = version.value_or(record.version);

    log_info(string_format("info.resolving_deps", plugin));
    std::vector<PlannedDownload> downloads;
    for (const auto& dep : resolve_dependencies(catalog_, plugin)) {
        // A version can only be chosen for plugins the catalog lists.
        const PluginRecord* dep_record = catalog_.find(dep);
        if (!dep_record) {
            throw NotFoundError(string_format("error.dependency_not_found", dep, plugin));
        }
        if (!is_downloaded(dep)) {
            downloads.push_back({dep, dep_record->version});
        }
    }

    if (!is_downloaded(plugin)) {
        downloads.push_back({plugin, root_version});
    }
    return downloads;
}

void PluginDownloader::download_with_dependencies(const std::string& plugin, const std::optional<std::string>& version) {
    const auto downloads = plan(plugin, version);
    if (downloads.empty()) {
        log_info(string_format("info.already_downloaded", plugin));
        return;
    }

    ensure_dir_exists(output_dir_);

    size_t completed = 0;
    try {
        for (const auto& item : downloads) {
            download_single(item);
            ++completed;
        }
    } catch (const DownloadError&) {
        log_error(string_format("error.partial_download", completed, downloads.size()));
        throw;
    }
}

void PluginDownloader::download_single(const PlannedDownload& item) {
    if (is_downloaded(item.name)) {
        return;
    }

    engine_.fetch(item.name, item.version, artifact_file(item.name));

    downloaded_.insert(item.name);
    download_order_.push_back(item.name);
    log_info(string_format("info.plugin_downloaded", item.name, item.version));
}
