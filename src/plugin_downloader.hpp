#pragma once

#include "catalog.hpp"
#include "config.hpp"
#include "downloader.hpp"
#include "http_client.hpp"
#include "mirror_selector.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

struct PlannedDownload {
    std::string name;
    std::string version;
};

// Downloads a plugin and its required dependencies into one directory.
// Holds the run state: the catalog (fetched once) and the set of plugins
// already written in this run.
class PluginDownloader {
public:
    PluginDownloader(HttpClient& client, MirrorSelector& mirrors, std::filesystem::path output_dir,
                     std::string catalog_url = std::string(DEFAULT_CATALOG_URL), DownloadPolicy policy = {});

    // Fetches the update center unless it is already loaded.
    // Throws CatalogFetchError.
    void load_catalog();

    // What download_with_dependencies would fetch, dependencies first and
    // the plugin itself last. Plugins already downloaded in this run are left out.
    std::vector<PlannedDownload> plan(const std::string& plugin, const std::optional<std::string>& version = std::nullopt);

    // Throws CatalogFetchError, NotFoundError or DownloadError.
    void download_with_dependencies(const std::string& plugin, const std::optional<std::string>& version = std::nullopt);

    bool is_downloaded(const std::string& plugin) const { return downloaded_.contains(plugin); }
    const std::vector<std::string>& download_order() const { return download_order_; }
    const Catalog& catalog() const { return catalog_; }
    const std::filesystem::path& output_dir() const { return output_dir_; }
    std::filesystem::path artifact_file(const std::string& plugin) const;

private:
    void download_single(const PlannedDownload& item);

    HttpClient& client_;
    std::filesystem::path output_dir_;
    std::string catalog_url_;
    Catalog catalog_;
    DownloadEngine engine_;
    std::unordered_set<std::string> downloaded_;
    std::vector<std::string> download_order_;
};
