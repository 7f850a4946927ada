#include "config.hpp"
#include "exception.hpp"
#include "http_client.hpp"
#include "localization.hpp"
#include "mirror_selector.hpp"
#include "plugin_downloader.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help() << std::endl;
}

void print_plan(const std::vector<PlannedDownload>& downloads, const fs::path& output_dir) {
    if (downloads.empty()) {
        log_info(get_string("info.plan_empty"));
        return;
    }
    log_info(string_format("info.plan_header", downloads.size(), output_dir.string()));
    for (const auto& item : downloads) {
        std::cout << "    " << item.name << " " << item.version << std::endl;
    }
}

int main(int argc, char* argv[]) {
    try {
        init_localization();
        CurlGlobalInitializer curl_initializer;

        cxxopts::Options options(argv[0], get_string("info.description"));
        options.custom_help(get_string("info.usage"));
        options.positional_help(get_string("help.plugin"));
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("help.help"))
            ("v,version", get_string("help.version"), cxxopts::value<std::string>())
            ("o,output-dir", get_string("help.output_dir"), cxxopts::value<std::string>()->default_value(std::string(DEFAULT_OUTPUT_DIR)))
            ("m,mirror", get_string("help.mirror"), cxxopts::value<std::vector<std::string>>())
            ("catalog-url", get_string("help.catalog_url"), cxxopts::value<std::string>()->default_value(std::string(DEFAULT_CATALOG_URL)))
            ("config-dir", get_string("help.config_dir"), cxxopts::value<std::string>())
            ("n,dry-run", get_string("help.dry_run"), cxxopts::value<bool>()->default_value("false"))
            ("q,quiet", get_string("help.quiet"), cxxopts::value<bool>()->default_value("false"))
            ("plugin", "", cxxopts::value<std::string>());

        options.parse_positional({"plugin"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        if (!result.count("plugin")) {
            print_usage(options);
            return 1;
        }

        set_quiet_mode(result["quiet"].as<bool>());

        if (result.count("config-dir")) {
            set_config_dir(result["config-dir"].as<std::string>());
        }

        std::vector<std::string> mirror_urls;
        if (result.count("mirror")) {
            mirror_urls = normalize_mirror_urls(result["mirror"].as<std::vector<std::string>>());
        } else {
            mirror_urls = get_mirror_urls();
        }

        std::optional<std::string> version;
        if (result.count("version")) {
            version = result["version"].as<std::string>();
        }

        const std::string plugin = result["plugin"].as<std::string>();
        const fs::path output_dir = result["output-dir"].as<std::string>();

        CurlHttpClient client(CONNECT_TIMEOUT_SECONDS, STALL_TIMEOUT_SECONDS);
        MirrorSelector mirrors(mirror_urls);
        DownloadPolicy policy;
        policy.show_progress = !get_quiet_mode();

        PluginDownloader downloader(client, mirrors, output_dir, result["catalog-url"].as<std::string>(), policy);

        if (result["dry-run"].as<bool>()) {
            print_plan(downloader.plan(plugin, version), output_dir);
            return 0;
        }

        downloader.download_with_dependencies(plugin, version);
        log_info(string_format("info.download_complete", plugin));
        log_info(string_format("info.download_location", fs::absolute(output_dir).string()));

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const HpiError& e) {
        log_error(e.what());
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }

    return 0;
}
