#include "downloader.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <fstream>

namespace fs = std::filesystem;

namespace {

// Writes the streamed artifact and watches its throughput.
class ArtifactWriter : public TransferObserver {
public:
    ArtifactWriter(std::ofstream& out, const DownloadPolicy& policy, const std::string& label)
        : out_(out), policy_(policy), monitor_(policy), label_(label) {}

    void on_body_start() override {
        monitor_.start();
    }

    bool on_data(std::string_view chunk) override {
        out_.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        if (!out_.good()) {
            write_failed_ = true;
            return false;
        }
        if (!monitor_.add_bytes(chunk.size())) {
            degraded_ = true;
            return false;
        }
        return true;
    }

    bool on_tick(std::uint64_t expected_total) override {
        if (policy_.show_progress && expected_total > 0) {
            double percentage = static_cast<double>(monitor_.total_bytes()) / static_cast<double>(expected_total) * 100.0;
            log_progress(label_ + " (" + format_bytes(expected_total) + ")", percentage);
        }
        if (!monitor_.check()) {
            degraded_ = true;
            return false;
        }
        return true;
    }

    bool degraded() const { return degraded_; }
    bool write_failed() const { return write_failed_; }
    std::uint64_t bytes_written() const { return monitor_.total_bytes(); }
    double last_rate() const { return monitor_.last_rate(); }

private:
    std::ofstream& out_;
    const DownloadPolicy& policy_;
    SpeedMonitor monitor_;
    std::string label_;
    bool degraded_ = false;
    bool write_failed_ = false;
};

} // anonymous namespace

SpeedMonitor::SpeedMonitor(const DownloadPolicy& policy)
    : policy_(policy) {}

void SpeedMonitor::start() {
    if (started_) {
        return;
    }
    started_ = true;
    window_start_ = policy_.clock();
    window_start_bytes_ = total_bytes_;
}

bool SpeedMonitor::add_bytes(std::uint64_t count) {
    start();
    total_bytes_ += count;
    return check();
}

bool SpeedMonitor::check() {
    if (!started_) {
        return true;
    }
    const auto now = policy_.clock();
    const auto elapsed = now - window_start_;
    if (elapsed < policy_.check_interval) {
        return true;
    }

    const double seconds = std::chrono::duration<double>(elapsed).count();
    last_rate_ = static_cast<double>(total_bytes_ - window_start_bytes_) / seconds;
    window_start_ = now;
    window_start_bytes_ = total_bytes_;
    return last_rate_ >= static_cast<double>(policy_.min_bytes_per_second);
}

DownloadEngine::DownloadEngine(HttpClient& client, MirrorSelector& mirrors, DownloadPolicy policy)
    : client_(client),
      mirrors_(mirrors),
      policy_(std::move(policy)) {}

std::string DownloadEngine::artifact_path(const std::string& plugin, const std::string& version) {
    return plugin + "/" + version + "/" + plugin + ".hpi";
}

void DownloadEngine::fetch(const std::string& plugin, const std::string& version, const fs::path& destination) {
    const std::string relative = artifact_path(plugin, version);

    mirrors_.begin_attempt();
    while (true) {
        const std::string url = join_url(mirrors_.current_base(), relative);
        log_info(string_format("info.downloading_from", plugin, version, url));

        if (attempt(url, plugin, destination) == Outcome::COMPLETED) {
            return;
        }

        if (!mirrors_.advance()) {
            std::error_code ec;
            fs::remove(destination, ec);
            if (ec) {
                log_warning(string_format("warning.remove_file_failed", destination.string(), ec.message()));
            }
            throw DownloadError(string_format("error.all_mirrors_failed", plugin, version));
        }
        log_info(string_format("info.switching_mirror", mirrors_.current_base()));
    }
}

DownloadEngine::Outcome DownloadEngine::attempt(const std::string& url, const std::string& plugin, const fs::path& destination) {
    std::ofstream out(destination, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw HpiError(string_format("error.create_file_failed", destination.string()));
    }

    ArtifactWriter writer(out, policy_, plugin);
    TransferResult result = client_.get(url, writer);
    end_progress();
    out.close();

    if (writer.write_failed() || out.fail()) {
        throw HpiError(string_format("error.write_file_failed", destination.string()));
    }
    if (writer.degraded()) {
        log_warning(string_format("warning.mirror_too_slow", url, format_bytes(static_cast<std::uint64_t>(writer.last_rate()))));
        return Outcome::SPEED_DEGRADED;
    }
    if (result.status != TransferStatus::COMPLETED) {
        log_warning(string_format("warning.mirror_failed", url, describe_failure(result)));
        return Outcome::HARD_FAILURE;
    }
    if (result.content_length && *result.content_length != writer.bytes_written()) {
        log_warning(string_format("warning.size_mismatch", url, writer.bytes_written(), *result.content_length));
        return Outcome::HARD_FAILURE;
    }
    return Outcome::COMPLETED;
}
