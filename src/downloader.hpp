#pragma once

#include "config.hpp"
#include "http_client.hpp"
#include "mirror_selector.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

using SteadyClock = std::chrono::steady_clock;

struct DownloadPolicy {
    std::uint64_t min_bytes_per_second = MIN_BYTES_PER_SECOND;
    SteadyClock::duration check_interval = SPEED_CHECK_INTERVAL;
    std::function<SteadyClock::time_point()> clock = [] { return SteadyClock::now(); };
    bool show_progress = true;
};

// Measures throughput over consecutive windows of at least `check_interval`.
// Nothing is measured before start(); connection setup and redirects are
// left to the transport's connect timeout.
class SpeedMonitor {
public:
    explicit SpeedMonitor(const DownloadPolicy& policy);

    // Opens the first window. Later calls have no effect.
    void start();
    bool started() const { return started_; }

    // Records received bytes and checks the current window, starting it if
    // the body began without start().
    // Returns false once a full window fell below the minimum rate.
    bool add_bytes(std::uint64_t count);

    // Checks the current window without new data.
    bool check();

    std::uint64_t total_bytes() const { return total_bytes_; }
    double last_rate() const { return last_rate_; }

private:
    const DownloadPolicy& policy_;
    bool started_ = false;
    SteadyClock::time_point window_start_{};
    std::uint64_t window_start_bytes_ = 0;
    std::uint64_t total_bytes_ = 0;
    double last_rate_ = 0.0;
};

// Streams plugin artifacts from the selected mirror, failing over to the next
// mirror on hard errors or sustained slowness.
class DownloadEngine {
public:
    DownloadEngine(HttpClient& client, MirrorSelector& mirrors, DownloadPolicy policy = {});

    // Downloads {mirror}/{plugin}/{version}/{plugin}.hpi to `destination`.
    // Every attempt rewrites the file from offset 0. Throws DownloadError when
    // all mirrors failed, HpiError when the destination cannot be written.
    void fetch(const std::string& plugin, const std::string& version, const std::filesystem::path& destination);

    static std::string artifact_path(const std::string& plugin, const std::string& version);

private:
    enum class Outcome {
        COMPLETED,
        SPEED_DEGRADED,
        HARD_FAILURE
    };

    Outcome attempt(const std::string& url, const std::string& plugin, const std::filesystem::path& destination);

    HttpClient& client_;
    MirrorSelector& mirrors_;
    DownloadPolicy policy_;
};
