#pragma once

#include "../src/downloader.hpp"
#include "../src/http_client.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Manually driven time source for DownloadPolicy::clock.
struct FakeClock {
    SteadyClock::time_point now{};

    void advance(std::chrono::milliseconds d) { now += d; }
};

// One scripted event of a response: either a body chunk or an idle tick,
// delivered after moving the fake clock forward.
struct FakeStep {
    std::chrono::milliseconds advance{0};
    std::string data;
    bool tick_only = false;
};

struct FakeResponse {
    TransferStatus status = TransferStatus::COMPLETED;
    long http_code = 200;
    std::optional<std::uint64_t> content_length;
    // Connection setup and redirects, played before the final headers.
    std::vector<FakeStep> before_body;
    std::vector<FakeStep> steps;

    static FakeResponse body(const std::string& content, bool declare_length = true) {
        FakeResponse r;
        if (declare_length) r.content_length = content.size();
        if (!content.empty()) r.steps.push_back({std::chrono::milliseconds(0), content, false});
        return r;
    }

    static FakeResponse http_error(long code) {
        FakeResponse r;
        r.status = TransferStatus::HTTP_ERROR;
        r.http_code = code;
        return r;
    }

    static FakeResponse network_error() {
        FakeResponse r;
        r.status = TransferStatus::NETWORK_ERROR;
        r.http_code = 0;
        return r;
    }
};

// Serves scripted responses by URL and records every request. Unknown URLs
// answer 404.
class FakeHttpClient : public HttpClient {
public:
    explicit FakeHttpClient(FakeClock* clock = nullptr) : clock_(clock) {}

    void on(const std::string& url, FakeResponse response) {
        responses_[url] = std::move(response);
    }

    TransferResult get(const std::string& url, TransferObserver& observer) override {
        requests.push_back(url);

        TransferResult result;
        auto it = responses_.find(url);
        if (it == responses_.end()) {
            result.status = TransferStatus::HTTP_ERROR;
            result.http_code = 404;
            return result;
        }

        const FakeResponse& response = it->second;
        result.http_code = response.http_code;
        result.content_length = response.content_length;

        if (!play(response.before_body, 0, observer)) {
            result.status = TransferStatus::ABORTED;
            result.error = "aborted by callback";
            return result;
        }
        observer.on_body_start();
        if (!play(response.steps, response.content_length.value_or(0), observer)) {
            result.status = TransferStatus::ABORTED;
            result.error = "aborted by callback";
            return result;
        }
        result.status = response.status;
        return result;
    }

    size_t count(const std::string& url) const {
        size_t n = 0;
        for (const auto& r : requests) {
            if (r == url) ++n;
        }
        return n;
    }

    std::vector<std::string> requests;

private:
    bool play(const std::vector<FakeStep>& steps, std::uint64_t expected, TransferObserver& observer) {
        for (const auto& step : steps) {
            if (clock_) clock_->advance(step.advance);
            bool keep_going = step.tick_only ? observer.on_tick(expected) : observer.on_data(step.data);
            if (!keep_going) return false;
        }
        return true;
    }

    FakeClock* clock_;
    std::map<std::string, FakeResponse> responses_;
};
