#pragma once

#include <curl/curl.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Receives a streamed response body. Returning false from either callback
// aborts the transfer.
class TransferObserver {
public:
    virtual ~TransferObserver() = default;

    // Called once the headers of the final response arrived, after any
    // redirects and before the first body chunk.
    virtual void on_body_start() {}

    virtual bool on_data(std::string_view chunk) = 0;

    // Called periodically while the transfer is open, also when no bytes
    // arrive. expected_total is 0 while the body size is unknown.
    virtual bool on_tick(std::uint64_t expected_total) = 0;
};

enum class TransferStatus {
    COMPLETED,
    HTTP_ERROR,
    NETWORK_ERROR,
    ABORTED
};

struct TransferResult {
    TransferStatus status = TransferStatus::NETWORK_ERROR;
    long http_code = 0;
    std::optional<std::uint64_t> content_length;
    std::string error;
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Streams the body of a GET request into the observer.
    virtual TransferResult get(const std::string& url, TransferObserver& observer) = 0;

    // Buffers a whole response body; throws HpiError on any failure.
    std::string fetch_text(const std::string& url);
};

class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient(long connect_timeout_seconds, long stall_timeout_seconds);

    TransferResult get(const std::string& url, TransferObserver& observer) override;

private:
    long connect_timeout_;
    long stall_timeout_;
};

// RAII for curl global init/cleanup
struct CurlGlobalInitializer {
    CurlGlobalInitializer();
    ~CurlGlobalInitializer();
    CurlGlobalInitializer(const CurlGlobalInitializer&) = delete;
    CurlGlobalInitializer& operator=(const CurlGlobalInitializer&) = delete;
};

TransferStatus transfer_status_from_curl(CURLcode code);

std::string describe_failure(const TransferResult& result);
