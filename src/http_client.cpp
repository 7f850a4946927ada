#include "http_client.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <curl/curl.h>

#include <memory>

namespace {

size_t write_callback(void* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* observer = static_cast<TransferObserver*>(userdata);
    size_t bytes = size * nmemb;
    if (!observer->on_data(std::string_view(static_cast<const char*>(ptr), bytes))) {
        return 0; // curl reports CURLE_WRITE_ERROR
    }
    return bytes;
}

int xferinfo_callback(void* clientp, curl_off_t dltotal, [[maybe_unused]] curl_off_t dlnow,
                      [[maybe_unused]] curl_off_t ultotal, [[maybe_unused]] curl_off_t ulnow) {
    auto* observer = static_cast<TransferObserver*>(clientp);
    std::uint64_t total = dltotal > 0 ? static_cast<std::uint64_t>(dltotal) : 0;
    return observer->on_tick(total) ? 0 : 1;
}

struct HeaderContext {
    CURL* curl;
    TransferObserver* observer;
};

// Redirect and interim (1xx) responses end their header block too; only the
// final response opens the body.
size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* context = static_cast<HeaderContext*>(userdata);
    size_t bytes = size * nitems;
    std::string_view line(buffer, bytes);
    if (line == "\r\n" || line == "\n") {
        long code = 0;
        curl_easy_getinfo(context->curl, CURLINFO_RESPONSE_CODE, &code);
        if (code >= 200 && (code < 300 || code >= 400)) {
            context->observer->on_body_start();
        }
    }
    return bytes;
}

// Custom deleter for the CURL handle
struct CurlDeleter {
    void operator()(CURL* curl) const {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

class BufferingObserver : public TransferObserver {
public:
    bool on_data(std::string_view chunk) override {
        body.append(chunk);
        return true;
    }
    bool on_tick(std::uint64_t) override { return true; }

    std::string body;
};

} // anonymous namespace

CurlGlobalInitializer::CurlGlobalInitializer() {
    CURLcode res = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (res != CURLE_OK) {
        throw HpiError(string_format("error.curl_global_init_failed", curl_easy_strerror(res)));
    }
}

CurlGlobalInitializer::~CurlGlobalInitializer() {
    curl_global_cleanup();
}

std::string HttpClient::fetch_text(const std::string& url) {
    BufferingObserver observer;
    TransferResult result = get(url, observer);
    if (result.status != TransferStatus::COMPLETED) {
        throw HpiError(string_format("error.request_failed", url, describe_failure(result)));
    }
    return std::move(observer.body);
}

CurlHttpClient::CurlHttpClient(long connect_timeout_seconds, long stall_timeout_seconds)
    : connect_timeout_(connect_timeout_seconds),
      stall_timeout_(stall_timeout_seconds) {}

TransferResult CurlHttpClient::get(const std::string& url, TransferObserver& observer) {
    TransferResult result;

    CurlHandle curl(curl_easy_init());
    if (!curl) {
        result.error = get_string("error.curl_init_failed");
        return result;
    }

    char error_buffer[CURL_ERROR_SIZE] = {0};
    std::string user_agent(USER_AGENT);
    HeaderContext header_context{curl.get(), &observer};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &observer);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &header_context);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &observer);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, MAX_REDIRECTS);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, connect_timeout_);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, stall_timeout_);

    CURLcode res = curl_easy_perform(curl.get());

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.http_code);
    curl_off_t content_length = -1;
    if (curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &content_length) == CURLE_OK
        && content_length >= 0) {
        result.content_length = static_cast<std::uint64_t>(content_length);
    }

    result.status = transfer_status_from_curl(res);
    if (res != CURLE_OK) {
        result.error = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(res);
    }
    return result;
}

TransferStatus transfer_status_from_curl(CURLcode code) {
    switch (code) {
        case CURLE_OK:
            return TransferStatus::COMPLETED;
        case CURLE_HTTP_RETURNED_ERROR:
            return TransferStatus::HTTP_ERROR;
        case CURLE_WRITE_ERROR:
        case CURLE_ABORTED_BY_CALLBACK:
            return TransferStatus::ABORTED;
        default:
            return TransferStatus::NETWORK_ERROR;
    }
}

std::string describe_failure(const TransferResult& result) {
    switch (result.status) {
        case TransferStatus::HTTP_ERROR:
            return string_format("error.http_status", result.http_code);
        case TransferStatus::ABORTED:
            return get_string("error.transfer_aborted");
        case TransferStatus::NETWORK_ERROR:
            return result.error.empty() ? get_string("error.network_error") : result.error;
        case TransferStatus::COMPLETED:
        default:
            return {};
    }
}
