#include "courier.h"
#include "http_client.h"
#include "errors.h"

#include <sstream>
#include <cstring>
#include <mutex>
#include <algorithm>
#include <cctype>

namespace {
std::once_flag curl_global_once;
}

HttpClient::HttpClient() {
    // curl_global_init is not thread-safe; run it once before any handle exists
    std::call_once(curl_global_once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });

    curl_ = curl_easy_init();
    if (!curl_) {
        LOG_ERROR("Failed to initialize CURL for HttpClient");
    }
    dprintf(3, "HttpClient initialized");
}

HttpClient::~HttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
    dprintf(3, "HttpClient destroyed");
}

void HttpClient::set_timeout(long timeout_seconds) {
    timeout_seconds_ = timeout_seconds;
    dprintf(2, "HttpClient timeout set to %ld seconds", timeout_seconds);
}

void HttpClient::set_ssl_verify(bool verify) {
    ssl_verify_ = verify;
    dprintf(2, "HttpClient SSL verify: %s", verify ? "enabled" : "disabled");
}

void HttpClient::set_ca_bundle(const std::string& ca_bundle_path) {
    ca_bundle_path_ = ca_bundle_path;
    dprintf(2, "HttpClient CA bundle: %s", ca_bundle_path.c_str());
}

void HttpClient::set_verbose(bool verbose) {
    verbose_ = verbose;
    dprintf(2, "HttpClient verbose: %s", verbose ? "enabled" : "disabled");
}

TransportError HttpClient::classify(CURLcode code) {
    switch (code) {
        case CURLE_OK:
            return TransportError::NONE;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
            return TransportError::CONNECT;
        case CURLE_OPERATION_TIMEDOUT:
            return TransportError::TIMEOUT;
        default:
            return TransportError::OTHER;
    }
}

void HttpClient::configure_curl() {
    if (!curl_) return;

    // Reset to clean state
    curl_easy_reset(curl_);

    // Timeouts are signalled through the socket layer in worker threads
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

    // Set timeout
    if (timeout_seconds_ > 0) {
        curl_easy_setopt(curl_, CURLOPT_TIMEOUT, timeout_seconds_);
        // Also set connect timeout to avoid hanging on connection
        curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, std::min(timeout_seconds_, 30L));
    }

    // SSL options
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, ssl_verify_ ? 1L : 0L);
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, ssl_verify_ ? 2L : 0L);

    if (!ca_bundle_path_.empty()) {
        curl_easy_setopt(curl_, CURLOPT_CAINFO, ca_bundle_path_.c_str());
    }

    // Verbose output for debugging
    if (verbose_) {
        curl_easy_setopt(curl_, CURLOPT_VERBOSE, 1L);
    }

    // Follow redirects
    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_, CURLOPT_MAXREDIRS, 5L);
}

struct curl_slist* HttpClient::set_headers(const std::map<std::string, std::string>& headers) {
    struct curl_slist* header_list = nullptr;

    for (const auto& [key, value] : headers) {
        std::string header = key + ": " + value;
        header_list = curl_slist_append(header_list, header.c_str());
    }

    return header_list;
}

size_t HttpClient::write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total_size = size * nmemb;
    auto* response = static_cast<HttpResponse*>(userdata);
    response->body.append(ptr, total_size);
    return total_size;
}

size_t HttpClient::header_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total_size = size * nmemb;
    auto* response = static_cast<HttpResponse*>(userdata);

    std::string header_line(ptr, total_size);

    // Parse header line (format: "Key: Value\r\n")
    size_t colon_pos = header_line.find(':');
    if (colon_pos != std::string::npos) {
        std::string key = header_line.substr(0, colon_pos);
        std::string value = header_line.substr(colon_pos + 1);

        // Trim whitespace
        size_t start = value.find_first_not_of(" \t\r\n");
        size_t end = value.find_last_not_of(" \t\r\n");
        if (start != std::string::npos && end != std::string::npos) {
            value = value.substr(start, end - start + 1);
        } else {
            value.clear();
        }

        // Header names are case-insensitive; store lowercase
        for (auto& c : key) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        response->headers[key] = value;
    }

    return total_size;
}

size_t HttpClient::stream_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total_size = size * nmemb;
    auto* data = static_cast<StreamCallbackData*>(userdata);

    if (!data->continue_streaming) {
        return 0; // Abort transfer
    }

    std::string chunk(ptr, total_size);

    // Call user callback
    if (data->callback) {
        data->continue_streaming = data->callback(chunk);
    }

    return data->continue_streaming ? total_size : 0;
}

void HttpClient::perform(const char* method, const std::string& url,
                         const std::map<std::string, std::string>& headers, HttpResponse& response) {
    // Set URL
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());

    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &response);

    // Set headers
    struct curl_slist* header_list = set_headers(headers);
    if (header_list) {
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);
    }

    // Perform request
    CURLcode res = curl_easy_perform(curl_);

    // Get status code
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response.status_code);

    // Clean up
    if (header_list) {
        curl_slist_free_all(header_list);
    }

    response.transport_error = classify(res);
    if (res != CURLE_OK) {
        response.error_message = curl_easy_strerror(res);
        // CURLE_WRITE_ERROR happens when the stream callback returns false - intentional cancellation
        if (res == CURLE_WRITE_ERROR) {
            dprintf(1, "HTTP %s stopped by callback: %s", method, url.c_str());
        } else {
            LOG_WARN("HTTP " + std::string(method) + " " + url + " failed: " + response.error_message);
        }
    } else {
        dprintf(1, "HTTP %s %s completed with status: %ld", method, url.c_str(), response.status_code);
    }
}

HttpResponse HttpClient::get(const std::string& url,
                             const std::map<std::string, std::string>& headers) {
    HttpResponse response;

    if (!curl_) {
        response.error_message = "CURL not initialized";
        response.transport_error = TransportError::OTHER;
        return response;
    }

    dprintf(1, "HTTP GET: %s", url.c_str());

    configure_curl();

    curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response);

    perform("GET", url, headers, response);
    return response;
}

HttpResponse HttpClient::post(const std::string& url,
                              const std::string& body,
                              const std::map<std::string, std::string>& headers) {
    HttpResponse response;

    if (!curl_) {
        response.error_message = "CURL not initialized";
        response.transport_error = TransportError::OTHER;
        return response;
    }

    dprintf(1, "HTTP POST: %s", url.c_str());
    dprintf(2, "POST body length: %zu", body.length());

    // Dump full request body at high debug level
    if (g_debug_level >= 5 && body.length() < 50000) {
        dprintf(5, "POST body:\n%s", body.c_str());
    }

    configure_curl();

    // Set POST
    curl_easy_setopt(curl_, CURLOPT_POST, 1L);
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.length()));

    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response);

    perform("POST", url, headers, response);

    if (response.body.length() > 100) {
        dprintf(2, "Response body (first 100 chars): %s", response.body.substr(0, 100).c_str());
    } else {
        dprintf(2, "Response body: %s", response.body.c_str());
    }
    return response;
}

HttpResponse HttpClient::post_stream(const std::string& url,
                                     const std::string& body,
                                     const std::map<std::string, std::string>& headers,
                                     StreamCallback callback) {
    HttpResponse response;

    if (!curl_) {
        response.error_message = "CURL not initialized";
        response.transport_error = TransportError::OTHER;
        return response;
    }

    dprintf(1, "HTTP POST (streaming): %s", url.c_str());
    dprintf(2, "POST body length: %zu", body.length());

    configure_curl();

    // Set POST
    curl_easy_setopt(curl_, CURLOPT_POST, 1L);
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.length()));

    // Set streaming callback
    StreamCallbackData callback_data;
    callback_data.callback = std::move(callback);

    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, stream_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &callback_data);

    perform("POST (streaming)", url, headers, response);
    return response;
}

HttpClientFactory default_http_client_factory(const HttpClientOptions& options) {
    return [options]() -> std::unique_ptr<HttpClient> {
        auto client = std::make_unique<HttpClient>();
        client->set_ssl_verify(options.ssl_verify);
        if (!options.ca_bundle.empty()) {
            client->set_ca_bundle(options.ca_bundle);
        }
        client->set_verbose(options.verbose);
        return client;
    };
}

void check_response(const HttpResponse& response, const std::string& what) {
    switch (response.transport_error) {
        case TransportError::NONE:
            break;
        case TransportError::CONNECT:
            throw ConnectivityError(what + ": " + response.error_message);
        case TransportError::TIMEOUT:
            throw TimeoutError(what + ": " + response.error_message);
        case TransportError::OTHER:
            throw ConnectivityError(what + ": " + response.error_message);
    }

    if (response.status_code >= 200 && response.status_code < 300) {
        return;
    }

    std::string detail = response.body;
    if (detail.length() > 500) {
        detail = detail.substr(0, 500) + "...";
    }
    throw_for_http_status(response.status_code,
                          what + ": HTTP " + std::to_string(response.status_code) + ": " + detail);
}
