#pragma once

#include <string>
#include <map>
#include <functional>
#include <memory>

#include <curl/curl.h>

/// @brief How a request failed before an HTTP status was available
enum class TransportError {
    NONE,      // Request completed (status_code is valid)
    CONNECT,   // Could not resolve or connect to the host
    TIMEOUT,   // Deadline exceeded
    OTHER      // Any other transport failure (TLS, aborted write, ...)
};

/// @brief HTTP response structure
struct HttpResponse {
    long status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;
    std::string error_message;
    TransportError transport_error = TransportError::NONE;

    bool is_success() const {
        return transport_error == TransportError::NONE && status_code >= 200 && status_code < 300;
    }

    bool transport_failed() const {
        return transport_error != TransportError::NONE;
    }
};

/// @brief Callback for streaming responses
/// @param chunk The chunk of data received
/// @return true to continue streaming, false to abort
using StreamCallback = std::function<bool(const std::string& chunk)>;

/// @brief libcurl HTTP client used by the providers and the dispatcher
/// One instance per call site; a curl easy handle is not shared across threads
class HttpClient {
public:
    HttpClient();
    virtual ~HttpClient();

    // Disable copy
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /// @brief Perform HTTP GET request
    /// @param url Full URL to request
    /// @param headers Optional custom headers
    /// @return Response object
    virtual HttpResponse get(const std::string& url,
                             const std::map<std::string, std::string>& headers = {});

    /// @brief Perform HTTP POST request
    /// @param url Full URL to request
    /// @param body Request body (typically JSON)
    /// @param headers Optional custom headers
    /// @return Response object
    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::map<std::string, std::string>& headers = {});

    /// @brief Perform HTTP POST request with streaming response
    /// @param url Full URL to request
    /// @param body Request body (typically JSON)
    /// @param headers Optional custom headers
    /// @param callback Callback function for each chunk
    /// @return Response object (body will be empty as it's streamed)
    virtual HttpResponse post_stream(const std::string& url,
                                     const std::string& body,
                                     const std::map<std::string, std::string>& headers,
                                     StreamCallback callback);

    /// @brief Set request timeout in seconds
    /// @param timeout_seconds Timeout in seconds (0 = no timeout)
    void set_timeout(long timeout_seconds);
    long get_timeout() const { return timeout_seconds_; }

    /// @brief Set whether to verify SSL certificates
    /// @param verify true to verify (default), false to skip verification
    void set_ssl_verify(bool verify);
    bool get_ssl_verify() const { return ssl_verify_; }

    /// @brief Set custom CA bundle path for SSL verification
    /// @param ca_bundle_path Path to CA bundle file
    void set_ca_bundle(const std::string& ca_bundle_path);
    const std::string& get_ca_bundle() const { return ca_bundle_path_; }

    /// @brief Enable/disable verbose debug output
    /// @param verbose true to enable curl verbose output
    void set_verbose(bool verbose);

    /// @brief Map a curl result code onto TransportError
    static TransportError classify(CURLcode code);

protected:
    long timeout_seconds_ = 0; // No timeout by default

private:
    CURL* curl_ = nullptr;
    bool ssl_verify_ = true;
    bool verbose_ = false;
    std::string ca_bundle_path_;

    /// @brief Configure curl handle with common options
    void configure_curl();

    /// @brief Run the configured transfer and fill status/transport fields
    void perform(const char* method, const std::string& url,
                 const std::map<std::string, std::string>& headers, HttpResponse& response);

    /// @brief Set headers on curl handle
    /// @param headers Headers to set
    /// @return curl_slist that must be freed by caller
    struct curl_slist* set_headers(const std::map<std::string, std::string>& headers);

    /// @brief Static callback for curl write function
    static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata);

    /// @brief Static callback for curl header function
    static size_t header_callback(char* ptr, size_t size, size_t nmemb, void* userdata);

    /// @brief Static callback for streaming write function
    static size_t stream_callback(char* ptr, size_t size, size_t nmemb, void* userdata);

    /// @brief Structure for streaming callback data
    struct StreamCallbackData {
        StreamCallback callback;
        bool continue_streaming = true;
    };
};

/// @brief Transport settings applied to every client a factory creates
struct HttpClientOptions {
    bool ssl_verify = true;
    std::string ca_bundle;    // Empty: curl's default bundle
    bool verbose = false;     // curl's own trace on stderr
};

/// @brief Factory for per-call clients; tests substitute scripted clients
using HttpClientFactory = std::function<std::unique_ptr<HttpClient>()>;

/// @brief Default factory producing real curl clients
HttpClientFactory default_http_client_factory(const HttpClientOptions& options = {});

/// @brief Throw the matching CourierError for a failed response; no-op on 2xx
/// Transport failures become ConnectivityError/TimeoutError, statuses go
/// through throw_for_http_status()
void check_response(const HttpResponse& response, const std::string& what);
