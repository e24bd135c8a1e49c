#include <gtest/gtest.h>
#include "http_client.h"
#include "errors.h"

// =============================================================================
// Transport classification
// =============================================================================

TEST(HttpClientTest, ClassifyCurlCodes) {
    EXPECT_EQ(HttpClient::classify(CURLE_OK), TransportError::NONE);
    EXPECT_EQ(HttpClient::classify(CURLE_COULDNT_RESOLVE_HOST), TransportError::CONNECT);
    EXPECT_EQ(HttpClient::classify(CURLE_COULDNT_CONNECT), TransportError::CONNECT);
    EXPECT_EQ(HttpClient::classify(CURLE_GOT_NOTHING), TransportError::CONNECT);
    EXPECT_EQ(HttpClient::classify(CURLE_OPERATION_TIMEDOUT), TransportError::TIMEOUT);
    EXPECT_EQ(HttpClient::classify(CURLE_WRITE_ERROR), TransportError::OTHER);
    EXPECT_EQ(HttpClient::classify(CURLE_SSL_CONNECT_ERROR), TransportError::OTHER);
}

TEST(HttpClientTest, ResponseSuccess) {
    HttpResponse ok;
    ok.status_code = 204;
    EXPECT_TRUE(ok.is_success());
    EXPECT_FALSE(ok.transport_failed());

    HttpResponse aborted = ok;
    aborted.transport_error = TransportError::OTHER;
    EXPECT_FALSE(aborted.is_success());
    EXPECT_TRUE(aborted.transport_failed());
}

TEST(HttpClientTest, FactoryAppliesOptions) {
    HttpClientOptions options;
    options.ssl_verify = false;
    options.ca_bundle = "/etc/ssl/corp.pem";

    auto factory = default_http_client_factory(options);
    auto first = factory();
    auto second = factory();

    EXPECT_NE(first.get(), second.get());
    EXPECT_FALSE(first->get_ssl_verify());
    EXPECT_EQ(first->get_ca_bundle(), "/etc/ssl/corp.pem");

    auto plain = default_http_client_factory()();
    EXPECT_TRUE(plain->get_ssl_verify());
    EXPECT_EQ(plain->get_ca_bundle(), "");
    EXPECT_EQ(plain->get_timeout(), 0);
}

// =============================================================================
// check_response
// =============================================================================

static HttpResponse with_status(long status, const std::string& body = "") {
    HttpResponse response;
    response.status_code = status;
    response.body = body;
    return response;
}

static HttpResponse with_transport(TransportError error) {
    HttpResponse response;
    response.transport_error = error;
    response.error_message = "curl said no";
    return response;
}

TEST(CheckResponseTest, SuccessIsSilent) {
    EXPECT_NO_THROW(check_response(with_status(200, "{}"), "test"));
    EXPECT_NO_THROW(check_response(with_status(201), "test"));
}

TEST(CheckResponseTest, TransportFailures) {
    EXPECT_THROW(check_response(with_transport(TransportError::CONNECT), "test"), ConnectivityError);
    EXPECT_THROW(check_response(with_transport(TransportError::TIMEOUT), "test"), TimeoutError);
    EXPECT_THROW(check_response(with_transport(TransportError::OTHER), "test"), ConnectivityError);
}

TEST(CheckResponseTest, StatusMapping) {
    EXPECT_THROW(check_response(with_status(401), "test"), UpstreamAuthError);
    EXPECT_THROW(check_response(with_status(403), "test"), UpstreamAuthError);
    EXPECT_THROW(check_response(with_status(429), "test"), UpstreamRateLimitError);
    EXPECT_THROW(check_response(with_status(500), "test"), UpstreamServerError);
    EXPECT_THROW(check_response(with_status(503), "test"), UpstreamServerError);
    EXPECT_THROW(check_response(with_status(404), "test"), UpstreamError);
    EXPECT_THROW(check_response(with_status(302), "test"), UpstreamError);
}

TEST(CheckResponseTest, MessageCarriesStatusAndTruncatedBody) {
    try {
        check_response(with_status(400, std::string(800, 'x')), "OpenAI chat completion");
        FAIL() << "expected UpstreamError";
    } catch (const UpstreamError& e) {
        std::string message = e.what();
        EXPECT_EQ(e.status(), 400);
        EXPECT_EQ(e.kind(), ErrorKind::UPSTREAM);
        EXPECT_EQ(message.rfind("OpenAI chat completion: HTTP 400: ", 0), 0u);
        EXPECT_EQ(message.size(), std::string("OpenAI chat completion: HTTP 400: ").size() + 500 + 3);
    }
}

TEST(ErrorKindTest, RetryableAndStatus) {
    EXPECT_FALSE(is_retryable(ErrorKind::CONFIGURATION));
    EXPECT_TRUE(is_retryable(ErrorKind::CONNECTIVITY));
    EXPECT_TRUE(is_retryable(ErrorKind::TIMEOUT));
    EXPECT_FALSE(is_retryable(ErrorKind::UPSTREAM_AUTH));
    EXPECT_TRUE(is_retryable(ErrorKind::UPSTREAM_RATE_LIMIT));
    EXPECT_TRUE(is_retryable(ErrorKind::UPSTREAM_SERVER));
    EXPECT_TRUE(is_retryable(ErrorKind::UPSTREAM));
    EXPECT_FALSE(is_retryable(ErrorKind::VALIDATION));

    EXPECT_EQ(http_status_for(ErrorKind::CONFIGURATION), 500);
    EXPECT_EQ(http_status_for(ErrorKind::CONNECTIVITY), 502);
    EXPECT_EQ(http_status_for(ErrorKind::TIMEOUT), 504);
    EXPECT_EQ(http_status_for(ErrorKind::UPSTREAM_AUTH), 401);
    EXPECT_EQ(http_status_for(ErrorKind::UPSTREAM_RATE_LIMIT), 429);
    EXPECT_EQ(http_status_for(ErrorKind::UPSTREAM_SERVER), 502);
    EXPECT_EQ(http_status_for(ErrorKind::UPSTREAM), 500);
    EXPECT_EQ(http_status_for(ErrorKind::VALIDATION), 422);
}
