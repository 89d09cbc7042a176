/**
 * @file test_transport.cpp
 * @brief Tests for URL normalization and the REST status policy
 */

#include <gtest/gtest.h>
#include "fakes.hpp"
#include "stackport/Transport.hpp"

using namespace stackport;
using stackport_test::FakeTransport;

// ============================================================================
// Base URL
// ============================================================================

TEST(NormalizeBaseUrl, AddsHttpsWhenSchemeMissing) {
    EXPECT_EQ(normalize_base_url("portainer.local:9443"), "https://portainer.local:9443");
}

TEST(NormalizeBaseUrl, KeepsExplicitScheme) {
    EXPECT_EQ(normalize_base_url("http://10.0.0.2:9000"), "http://10.0.0.2:9000");
    EXPECT_EQ(normalize_base_url("https://host"), "https://host");
}

TEST(NormalizeBaseUrl, DropsTrailingSlash) {
    EXPECT_EQ(normalize_base_url("https://host/"), "https://host");
}

TEST(CurlTransport, NormalizesConfiguredUrl) {
    TransportOptions options;
    options.base_url = "host:9443/";
    options.api_key = "ptr_x";

    CurlTransport transport(options);
    EXPECT_EQ(transport.options().base_url, "https://host:9443");
    EXPECT_EQ(transport.options().timeout_seconds, 30);
    EXPECT_FALSE(transport.options().skip_tls_verify);
}

TEST(CurlTransport, UnreachableServerIsTransportError) {
    TransportOptions options;
    options.base_url = "http://127.0.0.1:1";
    options.api_key = "ptr_x";
    options.timeout_seconds = 2;

    CurlTransport transport(options);
    HttpRequest request;
    request.method = HttpMethod::GET;
    request.path = "/api/stacks";
    EXPECT_THROW(transport.send(request), TransportError);
}

TEST(HttpMethodName, ToString) {
    EXPECT_STREQ(http_method_to_string(HttpMethod::GET), "GET");
    EXPECT_STREQ(http_method_to_string(HttpMethod::PUT), "PUT");
    EXPECT_STREQ(http_method_to_string(HttpMethod::POST), "POST");
}

// ============================================================================
// Status policy
// ============================================================================

TEST(RestClient, GetRequiresExactly200) {
    auto transport = std::make_shared<FakeTransport>();
    transport->on(HttpMethod::GET, "/ok", 200, "body");
    transport->on(HttpMethod::GET, "/accepted", 202, "body");

    RestClient rest(transport);
    EXPECT_EQ(rest.get("/ok"), "body");
    EXPECT_THROW(rest.get("/accepted"), StatusError);
}

TEST(RestClient, PutAndPostAcceptAny2xx) {
    auto transport = std::make_shared<FakeTransport>();
    transport->on(HttpMethod::PUT, "/p", 204, "");
    transport->on(HttpMethod::POST, "/c", 201, "{\"Id\":1}");

    RestClient rest(transport);
    EXPECT_EQ(rest.put("/p", "{}"), "");
    EXPECT_EQ(rest.post("/c", "{}"), "{\"Id\":1}");
}

TEST(RestClient, ErrorStatusCarriesCodeAndBody) {
    auto transport = std::make_shared<FakeTransport>();
    transport->on(HttpMethod::PUT, "/p", 302, "moved");

    RestClient rest(transport);
    try {
        rest.put("/p", "{}");
        FAIL() << "expected StatusError";
    } catch (const StatusError& e) {
        EXPECT_EQ(e.status_code(), 302);
        EXPECT_EQ(e.body(), "moved");
    }
}

TEST(RestClient, SendsBodyOnlyForWrites) {
    auto transport = std::make_shared<FakeTransport>();
    transport->on(HttpMethod::GET, "/g", 200, "");
    transport->on(HttpMethod::PUT, "/p", 200, "");

    RestClient rest(transport);
    rest.get("/g");
    rest.put("/p", "{\"a\":1}");

    ASSERT_EQ(transport->requests.size(), 2u);
    EXPECT_FALSE(transport->requests[0].body.has_value());
    EXPECT_EQ(transport->requests[1].body.value_or(""), "{\"a\":1}");
}
