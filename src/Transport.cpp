/**
 * @file Transport.cpp
 * @brief libcurl transport and REST status policy
 */

#include "stackport/Transport.hpp"
#include "stackport/Errors.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <mutex>

namespace stackport {

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlHeaders = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

std::once_flag curl_init_flag;
CURLcode curl_init_result = CURLE_OK;

void ensure_curl_initialized() {
    std::call_once(curl_init_flag, [] {
        curl_init_result = curl_global_init(CURL_GLOBAL_DEFAULT);
    });
    if (curl_init_result != CURLE_OK) {
        throw TransportError(std::string("failed to initialize libcurl: ") +
                             curl_easy_strerror(curl_init_result));
    }
}

size_t write_body(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(data, size * nmemb);
    return size * nmemb;
}

bool has_scheme(const std::string& url) {
    return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

} // anonymous namespace

const char* http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::POST: return "POST";
    }
    return "GET";
}

std::string normalize_base_url(const std::string& url) {
    std::string normalized = has_scheme(url) ? url : "https://" + url;
    if (!normalized.empty() && normalized.back() == '/') {
        normalized.pop_back();
    }
    return normalized;
}

// ============================================================================
// CurlTransport
// ============================================================================

CurlTransport::CurlTransport(TransportOptions options)
    : options_(std::move(options)) {
    options_.base_url = normalize_base_url(options_.base_url);
}

HttpResponse CurlTransport::send(const HttpRequest& request) {
    ensure_curl_initialized();

    CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        throw TransportError("failed to create http request: curl_easy_init failed");
    }

    const std::string url = options_.base_url + request.path;
    spdlog::debug("{} {}", http_method_to_string(request.method), url);

    curl_slist* raw_headers = nullptr;
    raw_headers = curl_slist_append(raw_headers, ("X-API-Key: " + options_.api_key).c_str());
    if (request.body) {
        raw_headers = curl_slist_append(raw_headers, "Content-Type: application/json");
    }
    CurlHeaders headers(raw_headers, &curl_slist_free_all);

    HttpResponse response;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, options_.timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    if (options_.skip_tls_verify) {
        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 0L);
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
    }

    switch (request.method) {
        case HttpMethod::GET:
            curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::PUT:
            curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, "PUT");
            break;
        case HttpMethod::POST:
            curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
            break;
    }

    if (request.body) {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body->c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(request.body->size()));
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw TransportError(std::string("failed to make http request: ") + curl_easy_strerror(res));
    }

    CURLcode info = curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    if (info != CURLE_OK) {
        throw TransportError(std::string("failed to read http response status: ") +
                             curl_easy_strerror(info));
    }
    spdlog::debug("{} {} -> {}", http_method_to_string(request.method), url, response.status);
    return response;
}

// ============================================================================
// RestClient
// ============================================================================

std::string RestClient::get(const std::string& path) {
    return send_expecting(HttpMethod::GET, path, std::nullopt, true);
}

std::string RestClient::put(const std::string& path, const std::string& json_body) {
    return send_expecting(HttpMethod::PUT, path, json_body, false);
}

std::string RestClient::post(const std::string& path, const std::string& json_body) {
    return send_expecting(HttpMethod::POST, path, json_body, false);
}

std::string RestClient::send_expecting(HttpMethod method, const std::string& path,
                                       std::optional<std::string> body, bool exact_ok) {
    HttpRequest request;
    request.method = method;
    request.path = path;
    request.body = std::move(body);

    HttpResponse response = transport_->send(request);

    bool ok = exact_ok ? response.status == 200
                       : (response.status >= 200 && response.status < 300);
    if (!ok) {
        throw StatusError(response.status, std::move(response.body));
    }
    return std::move(response.body);
}

} // namespace stackport
