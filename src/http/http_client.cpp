#include "http_client.hpp"
#include <core/log.hpp>
#include <util/string_utils.hpp>
#include <curl/curl.h>
#include <fmt/format.h>
#include <memory>
#include <mutex>

namespace {

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

void ensure_curl_initialized() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

// libcurl header callback: one call per header line, status lines included
size_t on_header(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* response = static_cast<HttpResponse*>(userdata);
    size_t len = size * nitems;
    std::string line(buffer, len);

    // A new status line starts a new response (redirect hop)
    if (line.compare(0, 5, "HTTP/") == 0) {
        response->headers.clear();
        return len;
    }

    auto colon = line.find(':');
    if (colon == std::string::npos) return len;

    std::string name = StringUtils::trim(line.substr(0, colon));
    std::string value = StringUtils::trim(line.substr(colon + 1));
    if (!name.empty()) {
        response->headers.emplace_back(name, value);
    }
    return len;
}

size_t discard_body(char* /*ptr*/, size_t size, size_t nmemb, void* /*userdata*/) {
    return size * nmemb;
}

} // namespace

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    for (const auto& h : headers) {
        if (StringUtils::iequals(h.first, name)) return h.second;
    }
    return std::nullopt;
}

Result<HttpResponse> http_get(const std::string& url, int timeout_secs) {
    ensure_curl_initialized();

    CurlHandle curl(curl_easy_init());
    if (!curl) {
        return Result<HttpResponse>::Err("Failed to initialize libcurl");
    }

    HttpResponse response;
    char errbuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout_secs));
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, on_header);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, discard_body);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "sshrun/1.0");

    log_debug(fmt::format("HTTP GET {}", url));

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        std::string detail = errbuf[0] ? errbuf : curl_easy_strerror(rc);
        return Result<HttpResponse>::Err(fmt::format("GET {} failed: {}", url, detail));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    char* effective = nullptr;
    curl_easy_getinfo(curl.get(), CURLINFO_EFFECTIVE_URL, &effective);
    response.effective_url = effective ? effective : url;

    log_debug(fmt::format("HTTP {} from {} ({} headers)",
                          response.status, response.effective_url, response.headers.size()));
    return Result<HttpResponse>::Ok(std::move(response));
}
