#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <core/types.hpp>

struct HttpResponse {
    long status = 0;
    std::string effective_url;
    // Headers of the final response (after redirects), in arrival order
    std::vector<std::pair<std::string, std::string>> headers;

    // First header with this name (case-insensitive), if any.
    std::optional<std::string> header(const std::string& name) const;
};

// Performs a GET and returns the final response. Injected into the
// endpoint resolver so tests can run without a server.
using HttpFetcher = std::function<Result<HttpResponse>(const std::string& url)>;

// GET url with libcurl, following redirects. The body is discarded.
Result<HttpResponse> http_get(const std::string& url, int timeout_secs);
