#include "endpoint_resolver.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <util/string_utils.hpp>
#include <fmt/format.h>

using Resolution = Result<std::optional<Endpoint>>;

Result<void> accept_any_response(const HttpResponse& /*response*/) {
    return Result<void>::Ok();
}

std::string login_url(const std::string& base_url) {
    std::string url = base_url;
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url + "/" + LOGIN_PATH;
}

Result<Endpoint> parse_endpoint(const std::string& description) {
    std::string text = StringUtils::trim(description);

    auto colon = text.find(':');
    if (colon == std::string::npos) {
        return Result<Endpoint>::Err(fmt::format(
            "Malformed SSH endpoint '{}': expected host:port", text));
    }

    Endpoint ep;
    ep.host = text.substr(0, colon);
    if (ep.host.empty()) {
        return Result<Endpoint>::Err(fmt::format(
            "Malformed SSH endpoint '{}': empty host", text));
    }

    std::string port_text = text.substr(colon + 1);
    auto port = parse_int(port_text);
    if (!port) {
        return Result<Endpoint>::Err(fmt::format(
            "Malformed SSH endpoint '{}': port '{}' is not a number", text, port_text));
    }
    if (*port < 1 || *port > 65535) {
        return Result<Endpoint>::Err(fmt::format(
            "Malformed SSH endpoint '{}': port {} out of range", text, *port));
    }

    ep.port = *port;
    return Result<Endpoint>::Ok(ep);
}

EndpointResolver::EndpointResolver()
    : EndpointResolver([](const std::string& url) { return http_get(url, HTTP_TIMEOUT_SECS); }) {
}

EndpointResolver::EndpointResolver(HttpFetcher fetcher, ConnectionVerifier verifier)
    : fetcher_(std::move(fetcher)), verifier_(std::move(verifier)) {
}

Resolution EndpointResolver::resolve(const std::string& base_url) const {
    std::string url = login_url(base_url);

    auto response = fetcher_(url);
    if (response.is_err()) {
        return Resolution::Err(response.error);
    }

    auto verified = verifier_(response.value);
    if (verified.is_err()) {
        return Resolution::Err(verified.error);
    }

    auto description = response.value.header(SSH_ENDPOINT_HEADER);
    if (!description) {
        log_warn(fmt::format("No header '{}' returned by {}", SSH_ENDPOINT_HEADER, url));
        return Resolution::Ok(std::nullopt);
    }

    log_debug(fmt::format("Connecting via SSH to: {}", *description));

    auto endpoint = parse_endpoint(*description);
    if (endpoint.is_err()) {
        return Resolution::Err(endpoint.error);
    }
    return Resolution::Ok(endpoint.value);
}
