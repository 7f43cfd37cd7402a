#pragma once

#include <functional>
#include <optional>
#include <string>
#include <core/types.hpp>
#include "http_client.hpp"

// Decides whether the discovery response came from a server we trust to
// advertise an endpoint. Err aborts resolution.
using ConnectionVerifier = std::function<Result<void>(const HttpResponse&)>;

// Default verifier: any HTTP response is acceptable.
Result<void> accept_any_response(const HttpResponse& response);

// "<base>/login" with exactly one slash between base and path.
std::string login_url(const std::string& base_url);

// Split "host:port" on the first colon. Fails on a missing colon, an empty
// host, or a port that is not a whole integer in 1..65535.
Result<Endpoint> parse_endpoint(const std::string& description);

// Discovers the SSH endpoint from the X-SSH-Endpoint header of <base>/login.
//
//   Ok(endpoint)  header present and well formed
//   Ok(nullopt)   header absent: SSH not offered, a warning is logged
//   Err           transport failure, verifier rejection, malformed header
class EndpointResolver {
public:
    EndpointResolver();
    explicit EndpointResolver(HttpFetcher fetcher,
                              ConnectionVerifier verifier = accept_any_response);

    Result<std::optional<Endpoint>> resolve(const std::string& base_url) const;

private:
    HttpFetcher fetcher_;
    ConnectionVerifier verifier_;
};
