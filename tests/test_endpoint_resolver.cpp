#include <gtest/gtest.h>
#include <http/endpoint_resolver.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace {

HttpFetcher fetcher_with_header(const std::string& value, std::string* requested = nullptr) {
    return [value, requested](const std::string& url) {
        if (requested) *requested = url;
        HttpResponse r;
        r.status = 200;
        r.effective_url = url;
        r.headers.emplace_back("Content-Type", "text/html");
        r.headers.emplace_back("X-SSH-Endpoint", value);
        return Result<HttpResponse>::Ok(r);
    };
}

HttpFetcher fetcher_without_header() {
    return [](const std::string& url) {
        HttpResponse r;
        r.status = 200;
        r.effective_url = url;
        r.headers.emplace_back("Content-Type", "text/html");
        return Result<HttpResponse>::Ok(r);
    };
}

std::string read_file(const std::filesystem::path& p) {
    std::ifstream in(p);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

TEST(EndpointResolver, LoginUrlAppendsPath) {
    EXPECT_EQ(login_url("http://ci.example.com"), "http://ci.example.com/login");
    EXPECT_EQ(login_url("http://ci.example.com/"), "http://ci.example.com/login");
    EXPECT_EQ(login_url("http://ci.example.com/jenkins//"), "http://ci.example.com/jenkins/login");
}

TEST(EndpointResolver, ParsesHostAndPort) {
    auto ep = parse_endpoint("build.example.com:2222");
    ASSERT_TRUE(ep.is_ok()) << ep.error;
    EXPECT_EQ(ep.value.host, "build.example.com");
    EXPECT_EQ(ep.value.port, 2222);
}

TEST(EndpointResolver, TrimsWhitespace) {
    auto ep = parse_endpoint("  host:22 ");
    ASSERT_TRUE(ep.is_ok());
    EXPECT_EQ(ep.value.host, "host");
    EXPECT_EQ(ep.value.port, 22);
}

TEST(EndpointResolver, RejectsMissingColon) {
    EXPECT_TRUE(parse_endpoint("bad-endpoint").is_err());
}

TEST(EndpointResolver, RejectsNonNumericPort) {
    EXPECT_TRUE(parse_endpoint("host:notanumber").is_err());
    EXPECT_TRUE(parse_endpoint("host:22abc").is_err());
    EXPECT_TRUE(parse_endpoint("host:").is_err());
}

TEST(EndpointResolver, RejectsEmptyHostAndBadRange) {
    EXPECT_TRUE(parse_endpoint(":22").is_err());
    EXPECT_TRUE(parse_endpoint("host:0").is_err());
    EXPECT_TRUE(parse_endpoint("host:65536").is_err());
    EXPECT_TRUE(parse_endpoint("host:65535").is_ok());
}

TEST(EndpointResolver, ResolvesAdvertisedEndpoint) {
    std::string requested;
    EndpointResolver resolver(fetcher_with_header("build.example.com:2222", &requested));

    auto r = resolver.resolve("http://ci.example.com/");
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_TRUE(r.value.has_value());
    EXPECT_EQ(r.value->host, "build.example.com");
    EXPECT_EQ(r.value->port, 2222);
    EXPECT_EQ(requested, "http://ci.example.com/login");
}

TEST(EndpointResolver, HeaderLookupIsCaseInsensitive) {
    EndpointResolver resolver([](const std::string& url) {
        HttpResponse r;
        r.effective_url = url;
        r.headers.emplace_back("x-ssh-endpoint", "host:2200");
        return Result<HttpResponse>::Ok(r);
    });
    auto r = resolver.resolve("http://ci");
    ASSERT_TRUE(r.is_ok());
    ASSERT_TRUE(r.value.has_value());
    EXPECT_EQ(r.value->port, 2200);
}

TEST(EndpointResolver, MissingHeaderIsNotAnError) {
    auto log = platform::temp_file("sshrun_resolver_log");
    set_log_path(log.string());

    EndpointResolver resolver(fetcher_without_header());
    auto r = resolver.resolve("http://ci.example.com");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_FALSE(r.value.has_value());

    std::string logged = read_file(log);
    EXPECT_NE(logged.find("WARN"), std::string::npos);
    EXPECT_NE(logged.find("X-SSH-Endpoint"), std::string::npos);

    std::filesystem::remove(log);
}

TEST(EndpointResolver, MalformedHeaderIsAnError) {
    EndpointResolver resolver(fetcher_with_header("bad-endpoint"));
    EXPECT_TRUE(resolver.resolve("http://ci").is_err());

    EndpointResolver resolver2(fetcher_with_header("host:notanumber"));
    EXPECT_TRUE(resolver2.resolve("http://ci").is_err());
}

TEST(EndpointResolver, TransportErrorPropagates) {
    EndpointResolver resolver([](const std::string&) {
        return Result<HttpResponse>::Err("Could not resolve host");
    });
    auto r = resolver.resolve("http://nowhere.invalid");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "Could not resolve host");
}

TEST(EndpointResolver, VerifierCanRejectResponse) {
    EndpointResolver resolver(fetcher_with_header("host:22"), [](const HttpResponse& r) {
        if (r.effective_url.rfind("https://", 0) != 0) {
            return Result<void>::Err("refusing plain http");
        }
        return Result<void>::Ok();
    });
    auto r = resolver.resolve("http://ci");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "refusing plain http");
}

TEST(EndpointResolver, HttpResponseHeaderReturnsFirstMatch) {
    HttpResponse r;
    r.headers.emplace_back("Set-Cookie", "a=1");
    r.headers.emplace_back("set-cookie", "b=2");
    ASSERT_TRUE(r.header("SET-COOKIE").has_value());
    EXPECT_EQ(*r.header("SET-COOKIE"), "a=1");
    EXPECT_FALSE(r.header("X-Missing").has_value());
}
