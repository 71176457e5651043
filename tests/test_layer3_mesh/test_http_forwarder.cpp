/**
 * @file test_http_forwarder.cpp
 * @brief Layer 3 tests for the forwarder's request classification helpers.
 */
#include "mesh_core.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace mcpmesh::mesh;
using namespace ::testing;

namespace
{
httplib::Request make_request(const std::string &method, const std::string &accept,
                              const std::string &content_type = {})
{
    httplib::Request req;
    req.method = method;
    if (!accept.empty())
        req.headers.emplace("Accept", accept);
    if (!content_type.empty())
        req.headers.emplace("Content-Type", content_type);
    return req;
}
} // namespace

TEST(HttpForwarderTest, GetWithEventStreamAcceptStreams)
{
    EXPECT_TRUE(HttpForwarder::wants_streaming(make_request("GET", "text/event-stream")));
    EXPECT_TRUE(
        HttpForwarder::wants_streaming(make_request("GET", "application/json, Text/Event-Stream")));
    EXPECT_FALSE(HttpForwarder::wants_streaming(make_request("GET", "application/json")));
    EXPECT_FALSE(HttpForwarder::wants_streaming(make_request("GET", "")));
    EXPECT_FALSE(HttpForwarder::wants_streaming(make_request("DELETE", "text/event-stream")));
}

TEST(HttpForwarderTest, BodyRequestsStreamOnlyWhenEventStreamIsPreferred)
{
    EXPECT_TRUE(HttpForwarder::wants_streaming(
        make_request("POST", "text/event-stream, application/json", "application/json")));
    EXPECT_FALSE(HttpForwarder::wants_streaming(
        make_request("POST", "application/json, text/event-stream", "application/json")));
    EXPECT_FALSE(HttpForwarder::wants_streaming(
        make_request("POST", "text/event-stream", "text/plain")));
    EXPECT_TRUE(HttpForwarder::wants_streaming(
        make_request("PUT", "text/event-stream", "application/json; charset=utf-8")));
}

TEST(HttpForwarderTest, HopByHopAndInjectedHeadersAreDropped)
{
    httplib::Headers in{{"Host", "proxy:1888"},
                        {"Connection", "keep-alive"},
                        {"Content-Length", "12"},
                        {"Transfer-Encoding", "chunked"},
                        {"TE", "trailers"},
                        {"REMOTE_ADDR", "127.0.0.1"},
                        {"REMOTE_PORT", "50000"},
                        {"Authorization", "Bearer t"},
                        {"X-MCP-Server-Name", "calc"},
                        {"Mcp-Session-Id", "abc"}};
    const auto out = HttpForwarder::forwardable_headers(in);
    std::vector<std::string> names;
    for (const auto &[k, v] : out)
        names.push_back(k);
    EXPECT_THAT(names, UnorderedElementsAre("Authorization", "X-MCP-Server-Name", "Mcp-Session-Id"));
}

TEST(HttpForwarderTest, CorsHeadersAreApplied)
{
    httplib::Response res;
    HttpForwarder::apply_cors(res);
    EXPECT_EQ(res.get_header_value("Access-Control-Allow-Origin"), "*");
    EXPECT_THAT(res.get_header_value("Access-Control-Allow-Methods"), HasSubstr("OPTIONS"));
    EXPECT_EQ(res.get_header_value("Access-Control-Max-Age"), "3600");
}

TEST(HttpForwarderTest, UpstreamErrorsAreClassified)
{
    EXPECT_EQ(HttpForwarder::classify(httplib::Error::Success), UpstreamFailure::None);
    EXPECT_EQ(HttpForwarder::classify(httplib::Error::Connection), UpstreamFailure::Refused);
    EXPECT_EQ(HttpForwarder::classify(httplib::Error::ConnectionTimeout), UpstreamFailure::Timeout);
    EXPECT_EQ(HttpForwarder::classify(httplib::Error::Read), UpstreamFailure::Timeout);
    EXPECT_EQ(HttpForwarder::classify(httplib::Error::Canceled), UpstreamFailure::Cancelled);
    EXPECT_EQ(HttpForwarder::classify(httplib::Error::SSLConnection), UpstreamFailure::Other);
}

TEST(HttpForwarderTest, NetworkConditionsAreRecognisedInText)
{
    EXPECT_TRUE(HttpForwarder::names_network_condition("Connection reset by peer"));
    EXPECT_TRUE(HttpForwarder::names_network_condition("read TIMEOUT"));
    EXPECT_TRUE(HttpForwarder::names_network_condition("Broken pipe"));
    EXPECT_TRUE(HttpForwarder::names_network_condition("host unreachable"));
    EXPECT_FALSE(HttpForwarder::names_network_condition("invalid arguments"));
    EXPECT_FALSE(HttpForwarder::names_network_condition(""));
}

TEST(HttpForwarderTest, QueryIsReattachedEncoded)
{
    httplib::Request req;
    EXPECT_EQ(HttpForwarder::with_query("/mcp/ping", req), "/mcp/ping");

    req.params.emplace("x", "1");
    req.params.emplace("q", "a b&c");
    // Params are a multimap ordered by key.
    EXPECT_EQ(HttpForwarder::with_query("/mcp/ping", req), "/mcp/ping?q=a%20b%26c&x=1");
}
