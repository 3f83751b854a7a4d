#include <gtest/gtest.h>
#include "endpoint.hpp"

TEST(EndpointResolver, ResolvesOvhRegions) {
    EXPECT_EQ(EndpointResolver::resolve("ovh-ca"), "ca.api.ovh.com");
    EXPECT_EQ(EndpointResolver::resolve("ovh-eu"), "eu.api.ovh.com");
    EXPECT_EQ(EndpointResolver::resolve("ovh-us"), "us.api.ovh.com");
}

TEST(EndpointResolver, ResolvesSoYouStartAndKimsufi) {
    EXPECT_EQ(EndpointResolver::resolve("soyoustart-ca"), "ca.api.soyoustart.com");
    EXPECT_EQ(EndpointResolver::resolve("soyoustart-eu"), "eu.api.soyoustart.com");
    EXPECT_EQ(EndpointResolver::resolve("kimsufi-ca"), "ca.api.kimsufi.com");
    EXPECT_EQ(EndpointResolver::resolve("kimsufi-eu"), "eu.api.kimsufi.com");
}

TEST(EndpointResolver, UnknownFallsBackToDefaultHost) {
    EXPECT_EQ(EndpointResolver::resolve("idontexist-nw"), "api.ovh.com");
    EXPECT_EQ(EndpointResolver::resolve(""), "api.ovh.com");
    EXPECT_EQ(EndpointResolver::resolve("eu.api.ovh.com"), "api.ovh.com");
}

TEST(EndpointResolver, MatchIsExact) {
    EXPECT_EQ(EndpointResolver::resolve("OVH-EU"), "api.ovh.com");
    EXPECT_EQ(EndpointResolver::resolve(" ovh-eu"), "api.ovh.com");
    EXPECT_EQ(EndpointResolver::resolve("ovh-eu "), "api.ovh.com");
}

TEST(EndpointResolver, IsKnown) {
    EXPECT_TRUE(EndpointResolver::isKnown("kimsufi-eu"));
    EXPECT_FALSE(EndpointResolver::isKnown("kimsufi-us"));
}

TEST(EndpointResolver, KnownEndpointsAllResolve) {
    const auto& endpoints = EndpointResolver::knownEndpoints();
    EXPECT_EQ(endpoints.size(), 7u);
    for (const auto& [endpoint, host] : endpoints) {
        EXPECT_EQ(EndpointResolver::resolve(endpoint), host) << endpoint;
        EXPECT_NE(host, EndpointResolver::DEFAULT_HOST);
    }
}
