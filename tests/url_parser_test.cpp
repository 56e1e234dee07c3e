#include <gtest/gtest.h>
#include "analysis/url_parser.h"

TEST(UrlParserTest, SplitsSchemeAuthorityAndPath) {
    ParsedUrl p = parseUrl("HTTPS://user:pw@Mail.Example.CO.UK:8443/path?q=1");

    EXPECT_EQ(p.scheme, "https");
    EXPECT_EQ(p.host, "mail.example.co.uk");
    EXPECT_EQ(p.port, "8443");
    EXPECT_EQ(p.pathAndQuery, "/path?q=1");
    EXPECT_EQ(p.hostKind, HostKind::Name);
    EXPECT_EQ(p.tld, "uk");
    EXPECT_EQ(p.registrableDomain, "example.co.uk");
    EXPECT_EQ(p.subdomainLabels, 1);
}

TEST(UrlParserTest, SchemeIsOptional) {
    ParsedUrl p = parseUrl("example.com/login");

    EXPECT_TRUE(p.scheme.empty());
    EXPECT_EQ(p.host, "example.com");
    EXPECT_EQ(p.hostKind, HostKind::Name);
    EXPECT_EQ(p.registrableDomain, "example.com");
    EXPECT_EQ(p.subdomainLabels, 0);
}

TEST(UrlParserTest, CountsSubdomainLabels) {
    ParsedUrl p = parseUrl("https://a.b.c.example.com/");
    EXPECT_EQ(p.registrableDomain, "example.com");
    EXPECT_EQ(p.subdomainLabels, 3);

    ParsedUrl trailingDot = parseUrl("https://example.com./");
    EXPECT_EQ(trailingDot.host, "example.com");
    EXPECT_EQ(trailingDot.subdomainLabels, 0);
}

TEST(UrlParserTest, BarePublicSuffixHasNoRegistrableDomain) {
    ParsedUrl p = parseUrl("https://co.uk");
    EXPECT_EQ(p.hostKind, HostKind::Name);
    EXPECT_TRUE(p.registrableDomain.empty());

    ParsedUrl single = parseUrl("http://localhost:8080/");
    EXPECT_EQ(single.hostKind, HostKind::Name);
    EXPECT_EQ(single.tld, "localhost");
    EXPECT_TRUE(single.registrableDomain.empty());
}

TEST(UrlParserTest, RecognisesAddressLiterals) {
    EXPECT_EQ(parseUrl("http://192.168.1.1/pay").hostKind, HostKind::Ipv4);
    EXPECT_EQ(parseUrl("http://0x7f.0.0.1/").hostKind, HostKind::Ipv4);

    ParsedUrl v6 = parseUrl("http://[::1]:8080/admin");
    EXPECT_EQ(v6.hostKind, HostKind::Ipv6);
    EXPECT_EQ(v6.host, "::1");
    EXPECT_EQ(v6.port, "8080");
}

TEST(UrlParserTest, MalformedHostsAreInvalid) {
    EXPECT_EQ(parseUrl("").hostKind, HostKind::Invalid);
    EXPECT_EQ(parseUrl("not a url").hostKind, HostKind::Invalid);
    EXPECT_EQ(parseUrl("http://").hostKind, HostKind::Invalid);
    EXPECT_EQ(parseUrl("http://[::1").hostKind, HostKind::Invalid);
    EXPECT_EQ(parseUrl("http://exa mple.com/").hostKind, HostKind::Invalid);
    EXPECT_EQ(parseUrl("http://bad..dots.com/").hostKind, HostKind::Invalid);
}

TEST(UrlParserTest, Ipv4LiteralDetection) {
    EXPECT_TRUE(isIpv4Literal("1.2.3.4"));
    EXPECT_TRUE(isIpv4Literal("3232235777"));
    EXPECT_FALSE(isIpv4Literal("1.2.3.4.5"));
    EXPECT_FALSE(isIpv4Literal("1..2"));
    EXPECT_FALSE(isIpv4Literal("example.com"));
    EXPECT_FALSE(isIpv4Literal(""));
}
