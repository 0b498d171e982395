/*
 * PhishGuard - Offline Phishing URL Classification Engine
 * Copyright (C) 2026 PhishGuard Contributors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include <gtest/gtest.h>

#include "URL/URLParser.hpp"

using namespace PhishGuard;
using URL::URLParser;

TEST(URLParserTest, InfersHttpScheme) {
    const auto p = URLParser::Parse("example.com");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->protocol, "http");
    EXPECT_EQ(p->hostname, "example.com");
    EXPECT_EQ(p->path, "/");
    EXPECT_EQ(p->full, "http://example.com/");
}

TEST(URLParserTest, SchemePrefixIsCaseSensitive) {
    // "HTTPS://" is not recognized, so "http://" is prepended and
    // "HTTPS:" becomes a host with an empty port.
    const auto p = URLParser::Parse("HTTPS://example.com");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->protocol, "http");
    EXPECT_EQ(p->hostname, "https");
    EXPECT_EQ(p->path, "//example.com");
}

TEST(URLParserTest, ComponentsAreSplit) {
    const auto p = URLParser::Parse("https://User:Pw@WWW.Example.COM:8443/a/b.html?x=1&y=2#frag");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->protocol, "https");
    EXPECT_EQ(p->hostname, "www.example.com");
    EXPECT_EQ(p->port, "8443");
    EXPECT_EQ(p->path, "/a/b.html");
    EXPECT_EQ(p->query, "x=1&y=2");
    EXPECT_EQ(p->fragment, "frag");
    EXPECT_EQ(p->full, "https://www.example.com:8443/a/b.html?x=1&y=2#frag");
}

TEST(URLParserTest, DefaultPortsAreDropped) {
    EXPECT_EQ(URLParser::Parse("http://example.com:80/")->port, "");
    EXPECT_EQ(URLParser::Parse("https://example.com:443/")->port, "");
    EXPECT_EQ(URLParser::Parse("http://example.com:443/")->port, "443");
    EXPECT_EQ(URLParser::Parse("http://example.com:0080/")->port, "");
}

TEST(URLParserTest, WhitespaceIsTrimmed) {
    const auto p = URLParser::Parse("  \thttp://example.com/path \n");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->path, "/path");
}

TEST(URLParserTest, PathNormalization) {
    EXPECT_EQ(URLParser::Parse("http://a.com/x/../y/./z")->path, "/y/z");
    EXPECT_EQ(URLParser::Parse("http://a.com/x/..")->path, "/");
    EXPECT_EQ(URLParser::Parse("http://a.com\\x\\y")->path, "/x/y");
    EXPECT_EQ(URLParser::Parse("http://a.com//double//slash")->path, "//double//slash");
    EXPECT_EQ(URLParser::Parse("http://a.com/a b")->path, "/a%20b");
    EXPECT_EQ(URLParser::Parse("http://a.com?q=1")->path, "/");
}

TEST(URLParserTest, RejectsMalformedInput) {
    Core::Error err;
    EXPECT_FALSE(URLParser::Parse("", &err).has_value());
    EXPECT_EQ(err.kind, Core::ErrorKind::ParseError);

    EXPECT_FALSE(URLParser::Parse("   ").has_value());
    EXPECT_FALSE(URLParser::Parse("http://").has_value());
    EXPECT_FALSE(URLParser::Parse("http:///path").has_value());
    EXPECT_FALSE(URLParser::Parse("http://exa mple.com").has_value());
    EXPECT_FALSE(URLParser::Parse("http://example.com:99999/").has_value());
    EXPECT_FALSE(URLParser::Parse("http://example.com:8o/").has_value());
    EXPECT_FALSE(URLParser::Parse("http://[::1/").has_value());
    EXPECT_FALSE(URLParser::Parse("http://exa\x01mple.com").has_value());
    EXPECT_FALSE(URLParser::Parse("http://ex<ample.com").has_value());
}

TEST(URLParserTest, IPv6Literal) {
    const auto p = URLParser::Parse("http://[2001:db8::1]:8080/x");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->hostname, "[2001:db8::1]");
    EXPECT_EQ(p->port, "8080");
    EXPECT_TRUE(URLParser::IsIPAddress(p->hostname));
}

TEST(URLParserTest, ParseDomainSplitsLabels) {
    auto d = URLParser::ParseDomain("mail.google.com");
    EXPECT_EQ(d.subdomain, "mail");
    EXPECT_EQ(d.domain, "google");
    EXPECT_EQ(d.suffix, "com");
    EXPECT_EQ(d.registeredDomain, "google.com");

    d = URLParser::ParseDomain("a.b.example.co.uk");
    EXPECT_EQ(d.subdomain, "a.b");
    EXPECT_EQ(d.domain, "example");
    EXPECT_EQ(d.suffix, "co.uk");
    EXPECT_EQ(d.registeredDomain, "example.co.uk");

    d = URLParser::ParseDomain("localhost");
    EXPECT_EQ(d.domain, "localhost");
    EXPECT_EQ(d.suffix, "");
    EXPECT_EQ(d.registeredDomain, "localhost");
}

TEST(URLParserTest, IPv4DottedQuad) {
    EXPECT_TRUE(URLParser::IsIPv4("192.168.1.1"));
    EXPECT_TRUE(URLParser::IsIPv4("999.999.999.999"));
    EXPECT_FALSE(URLParser::IsIPv4("1.2.3"));
    EXPECT_FALSE(URLParser::IsIPv4("1.2.3.4.5"));
    EXPECT_FALSE(URLParser::IsIPv4("a.b.c.d"));
}

TEST(URLParserTest, IsIPAddressIsLooseForIPv6) {
    EXPECT_TRUE(URLParser::IsIPAddress("10.0.0.1"));
    EXPECT_TRUE(URLParser::IsIPAddress("::1"));
    EXPECT_TRUE(URLParser::IsIPAddress("cafe"));
    EXPECT_FALSE(URLParser::IsIPAddress("example.com"));
}

TEST(URLParserTest, HttpsAndRegistrableDomain) {
    EXPECT_TRUE(URLParser::IsHTTPS("https://x.com"));
    EXPECT_FALSE(URLParser::IsHTTPS("http://x.com"));
    EXPECT_EQ(URLParser::GetRegistrableDomain("a.b.example.com"), "example.com");
    EXPECT_EQ(URLParser::GetRegistrableDomain("localhost"), "localhost");
}

TEST(URLParserTest, CacheKeyDropsFragmentAndPort) {
    EXPECT_EQ(URLParser::NormalizeForCache("http://Example.com:8080/a?b=1#top"), "http://example.com/a?b=1");
    EXPECT_EQ(URLParser::NormalizeForCache("example.com"), "http://example.com/");
    EXPECT_EQ(URLParser::NormalizeForCache("example.com/a#x"), URLParser::NormalizeForCache("example.com/a#y"));
    EXPECT_EQ(URLParser::NormalizeForCache("http://"), "http://");
}
