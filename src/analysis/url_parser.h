#pragma once
#include <string>
#include <vector>

enum class HostKind {
    Name,       // DNS name, e.g. mail.example.co.uk
    Ipv4,       // dotted/hex/octal IPv4 literal
    Ipv6,       // bracketed IPv6 literal
    Invalid     // empty or not a well-formed host
};

struct ParsedUrl {
    std::string scheme;         // lowercased, empty when none given
    std::string host;           // lowercased, no port/userinfo/trailing dot
    std::string port;
    std::string pathAndQuery;   // everything after the authority
    HostKind hostKind = HostKind::Invalid;

    std::vector<std::string> labels;    // host split on '.', Name hosts only
    std::string tld;                    // last label, Name hosts only
    std::string registrableDomain;      // public suffix + one label
    int subdomainLabels = 0;            // labels left of the registrable domain
};

// Never throws; anything it cannot make sense of yields HostKind::Invalid.
ParsedUrl parseUrl(const std::string& url);

bool isIpv4Literal(const std::string& host);
