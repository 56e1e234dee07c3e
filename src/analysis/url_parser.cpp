#include "analysis/url_parser.h"

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace {

// Multi-label public suffixes that are common in the wild. Not the full
// public suffix list: anything missing here falls back to "last two labels".
const std::unordered_set<std::string>& multiLabelSuffixes() {
    static const std::unordered_set<std::string> suffixes = {
        "co.uk", "org.uk", "ac.uk", "gov.uk", "me.uk", "ltd.uk", "plc.uk", "net.uk",
        "com.au", "net.au", "org.au", "edu.au", "gov.au",
        "co.nz", "org.nz", "net.nz",
        "co.jp", "ne.jp", "or.jp", "ac.jp", "go.jp",
        "co.in", "net.in", "org.in", "gov.in",
        "com.br", "net.br", "org.br", "gov.br",
        "com.cn", "net.cn", "org.cn", "gov.cn",
        "com.mx", "co.za", "com.tr", "com.sg", "com.hk",
        "co.kr", "or.kr", "com.tw", "com.ar", "co.id",
        "com.my", "com.ph", "com.vn", "com.ua", "co.il",
        "com.pk", "com.ng", "com.eg", "com.sa"
    };
    return suffixes;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

bool isSchemeToken(const std::string& s) {
    if (s.empty() || !std::isalpha(static_cast<unsigned char>(s[0])))
        return false;
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '+' || c == '-' || c == '.';
    });
}

bool allDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
        [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::vector<std::string> split(const std::string& s, char d) {
    std::vector<std::string> out;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(d, start);
        if (pos == std::string::npos) {
            out.push_back(s.substr(start));
            break;
        }
        out.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return out;
}

bool isIpv6Literal(const std::string& inner) {
    if (inner.find(':') == std::string::npos)
        return false;
    return std::all_of(inner.begin(), inner.end(), [](unsigned char c) {
        return std::isxdigit(c) || c == ':' || c == '.';
    });
}

bool isValidHostName(const std::vector<std::string>& labels) {
    for (const auto& label : labels) {
        if (label.empty() || label.size() > 63)
            return false;
        for (unsigned char c : label) {
            if (!(std::isalnum(c) || c == '-' || c == '_'))
                return false;
        }
    }
    return true;
}

void resolveRegistrableDomain(ParsedUrl& p) {
    const auto& labels = p.labels;
    const size_t n = labels.size();
    p.tld = labels.back();

    if (n < 2) {
        p.registrableDomain.clear();
        p.subdomainLabels = 0;
        return;
    }

    std::string lastTwo = labels[n - 2] + "." + labels[n - 1];
    size_t registrableLabels = 2;
    if (multiLabelSuffixes().count(lastTwo)) {
        if (n == 2) {
            // The host is a bare public suffix such as "co.uk"
            p.registrableDomain.clear();
            p.subdomainLabels = 0;
            return;
        }
        registrableLabels = 3;
    }

    std::string domain;
    for (size_t i = n - registrableLabels; i < n; ++i) {
        if (!domain.empty()) domain += '.';
        domain += labels[i];
    }
    p.registrableDomain = domain;
    p.subdomainLabels = static_cast<int>(n - registrableLabels);
}

} // namespace

bool isIpv4Literal(const std::string& host) {
    if (host.empty())
        return false;

    auto parts = split(host, '.');
    if (parts.size() > 4)
        return false;

    for (const auto& part : parts) {
        if (part.empty())
            return false;
        if (part.size() > 2 && part[0] == '0' && (part[1] == 'x' || part[1] == 'X')) {
            bool hex = std::all_of(part.begin() + 2, part.end(),
                [](unsigned char c) { return std::isxdigit(c) != 0; });
            if (!hex) return false;
        } else if (!allDigits(part)) {
            return false;
        }
    }
    return true;
}

ParsedUrl parseUrl(const std::string& url) {
    ParsedUrl p;
    std::string rest = trim(url);

    size_t sep = rest.find("://");
    if (sep != std::string::npos && isSchemeToken(rest.substr(0, sep))) {
        p.scheme = toLower(rest.substr(0, sep));
        rest = rest.substr(sep + 3);
    } else if (rest.compare(0, 2, "//") == 0) {
        rest = rest.substr(2);
    }

    size_t authEnd = rest.find_first_of("/?#\\");
    std::string authority = rest.substr(0, authEnd);
    p.pathAndQuery = authEnd == std::string::npos ? "" : rest.substr(authEnd);

    size_t at = authority.rfind('@');
    if (at != std::string::npos)
        authority = authority.substr(at + 1);

    std::string host;
    if (!authority.empty() && authority[0] == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos)
            return p;
        std::string inner = authority.substr(1, close - 1);
        std::string tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail[0] != ':' || !(tail.size() == 1 || allDigits(tail.substr(1))))
                return p;
            p.port = tail.substr(1);
        }
        p.host = toLower(inner);
        p.hostKind = isIpv6Literal(inner) ? HostKind::Ipv6 : HostKind::Invalid;
        return p;
    }

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        std::string port = authority.substr(colon + 1);
        if (port.empty() || allDigits(port)) {
            p.port = port;
            authority = authority.substr(0, colon);
        }
    }

    host = toLower(authority);
    if (!host.empty() && host.back() == '.')
        host.pop_back();
    p.host = host;

    if (host.empty())
        return p;

    if (isIpv4Literal(host)) {
        p.hostKind = HostKind::Ipv4;
        return p;
    }

    auto labels = split(host, '.');
    if (!isValidHostName(labels))
        return p;

    p.labels = std::move(labels);
    p.hostKind = HostKind::Name;
    resolveRegistrableDomain(p);
    return p;
}
