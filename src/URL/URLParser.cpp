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
#include "URLParser.hpp"

#include <array>
#include <regex>
#include <vector>

#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

namespace PhishGuard {
namespace URL {

using namespace Utils;

namespace {

constexpr std::string_view kHttp = "http://";
constexpr std::string_view kHttps = "https://";
constexpr size_t kMaxPort = 65535;

// Second-level labels that combine with a two-letter country code (co.uk, com.au)
constexpr std::array<std::string_view, 8> kSecondLevelLabels = {
    "com", "org", "net", "edu", "gov", "mil", "io", "co"
};

bool IsForbiddenHostChar(char c) noexcept {
    switch (c) {
        case ' ': case '#': case '%': case '/': case ':': case '<': case '>':
        case '?': case '@': case '[': case '\\': case ']': case '^': case '|':
            return true;
        default:
            return false;
    }
}

bool NeedsPercentEncoding(char c) noexcept {
    return c == ' ' || c == '"' || c == '<' || c == '>' || c == '`';
}

std::string PercentEncodeUnsafe(std::string_view s) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (NeedsPercentEncoding(c)) {
            const auto b = static_cast<unsigned char>(c);
            out.push_back('%');
            out.push_back(kHex[b >> 4]);
            out.push_back(kHex[b & 0x0F]);
        } else {
            out.push_back(c);
        }
    }
    return out;
}

// Resolve "." and ".." segments the way a browser does for special schemes.
std::string RemoveDotSegments(std::string_view path) {
    std::vector<std::string> output;
    const auto segments = StringUtils::Split(path.substr(1), '/');

    for (size_t i = 0; i < segments.size(); ++i) {
        const std::string& seg = segments[i];
        const bool last = (i + 1 == segments.size());
        if (seg == ".") {
            if (last) output.emplace_back();
        } else if (seg == "..") {
            if (!output.empty()) output.pop_back();
            if (last) output.emplace_back();
        } else {
            output.push_back(seg);
        }
    }

    return "/" + StringUtils::Join(output, "/");
}

bool ParseHostAndPort(std::string_view authority, const std::string& protocol,
                      ParsedURL& out, Core::Error* err) {
    std::string_view hostPart = authority;
    std::string_view portPart;
    bool hasPort = false;

    if (!authority.empty() && authority.front() == '[') {
        const size_t close = authority.find(']');
        if (close == std::string_view::npos) {
            Core::SetError(err, Core::ErrorKind::ParseError, "Unterminated IPv6 literal");
            return false;
        }
        hostPart = authority.substr(0, close + 1);
        const std::string_view rest = authority.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') {
                Core::SetError(err, Core::ErrorKind::ParseError, "Unexpected data after IPv6 literal");
                return false;
            }
            portPart = rest.substr(1);
            hasPort = true;
        }

        const std::string_view inner = hostPart.substr(1, hostPart.size() - 2);
        if (inner.empty()) {
            Core::SetError(err, Core::ErrorKind::ParseError, "Empty IPv6 literal");
            return false;
        }
        for (char c : inner) {
            if (!StringUtils::IsAsciiHexDigit(c) && c != ':' && c != '.') {
                Core::SetError(err, Core::ErrorKind::ParseError, "Invalid character in IPv6 literal");
                return false;
            }
        }
    } else {
        const size_t colon = authority.find(':');
        if (colon != std::string_view::npos) {
            hostPart = authority.substr(0, colon);
            portPart = authority.substr(colon + 1);
            hasPort = true;
        }
        for (char c : hostPart) {
            if (IsForbiddenHostChar(c)) {
                Core::SetError(err, Core::ErrorKind::ParseError,
                    std::string("Forbidden host code point '") + c + "'");
                return false;
            }
        }
    }

    if (hostPart.empty()) {
        Core::SetError(err, Core::ErrorKind::ParseError, "Empty host");
        return false;
    }

    out.hostname = StringUtils::ToLowerAscii(hostPart);

    // An empty port ("host:") is allowed and means "no port"
    if (hasPort && !portPart.empty()) {
        size_t value = 0;
        for (char c : portPart) {
            if (!StringUtils::IsAsciiDigit(c)) {
                Core::SetError(err, Core::ErrorKind::ParseError, "Non-numeric port");
                return false;
            }
            value = value * 10 + static_cast<size_t>(c - '0');
            if (value > kMaxPort) {
                Core::SetError(err, Core::ErrorKind::ParseError, "Port out of range");
                return false;
            }
        }
        const bool isDefault = (protocol == "http" && value == 80) || (protocol == "https" && value == 443);
        if (!isDefault) {
            out.port = std::to_string(value);
        }
    }
    return true;
}

}  // namespace

std::optional<ParsedURL> URLParser::Parse(std::string_view url, Core::Error* err) {
    const std::string_view trimmed = StringUtils::TrimAscii(url);
    if (trimmed.empty()) {
        Core::SetError(err, Core::ErrorKind::ParseError, "Empty URL");
        return std::nullopt;
    }

    for (char c : trimmed) {
        const auto b = static_cast<unsigned char>(c);
        if (b < 0x20 || b == 0x7F) {
            Core::SetError(err, Core::ErrorKind::ParseError, "Control character in URL");
            return std::nullopt;
        }
    }

    std::string input;
    if (!StringUtils::StartsWith(trimmed, kHttp) && !StringUtils::StartsWith(trimmed, kHttps)) {
        input.reserve(kHttp.size() + trimmed.size());
        input.append(kHttp);
    }
    input.append(trimmed);

    ParsedURL parsed;
    const size_t schemeEnd = input.find("://");
    parsed.protocol = input.substr(0, schemeEnd);

    const std::string_view rest = std::string_view(input).substr(schemeEnd + 3);
    const size_t authorityEnd = rest.find_first_of("/\\?#");
    std::string_view authority = rest.substr(0, authorityEnd);
    std::string_view tail = (authorityEnd == std::string_view::npos)
        ? std::string_view() : rest.substr(authorityEnd);

    const size_t at = authority.rfind('@');
    if (at != std::string_view::npos) {
        authority = authority.substr(at + 1);
    }

    if (!ParseHostAndPort(authority, parsed.protocol, parsed, err)) {
        return std::nullopt;
    }

    const size_t hash = tail.find('#');
    if (hash != std::string_view::npos) {
        parsed.fragment = std::string(tail.substr(hash + 1));
        tail = tail.substr(0, hash);
    }

    const size_t question = tail.find('?');
    std::string path(tail.substr(0, question));
    if (question != std::string_view::npos) {
        parsed.query = PercentEncodeUnsafe(tail.substr(question + 1));
    }

    for (auto& c : path) {
        if (c == '\\') c = '/';
    }
    if (path.empty()) {
        path = "/";
    }
    parsed.path = PercentEncodeUnsafe(RemoveDotSegments(path));

    parsed.full = parsed.protocol + "://" + parsed.hostname;
    if (!parsed.port.empty()) {
        parsed.full += ":" + parsed.port;
    }
    parsed.full += parsed.path;
    if (!parsed.query.empty()) {
        parsed.full += "?" + parsed.query;
    }
    if (!parsed.fragment.empty()) {
        parsed.full += "#" + parsed.fragment;
    }

    return parsed;
}

DomainParts URLParser::ParseDomain(std::string_view hostname) {
    DomainParts parts;
    parts.fullDomain = std::string(hostname);

    const auto labels = StringUtils::Split(hostname, '.');
    const size_t n = labels.size();

    if (n >= 2) {
        const std::string& last = labels[n - 1];
        const std::string& secondLast = labels[n - 2];

        bool twoLevel = false;
        if (n >= 3 && last.size() == 2) {
            for (auto label : kSecondLevelLabels) {
                if (secondLast == label) {
                    twoLevel = true;
                    break;
                }
            }
        }

        if (twoLevel) {
            parts.suffix = secondLast + "." + last;
            parts.domain = labels[n - 3];
            if (n > 3) {
                parts.subdomain = StringUtils::Join(std::vector<std::string>(labels.begin(), labels.end() - 3), ".");
            }
        } else {
            parts.suffix = last;
            parts.domain = secondLast;
            if (n > 2) {
                parts.subdomain = StringUtils::Join(std::vector<std::string>(labels.begin(), labels.end() - 2), ".");
            }
        }
    } else if (n == 1) {
        parts.domain = labels[0];
    }

    parts.registeredDomain = (!parts.domain.empty() && !parts.suffix.empty())
        ? parts.domain + "." + parts.suffix
        : parts.fullDomain;
    return parts;
}

bool URLParser::IsIPv4(std::string_view hostname) {
    static const std::regex ipv4Regex(R"(^\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}$)");
    return std::regex_match(hostname.begin(), hostname.end(), ipv4Regex);
}

bool URLParser::IsIPAddress(std::string_view hostname) {
    if (IsIPv4(hostname)) return true;

    std::string_view host = hostname;
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    if (host.empty()) return false;

    for (char c : host) {
        if (!StringUtils::IsAsciiHexDigit(c) && c != ':') return false;
    }
    return true;
}

bool URLParser::IsHTTPS(std::string_view url) noexcept {
    return StringUtils::StartsWith(url, kHttps);
}

std::string URLParser::GetRegistrableDomain(std::string_view hostname) {
    const auto labels = StringUtils::Split(hostname, '.');
    if (labels.size() >= 2) {
        return labels[labels.size() - 2] + "." + labels[labels.size() - 1];
    }
    return std::string(hostname);
}

std::string URLParser::NormalizeForCache(std::string_view url) {
    const auto parsed = Parse(url);
    if (!parsed) {
        PG_LOG_DEBUG("URLParser", "Cache key falls back to raw input");
        return std::string(url);
    }

    std::string key = parsed->protocol + "://" + parsed->hostname + parsed->path;
    if (!parsed->query.empty()) {
        key += "?" + parsed->query;
    }
    return key;
}

}  // namespace URL
}  // namespace PhishGuard
