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
#pragma once
/**
 * ============================================================================
 * PhishGuard - URL PARSER
 * ============================================================================
 *
 * @file URLParser.hpp
 * @brief Structural URL parsing and domain splitting for feature extraction.
 *
 * Parsing follows the shape of a browser URL parser for http/https input:
 * - a missing "http://" or "https://" prefix is inferred as "http://"
 * - host is lowercased, userinfo is stripped, default ports are dropped
 * - path dot-segments are resolved, an empty path becomes "/"
 *
 * It is deliberately not a full WHATWG implementation: no IDNA/punycode
 * processing and no IPv4 number-form normalization. Unparseable input
 * yields std::nullopt; callers treat that as "cannot analyze".
 *
 * Domain splitting is best-effort (a handful of known two-level suffixes
 * such as co.uk), not a public-suffix-list lookup.
 * ============================================================================
 */

#include <optional>
#include <string>
#include <string_view>

#include "../Core/ErrorCodes.hpp"

namespace PhishGuard {
namespace URL {

/**
 * @brief Components of a parsed URL. Immutable once produced.
 */
struct ParsedURL {
    std::string protocol;   ///< "http" or "https"
    std::string hostname;   ///< Lowercased host (IPv6 literals keep their brackets)
    std::string port;       ///< Empty when absent or default
    std::string path;       ///< Always starts with '/'
    std::string query;      ///< Without the leading '?'
    std::string fragment;   ///< Without the leading '#'
    std::string full;       ///< Re-serialized URL
};

/**
 * @brief Registrable-domain split of a hostname.
 */
struct DomainParts {
    std::string subdomain;
    std::string domain;
    std::string suffix;
    std::string fullDomain;
    std::string registeredDomain;   ///< domain + "." + suffix, or the hostname
};

class URLParser final {
public:
    URLParser() = delete;

    /**
     * @brief Parse a raw URL string.
     * @param url Arbitrary input; a scheme is inferred when missing
     * @param err Optional error output (ParseError)
     * @return Parsed components, or std::nullopt when the input is unparseable
     */
    [[nodiscard]] static std::optional<ParsedURL> Parse(std::string_view url, Core::Error* err = nullptr);

    /**
     * @brief Split a hostname into subdomain / domain / suffix.
     */
    [[nodiscard]] static DomainParts ParseDomain(std::string_view hostname);

    /**
     * @brief IPv4 dotted-quad check (^\d{1,3}(\.\d{1,3}){3}$, octet range not enforced).
     */
    [[nodiscard]] static bool IsIPv4(std::string_view hostname);

    /**
     * @brief IPv4 dotted quad, or a loose IPv6 literal (only hex digits and
     *        colons, optionally bracketed). The IPv6 half is approximate:
     *        "cafe" or "::" style strings also match.
     */
    [[nodiscard]] static bool IsIPAddress(std::string_view hostname);

    /// @brief Literal "https://" prefix check on the raw string
    [[nodiscard]] static bool IsHTTPS(std::string_view url) noexcept;

    /**
     * @brief Last two labels of a hostname, or the hostname itself when it
     *        has fewer than two labels.
     */
    [[nodiscard]] static std::string GetRegistrableDomain(std::string_view hostname);

    /**
     * @brief Cache key form: protocol://hostname + path + ?query. Fragment
     *        and port are dropped. Unparseable input is returned unchanged.
     */
    [[nodiscard]] static std::string NormalizeForCache(std::string_view url);
};

}  // namespace URL
}  // namespace PhishGuard
